#include "RandomSource.h"

#include <cmath>
#include <numbers>

namespace stackcad::core::tolerance {

double RandomSource::standardNormal() {
    if (cachedNormal_) {
        const double value = *cachedNormal_;
        cachedNormal_.reset();
        return value;
    }

    // u1 in (0, 1] keeps the logarithm finite
    const double u1 = 1.0 - uniform();
    const double u2 = uniform();
    const double radius = std::sqrt(-2.0 * std::log(u1));
    const double theta = 2.0 * std::numbers::pi_v<double> * u2;

    cachedNormal_ = radius * std::sin(theta);
    return radius * std::cos(theta);
}

double RandomSource::triangular(double lo, double hi) {
    // Sum of two uniforms on half the band is triangular on the full band
    const double half = (hi - lo) / 2.0;
    return lo + uniform() * half + uniform() * half;
}

SeededRandomSource::SeededRandomSource(std::uint64_t seed)
    : engine_(seed)
{
}

double SeededRandomSource::uniform() {
    double value = dist_(engine_);
    // uniform_real_distribution may round up to the upper bound
    if (value >= 1.0) {
        value = std::nextafter(1.0, 0.0);
    }
    return value;
}

std::unique_ptr<RandomSource> SeededRandomSource::fork() {
    return std::make_unique<SeededRandomSource>(engine_());
}

SystemRandomSource::SystemRandomSource() {
    std::random_device device;
    std::seed_seq seq{device(), device(), device(), device()};
    engine_.seed(seq);
}

double SystemRandomSource::uniform() {
    double value = dist_(engine_);
    if (value >= 1.0) {
        value = std::nextafter(1.0, 0.0);
    }
    return value;
}

std::unique_ptr<RandomSource> SystemRandomSource::fork() {
    return std::make_unique<SystemRandomSource>();
}

} // namespace stackcad::core::tolerance
