/**
 * @file RandomSource.h
 * @brief Injectable randomness for stochastic analyses.
 *
 * Monte Carlo runs draw every variate through a RandomSource so tests can
 * seed them deterministically while production uses a nondeterministic seed.
 */
#ifndef STACKCAD_CORE_TOLERANCE_RANDOMSOURCE_H
#define STACKCAD_CORE_TOLERANCE_RANDOMSOURCE_H

#include <cstdint>
#include <memory>
#include <optional>
#include <random>

namespace stackcad::core::tolerance {

class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Uniform variate in [0, 1).
     */
    virtual double uniform() = 0;

    /**
     * @brief Independent generator for a worker thread.
     *
     * Forking a seeded source yields a seeded child, so partitioned runs stay
     * reproducible for a fixed seed and worker count.
     */
    virtual std::unique_ptr<RandomSource> fork() = 0;

    /**
     * @brief Standard normal variate via the Box-Muller transform.
     *
     * Each transform yields two independent normals; the second is cached and
     * returned by the next call.
     */
    double standardNormal();

    double uniform(double lo, double hi) { return lo + uniform() * (hi - lo); }
    double normal(double mean, double stdDev) { return mean + standardNormal() * stdDev; }

    /**
     * @brief Symmetric triangular variate over [lo, hi].
     */
    double triangular(double lo, double hi);

private:
    std::optional<double> cachedNormal_;
};

/**
 * @brief Deterministic source on a 64-bit Mersenne Twister.
 */
class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(std::uint64_t seed);

    double uniform() override;
    std::unique_ptr<RandomSource> fork() override;

    using RandomSource::uniform;

private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

/**
 * @brief Source seeded from std::random_device, for production runs.
 */
class SystemRandomSource : public RandomSource {
public:
    SystemRandomSource();

    double uniform() override;
    std::unique_ptr<RandomSource> fork() override;

    using RandomSource::uniform;

private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

} // namespace stackcad::core::tolerance

#endif // STACKCAD_CORE_TOLERANCE_RANDOMSOURCE_H
