#include "MonteCarloSimulator.h"

#include <QLoggingCategory>

#include <algorithm>
#include <cmath>
#include <future>
#include <limits>
#include <numeric>

namespace stackcad::core::tolerance {

Q_LOGGING_CATEGORY(logMonteCarlo, "stackcad.core.tolerance.montecarlo")

namespace {

double percentileAt(const std::vector<double>& sorted, double fraction) {
    const std::size_t count = sorted.size();
    auto index = static_cast<std::size_t>(std::floor(static_cast<double>(count) * fraction));
    index = std::min(index, count - 1);
    return sorted[index];
}

} // anonymous namespace

MonteCarloSimulator::MonteCarloSimulator(RandomSource& random)
    : random_(random)
{
}

double MonteCarloSimulator::drawLink(const ChainLink& link, RandomSource& random) {
    const double lo = link.nominal - link.minusTolerance;
    const double hi = link.nominal + link.plusTolerance;

    double sample = link.nominal;
    switch (link.distribution) {
        case DistributionType::Uniform:
            sample = random.uniform(lo, hi);
            break;
        case DistributionType::Triangular:
            sample = random.triangular(lo, hi);
            break;
        case DistributionType::Normal:
        default: {
            // Asymmetric bands shift the mean toward the wider side
            const double mean = link.nominal + (link.plusTolerance - link.minusTolerance) / 2.0;
            const double stdDev = link.totalTolerance() / (2.0 * link.sigma);
            sample = random.normal(mean, stdDev);
            break;
        }
    }
    return link.sign() * sample;
}

void MonteCarloSimulator::generate(const std::vector<ChainLink>& links,
                                   RandomSource& random,
                                   std::vector<double>& out,
                                   std::size_t begin,
                                   std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) {
        double total = 0.0;
        for (const auto& link : links) {
            total += drawLink(link, random);
        }
        out[i] = total;
    }
}

MonteCarloResult MonteCarloSimulator::run(const std::vector<ChainLink>& links,
                                          const MonteCarloConfig& config) {
    const std::size_t sampleCount = config.samples > 0 ? static_cast<std::size_t>(config.samples) : 0;
    std::vector<double> samples(sampleCount, 0.0);

    const std::size_t workers = std::clamp<std::size_t>(
        config.workerCount > 0 ? static_cast<std::size_t>(config.workerCount) : 1,
        1,
        std::max<std::size_t>(sampleCount, 1));

    qCDebug(logMonteCarlo) << "run:start"
                           << "links=" << links.size()
                           << "samples=" << sampleCount
                           << "workers=" << workers;

    if (workers == 1) {
        generate(links, random_, samples, 0, sampleCount);
    } else {
        // Fork every worker's generator up front, in order, for reproducibility
        std::vector<std::unique_ptr<RandomSource>> sources;
        sources.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            sources.push_back(random_.fork());
        }

        const std::size_t chunk = sampleCount / workers;
        const std::size_t remainder = sampleCount % workers;

        std::vector<std::future<void>> tasks;
        tasks.reserve(workers);
        std::size_t begin = 0;
        for (std::size_t w = 0; w < workers; ++w) {
            const std::size_t end = begin + chunk + (w < remainder ? 1 : 0);
            RandomSource* source = sources[w].get();
            tasks.push_back(std::async(std::launch::async, [&links, source, &samples, begin, end]() {
                generate(links, *source, samples, begin, end);
            }));
            begin = end;
        }
        for (auto& task : tasks) {
            task.get();
        }
    }

    MonteCarloResult result = summarize(std::move(samples), config.targetSpec, config.histogramBins);
    qCDebug(logMonteCarlo) << "run:done"
                           << "mean=" << result.mean
                           << "stdDev=" << result.stdDev
                           << "cpk=" << result.cpk;
    return result;
}

MonteCarloResult MonteCarloSimulator::summarize(std::vector<double> samples,
                                                const std::optional<TargetSpec>& targetSpec,
                                                int histogramBins) {
    MonteCarloResult result;
    result.sampleSize = static_cast<int>(samples.size());
    if (samples.empty()) {
        return result;
    }

    std::sort(samples.begin(), samples.end());

    const double count = static_cast<double>(samples.size());
    const double mean = std::accumulate(samples.begin(), samples.end(), 0.0) / count;
    double sumSquares = 0.0;
    for (double x : samples) {
        sumSquares += (x - mean) * (x - mean);
    }

    result.mean = mean;
    result.stdDev = std::sqrt(sumSquares / count);
    result.min = samples.front();
    result.max = samples.back();

    if (targetSpec) {
        result.cpk = computeCpk(result.mean, result.stdDev, *targetSpec);
    }

    result.percentiles.p0_1 = percentileAt(samples, 0.001);
    result.percentiles.p1 = percentileAt(samples, 0.01);
    result.percentiles.p5 = percentileAt(samples, 0.05);
    result.percentiles.p50 = percentileAt(samples, 0.5);
    result.percentiles.p95 = percentileAt(samples, 0.95);
    result.percentiles.p99 = percentileAt(samples, 0.99);
    result.percentiles.p99_9 = percentileAt(samples, 0.999);

    const int bins = std::max(histogramBins, 1);
    const double binWidth = (result.max - result.min) / bins;
    result.histogram.resize(static_cast<std::size_t>(bins));
    for (int i = 0; i < bins; ++i) {
        auto& bin = result.histogram[static_cast<std::size_t>(i)];
        bin.min = result.min + i * binWidth;
        bin.max = bin.min + binWidth;
    }

    for (double x : samples) {
        int index = bins - 1;
        if (binWidth > 0.0 && x < result.max) {
            index = std::min(static_cast<int>((x - result.min) / binWidth), bins - 1);
        }
        result.histogram[static_cast<std::size_t>(index)].count++;
    }
    for (auto& bin : result.histogram) {
        bin.percentage = 100.0 * bin.count / count;
    }

    return result;
}

double MonteCarloSimulator::computeCpk(double mean, double stdDev, const TargetSpec& spec) {
    const double upper = spec.upperLimit();
    const double lower = spec.lowerLimit();

    if (!(stdDev > 0.0)) {
        if (mean < lower || mean > upper) {
            return -std::numeric_limits<double>::infinity();
        }
        if (mean == lower || mean == upper) {
            return 0.0;
        }
        return std::numeric_limits<double>::infinity();
    }

    const double cpu = (upper - mean) / (3.0 * stdDev);
    const double cpl = (mean - lower) / (3.0 * stdDev);
    return std::min(cpu, cpl);
}

} // namespace stackcad::core::tolerance
