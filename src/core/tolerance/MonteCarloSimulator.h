/**
 * @file MonteCarloSimulator.h
 * @brief Stochastic sampling of a chain's combined distribution.
 *
 * Sample generation is independent per sample and may be partitioned across
 * worker threads. Percentiles and the histogram need every sample, so they
 * run after the partitions are merged.
 */
#ifndef STACKCAD_CORE_TOLERANCE_MONTECARLOSIMULATOR_H
#define STACKCAD_CORE_TOLERANCE_MONTECARLOSIMULATOR_H

#include "RandomSource.h"
#include "ToleranceTypes.h"

#include <optional>
#include <vector>

namespace stackcad::core::tolerance {

struct MonteCarloConfig {
    /// Number of chain realizations
    int samples = 10000;

    /// Threads used for sample generation (1 = caller's thread)
    int workerCount = 1;

    /// Equal-width bins over [min, max]
    int histogramBins = 50;

    /// Limits for Cpk; Cpk = 1.0 when absent
    std::optional<TargetSpec> targetSpec;
};

class MonteCarloSimulator {
public:
    /**
     * @param random Source for all variates. Must outlive the simulator.
     */
    explicit MonteCarloSimulator(RandomSource& random);

    MonteCarloResult run(const std::vector<ChainLink>& links, const MonteCarloConfig& config);

    /**
     * @brief Empirical statistics over already drawn samples.
     *
     * Sorts the samples, then computes population mean/stdDev, nearest-rank
     * percentiles, the histogram and Cpk.
     */
    static MonteCarloResult summarize(std::vector<double> samples,
                                      const std::optional<TargetSpec>& targetSpec,
                                      int histogramBins = 50);

    /**
     * @brief min(CPU, CPL). Never NaN: a zero spread yields ±infinity, or 0 on a limit.
     */
    static double computeCpk(double mean, double stdDev, const TargetSpec& spec);

    /**
     * @brief One signed draw for a single link.
     */
    static double drawLink(const ChainLink& link, RandomSource& random);

private:
    static void generate(const std::vector<ChainLink>& links,
                         RandomSource& random,
                         std::vector<double>& out,
                         std::size_t begin,
                         std::size_t end);

    RandomSource& random_;
};

} // namespace stackcad::core::tolerance

#endif // STACKCAD_CORE_TOLERANCE_MONTECARLOSIMULATOR_H
