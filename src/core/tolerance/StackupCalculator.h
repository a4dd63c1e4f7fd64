/**
 * @file StackupCalculator.h
 * @brief Composes the stackup analyzers into one ToleranceResult.
 *
 * The analyzers themselves accept any numbers. The calculator is where link
 * values are validated, so non-finite or negative inputs are reported as
 * issues instead of propagating NaN into results.
 *
 * Usage:
 *   StackupCalculator calculator;
 *   CalculationOptions options;
 *   options.targetSpec = TargetSpec{54.5, 0.25, 0.25};
 *   auto outcome = calculator.calculate(chain.links, options);
 *   if (!outcome.success) {
 *       // Report outcome.issues
 *   }
 */
#ifndef STACKCAD_CORE_TOLERANCE_STACKUPCALCULATOR_H
#define STACKCAD_CORE_TOLERANCE_STACKUPCALCULATOR_H

#include "RandomSource.h"
#include "ToleranceTypes.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stackcad::core::tolerance {

struct CalculationOptions {
    bool runMonteCarlo = true;
    int monteCarloSamples = 10000;
    std::optional<TargetSpec> targetSpec;

    /// Threads for Monte Carlo sample generation
    int workerCount = 1;

    /// Fixed seed for a reproducible Monte Carlo run
    std::optional<std::uint64_t> seed;
};

/**
 * @brief One rejected input value
 */
struct LinkIssue {
    std::string linkId;     // Empty for target spec issues
    std::string field;
    std::string message;
};

struct CalculationOutcome {
    bool success = true;
    std::string errorMessage;
    std::vector<LinkIssue> issues;
    ToleranceResult result;
};

class StackupCalculator {
public:
    /**
     * @brief Calculator drawing from a nondeterministically seeded source.
     */
    StackupCalculator();

    /**
     * @brief Calculator drawing from a caller-owned source.
     */
    explicit StackupCalculator(RandomSource& random);

    ~StackupCalculator();

    StackupCalculator(const StackupCalculator&) = delete;
    StackupCalculator& operator=(const StackupCalculator&) = delete;

    /**
     * @brief Validate, then run every analysis.
     *
     * An empty chain succeeds with zero-valued results.
     */
    CalculationOutcome calculate(const std::vector<ChainLink>& links,
                                 const CalculationOptions& options = {});

    /**
     * @brief Check link and target values without analyzing.
     */
    static std::vector<LinkIssue> validate(const std::vector<ChainLink>& links,
                                           const std::optional<TargetSpec>& targetSpec = std::nullopt);

    /**
     * @brief Compose the analyzers over unvalidated input.
     *
     * meetsSpec and margin are judged against the RSS band, not worst-case.
     */
    static ToleranceResult analyze(const std::vector<ChainLink>& links,
                                   const CalculationOptions& options,
                                   RandomSource& random);

private:
    std::unique_ptr<RandomSource> ownedRandom_;
    RandomSource* random_ = nullptr;
};

} // namespace stackcad::core::tolerance

#endif // STACKCAD_CORE_TOLERANCE_STACKUPCALCULATOR_H
