/**
 * @file ContributionAnalyzer.h
 * @brief Per-link share of the RSS variance.
 */
#ifndef STACKCAD_CORE_TOLERANCE_CONTRIBUTIONANALYZER_H
#define STACKCAD_CORE_TOLERANCE_CONTRIBUTIONANALYZER_H

#include "ToleranceTypes.h"

#include <vector>

namespace stackcad::core::tolerance {

class ContributionAnalyzer {
public:
    /**
     * @brief Attribute variance to each link, preserving input order.
     * @param variances Per-link variances from RssAnalyzer (same length as links).
     */
    static std::vector<LinkContribution> analyze(const std::vector<ChainLink>& links,
                                                 const std::vector<double>& variances);
};

} // namespace stackcad::core::tolerance

#endif // STACKCAD_CORE_TOLERANCE_CONTRIBUTIONANALYZER_H
