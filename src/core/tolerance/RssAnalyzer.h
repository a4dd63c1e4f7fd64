/**
 * @file RssAnalyzer.h
 * @brief Root-sum-square statistical stackup.
 *
 * Each link's error is treated as an independent random variable. The
 * combined band is always reported at 3σ, whatever sigma the links state.
 */
#ifndef STACKCAD_CORE_TOLERANCE_RSSANALYZER_H
#define STACKCAD_CORE_TOLERANCE_RSSANALYZER_H

#include "ToleranceTypes.h"

#include <vector>

namespace stackcad::core::tolerance {

class RssAnalyzer {
public:
    struct Analysis {
        RssResult result;
        std::vector<double> variances;  // One per link, input order
    };

    static Analysis analyze(const std::vector<ChainLink>& links);

    /**
     * @brief Variance of a single link under its distribution.
     *
     * uniform: T²/12, triangular (symmetric): T²/24, normal: (T/2/sigma)²,
     * where T = plus + minus.
     */
    static double linkVariance(const ChainLink& link);
};

} // namespace stackcad::core::tolerance

#endif // STACKCAD_CORE_TOLERANCE_RSSANALYZER_H
