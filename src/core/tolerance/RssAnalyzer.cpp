#include "RssAnalyzer.h"

#include <cmath>
#include <numeric>

namespace stackcad::core::tolerance {

double RssAnalyzer::linkVariance(const ChainLink& link) {
    const double totalTol = link.totalTolerance();

    switch (link.distribution) {
        case DistributionType::Uniform:
            return totalTol * totalTol / 12.0;
        case DistributionType::Triangular:
            return totalTol * totalTol / 24.0;
        case DistributionType::Normal:
        default: {
            const double halfTol = totalTol / 2.0;
            const double stdDev = halfTol / link.sigma;
            return stdDev * stdDev;
        }
    }
}

RssAnalyzer::Analysis RssAnalyzer::analyze(const std::vector<ChainLink>& links) {
    Analysis analysis;
    analysis.variances.reserve(links.size());

    for (const auto& link : links) {
        analysis.variances.push_back(linkVariance(link));
    }

    const double nominal = totalNominal(links);
    const double totalVariance = std::accumulate(analysis.variances.begin(),
                                                 analysis.variances.end(), 0.0);
    const double stdDev = std::sqrt(totalVariance);
    const double tolerance = 3.0 * stdDev;

    analysis.result.min = nominal - tolerance;
    analysis.result.max = nominal + tolerance;
    analysis.result.tolerance = tolerance;
    analysis.result.sigma = stdDev;
    // Cp = 1 when the spec band equals the computed 3σ band
    analysis.result.processCapability = 1.0;
    return analysis;
}

} // namespace stackcad::core::tolerance
