#include "ContributionAnalyzer.h"

#include <algorithm>
#include <numeric>
#include <utility>

namespace stackcad::core::tolerance {

std::vector<LinkContribution> ContributionAnalyzer::analyze(const std::vector<ChainLink>& links,
                                                            const std::vector<double>& variances) {
    const std::size_t count = std::min(links.size(), variances.size());
    const double totalVariance = std::accumulate(variances.begin(),
                                                 variances.begin() + static_cast<std::ptrdiff_t>(count),
                                                 0.0);

    std::vector<LinkContribution> contributions;
    contributions.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        const auto& link = links[i];

        LinkContribution contribution;
        contribution.linkId = link.id;
        contribution.linkName = link.name;
        contribution.nominalContribution = link.sign() * link.nominal;
        contribution.toleranceContribution = link.totalTolerance();
        contribution.varianceContribution = variances[i];
        contribution.percentOfTotal = totalVariance > 0.0
                                          ? 100.0 * variances[i] / totalVariance
                                          : 0.0;
        contributions.push_back(std::move(contribution));
    }

    return contributions;
}

} // namespace stackcad::core::tolerance
