#include "InsightGenerator.h"

#include <QString>

#include <algorithm>
#include <cmath>

namespace stackcad::core::tolerance {

std::vector<std::string> InsightGenerator::generate(const ToleranceResult& result) {
    std::vector<std::string> insights;

    const double wcTol = result.worstCase.tolerance;
    const double rssTol = result.rss.tolerance;
    if (wcTol > 0.0) {
        const double savings = (wcTol - rssTol) / wcTol * 100.0;
        if (savings > kRssSavingsThreshold) {
            insights.push_back(
                QStringLiteral("RSS analysis shows %1% tighter tolerance than worst-case, "
                               "suggesting statistical tolerancing could reduce costs.")
                    .arg(savings, 0, 'f', 0)
                    .toStdString());
        }
    }

    std::vector<LinkContribution> ranked = result.contributions;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const LinkContribution& a, const LinkContribution& b) {
                         return a.percentOfTotal > b.percentOfTotal;
                     });
    if (!ranked.empty() && ranked.front().percentOfTotal > kDominantShareThreshold) {
        insights.push_back(
            QStringLiteral("\"%1\" contributes %2% of total variance - tightening this "
                           "tolerance would have the biggest impact.")
                .arg(QString::fromStdString(ranked.front().linkName))
                .arg(ranked.front().percentOfTotal, 0, 'f', 0)
                .toStdString());
    }

    if (result.monteCarlo) {
        const double cpk = result.monteCarlo->cpk;
        if (std::isinf(cpk) && cpk > 0.0) {
            insights.push_back(
                "Monte Carlo spread is zero and the stackup sits inside the specification limits.");
        } else if (std::isinf(cpk)) {
            insights.push_back(
                "Monte Carlo spread is zero and the stackup sits outside the specification limits.");
        } else if (cpk < kPoorCpk) {
            insights.push_back(
                QStringLiteral("Cpk of %1 is below 1.0, indicating process may not meet "
                               "specifications. Consider tightening tolerances.")
                    .arg(cpk, 0, 'f', 2)
                    .toStdString());
        } else if (cpk >= kCapableCpk) {
            insights.push_back(
                QStringLiteral("Cpk of %1 indicates a capable process with good margin to "
                               "specification limits.")
                    .arg(cpk, 0, 'f', 2)
                    .toStdString());
        }
    }

    if (result.targetSpec && result.meetsSpec.has_value() && !*result.meetsSpec) {
        insights.push_back(
            "Current stackup does NOT meet target specification. Consider relaxing the spec "
            "or tightening component tolerances.");
    }

    return insights;
}

} // namespace stackcad::core::tolerance
