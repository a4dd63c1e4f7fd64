#include "WorstCaseAnalyzer.h"

namespace stackcad::core::tolerance {

WorstCaseResult WorstCaseAnalyzer::analyze(const std::vector<ChainLink>& links) {
    double totalMin = 0.0;
    double totalMax = 0.0;

    for (const auto& link : links) {
        if (link.direction == ContributionDirection::Positive) {
            totalMin += link.nominal - link.minusTolerance;
            totalMax += link.nominal + link.plusTolerance;
        } else {
            totalMin -= link.nominal + link.plusTolerance;
            totalMax -= link.nominal - link.minusTolerance;
        }
    }

    WorstCaseResult result;
    result.min = totalMin;
    result.max = totalMax;
    result.range = totalMax - totalMin;
    result.tolerance = result.range / 2.0;
    return result;
}

} // namespace stackcad::core::tolerance
