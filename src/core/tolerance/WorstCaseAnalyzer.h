/**
 * @file WorstCaseAnalyzer.h
 * @brief Deterministic min/max accumulation over a tolerance chain.
 */
#ifndef STACKCAD_CORE_TOLERANCE_WORSTCASEANALYZER_H
#define STACKCAD_CORE_TOLERANCE_WORSTCASEANALYZER_H

#include "ToleranceTypes.h"

#include <vector>

namespace stackcad::core::tolerance {

class WorstCaseAnalyzer {
public:
    /**
     * @brief Interval sum of every link at its extreme values.
     *
     * A negative link subtracts its largest value from the total minimum and
     * its smallest value from the total maximum.
     * @return {0,0,0,0} for an empty chain.
     */
    static WorstCaseResult analyze(const std::vector<ChainLink>& links);
};

} // namespace stackcad::core::tolerance

#endif // STACKCAD_CORE_TOLERANCE_WORSTCASEANALYZER_H
