/**
 * @file InsightGenerator.h
 * @brief Plain-language observations derived from a ToleranceResult.
 */
#ifndef STACKCAD_CORE_TOLERANCE_INSIGHTGENERATOR_H
#define STACKCAD_CORE_TOLERANCE_INSIGHTGENERATOR_H

#include "ToleranceTypes.h"

#include <string>
#include <vector>

namespace stackcad::core::tolerance {

class InsightGenerator {
public:
    /// RSS tightening (percent of worst-case) above which statistical tolerancing is suggested
    static constexpr double kRssSavingsThreshold = 20.0;
    /// Variance share marking a dominant contributor
    static constexpr double kDominantShareThreshold = 40.0;
    static constexpr double kPoorCpk = 1.0;
    static constexpr double kCapableCpk = 1.33;

    /**
     * @brief Derive insights from already computed fields. No side effects.
     */
    static std::vector<std::string> generate(const ToleranceResult& result);
};

} // namespace stackcad::core::tolerance

#endif // STACKCAD_CORE_TOLERANCE_INSIGHTGENERATOR_H
