/**
 * @file ChainGenerator.h
 * @brief Proposes tolerance chains from detected assembly geometry.
 *
 * Generated chains are starting points for editing: nominals come from
 * bounding boxes and interface proximities, tolerances from defaults.
 */
#ifndef STACKCAD_CORE_ASSEMBLY_CHAINGENERATOR_H
#define STACKCAD_CORE_ASSEMBLY_CHAINGENERATOR_H

#include "AssemblyGraphBuilder.h"
#include "AssemblyTypes.h"
#include "../tolerance/ToleranceTypes.h"

#include <string>
#include <vector>

namespace stackcad::core::assembly {

class AssemblyGraph;

struct ChainGeneratorConfig {
    double fallbackPartLength = 50.0;       // Used when a part has no bounding box
    double partToleranceRatio = 0.001;      // ±0.1 % of the part length
    double fallbackGap = 0.05;              // Used when an interface has zero proximity
    size_t maxInterfaceLinks = 3;
};

class ChainGenerator {
public:
    /**
     * @brief One alternating part-length link per part, then gaps from the
     *        first classified interfaces.
     */
    static tolerance::ToleranceChain generateFromAssembly(
        const std::string& chainId,
        const std::vector<AssemblyPart>& parts,
        const std::vector<MatingInterface>& interfaces,
        const ChainGeneratorConfig& config = {});

    /**
     * @brief Part and gap links interleaved along a found path.
     *
     * Datums are placed on the faces the first and last interfaces touch on
     * the end parts. Unknown path entries are skipped with a warning.
     */
    static tolerance::ToleranceChain generateFromPath(
        const std::string& chainId,
        const AssemblyGraph& graph,
        const AssemblyPath& path,
        const ChainGeneratorConfig& config = {});
};

} // namespace stackcad::core::assembly

#endif // STACKCAD_CORE_ASSEMBLY_CHAINGENERATOR_H
