/**
 * @file AssemblyGraphBuilder.h
 * @brief Builds AssemblyGraph instances and answers path and bounds queries.
 */
#ifndef STACKCAD_CORE_ASSEMBLY_ASSEMBLYGRAPHBUILDER_H
#define STACKCAD_CORE_ASSEMBLY_ASSEMBLYGRAPHBUILDER_H

#include "AssemblyGraph.h"
#include "AssemblyTypes.h"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace stackcad::core::assembly {

/**
 * @brief Parts and interfaces traversed between two parts
 */
struct AssemblyPath {
    std::vector<std::string> parts;         // start ... end
    std::vector<std::string> interfaces;    // one per hop, parts.size() - 1 entries
};

struct GraphBuildOptions {
    /// First hue of the golden-ratio color walk, in [0, 1)
    double startHue = 0.0;
};

class AssemblyGraphBuilder {
public:
    /**
     * @brief Build a graph from detected geometry, replacing nothing incrementally.
     *
     * Parts keep input order. Missing face global ids, bounding boxes (unit box)
     * and colors are filled in. Adjacency is symmetric and deduplicated.
     * Interfaces naming a part that is not in parts are dropped.
     */
    static AssemblyGraph build(const std::vector<AssemblyPart>& parts,
                               const std::vector<MatingInterface>& interfaces,
                               const GraphBuildOptions& options = {});

    /**
     * @brief Shortest unweighted path by breadth-first search.
     *
     * Ties between equally short paths go to the neighbor inserted first.
     * Each hop records the first interface (insertion order) joining its parts.
     * @return std::nullopt if the parts are not connected
     */
    static std::optional<AssemblyPath> findPath(const AssemblyGraph& graph,
                                                const std::string& startPartId,
                                                const std::string& endPartId);

    static const MatingInterface* findInterfaceBetween(const AssemblyGraph& graph,
                                                       const std::string& partIdA,
                                                       const std::string& partIdB);

    static std::vector<const MatingInterface*> getPartInterfaces(const AssemblyGraph& graph,
                                                                 const std::string& partId);

    static bool isJunctionPart(const AssemblyGraph& graph, const std::string& partId);

    static std::vector<const AssemblyPart*> getJunctionParts(const AssemblyGraph& graph);

    /**
     * @brief Exact world-space AABB from every part's eight transformed corners.
     *
     * Parts without a box count as the unit box. No parts gives [0,0,0]..[1,1,1].
     */
    static BoundingBox calculateAssemblyBounds(const std::vector<AssemblyPart>& parts);

    /**
     * @brief Distinct render colors from a golden-ratio hue walk (HSL s=0.6, l=0.5).
     */
    static std::vector<std::array<double, 3>> generatePartColors(std::size_t count,
                                                                 double startHue = 0.0);
};

} // namespace stackcad::core::assembly

#endif // STACKCAD_CORE_ASSEMBLY_ASSEMBLYGRAPHBUILDER_H
