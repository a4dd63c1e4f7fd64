/**
 * @file AssemblyGraph.h
 * @brief Parts, detected interfaces, chains and part adjacency of an assembly.
 *
 * Adjacency is symmetric: adding an interface between A and B records B as a
 * neighbor of A and A as a neighbor of B, once each. All collections keep
 * insertion order, which fixes path tie-breaks and serialization order.
 */
#ifndef STACKCAD_CORE_ASSEMBLY_ASSEMBLYGRAPH_H
#define STACKCAD_CORE_ASSEMBLY_ASSEMBLYGRAPH_H

#include "AssemblyTypes.h"
#include "../tolerance/ToleranceTypes.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace stackcad::core::assembly {

class AssemblyGraph {
public:
    void clear();

    /**
     * @brief Add a part with an empty neighbor list.
     * @return false if a part with the same id exists
     */
    bool addPart(AssemblyPart part);

    /**
     * @brief Add an interface and connect its two parts.
     * @return false if an interface with the same id exists
     */
    bool addInterface(MatingInterface iface);

    /**
     * @brief Add or replace a chain.
     */
    void setChain(tolerance::ToleranceChain chain);
    bool removeChain(const std::string& chainId);

    /**
     * @brief Replace a part's neighbor list verbatim (used when loading).
     */
    void setAdjacency(const std::string& partId, std::vector<std::string> neighbors);

    const AssemblyPart* getPart(const std::string& partId) const;
    const MatingInterface* getInterface(const std::string& interfaceId) const;
    const tolerance::ToleranceChain* getChain(const std::string& chainId) const;
    tolerance::ToleranceChain* getChain(const std::string& chainId);

    const std::vector<std::string>& partIds() const { return partOrder_; }
    // Copies of every part in insertion order.
    std::vector<AssemblyPart> parts() const;
    const std::vector<std::string>& interfaceIds() const { return interfaceOrder_; }
    const std::vector<std::string>& chainIds() const { return chainOrder_; }

    /**
     * @brief Part ids with an adjacency entry, in insertion order.
     */
    const std::vector<std::string>& adjacencyKeys() const { return adjacencyOrder_; }

    /**
     * @brief Neighbors of a part, empty if the part is unknown.
     */
    const std::vector<std::string>& adjacentParts(const std::string& partId) const;

    /**
     * @brief Check that every neighbor relation has its mirror.
     */
    bool isAdjacencySymmetric() const;

    size_t partCount() const { return parts_.size(); }
    size_t interfaceCount() const { return interfaces_.size(); }
    size_t chainCount() const { return chains_.size(); }

private:
    void connect(const std::string& from, const std::string& to);
    std::vector<std::string>& adjacencyEntry(const std::string& partId);

    std::unordered_map<std::string, AssemblyPart> parts_;
    std::vector<std::string> partOrder_;

    std::unordered_map<std::string, MatingInterface> interfaces_;
    std::vector<std::string> interfaceOrder_;

    std::unordered_map<std::string, tolerance::ToleranceChain> chains_;
    std::vector<std::string> chainOrder_;

    std::unordered_map<std::string, std::vector<std::string>> adjacency_;
    std::vector<std::string> adjacencyOrder_;
};

} // namespace stackcad::core::assembly

#endif // STACKCAD_CORE_ASSEMBLY_ASSEMBLYGRAPH_H
