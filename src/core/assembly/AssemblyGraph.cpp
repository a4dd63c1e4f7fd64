#include "AssemblyGraph.h"

#include <algorithm>

namespace stackcad::core::assembly {

void AssemblyGraph::clear() {
    parts_.clear();
    partOrder_.clear();
    interfaces_.clear();
    interfaceOrder_.clear();
    chains_.clear();
    chainOrder_.clear();
    adjacency_.clear();
    adjacencyOrder_.clear();
}

bool AssemblyGraph::addPart(AssemblyPart part) {
    if (parts_.count(part.id) > 0) {
        return false;
    }
    const std::string id = part.id;
    parts_.emplace(id, std::move(part));
    partOrder_.push_back(id);
    adjacencyEntry(id);
    return true;
}

bool AssemblyGraph::addInterface(MatingInterface iface) {
    if (interfaces_.count(iface.id) > 0) {
        return false;
    }
    const std::string id = iface.id;
    const std::string partA = iface.partA.partId;
    const std::string partB = iface.partB.partId;

    interfaces_.emplace(id, std::move(iface));
    interfaceOrder_.push_back(id);

    connect(partA, partB);
    connect(partB, partA);
    return true;
}

void AssemblyGraph::setChain(tolerance::ToleranceChain chain) {
    auto it = chains_.find(chain.id);
    if (it != chains_.end()) {
        it->second = std::move(chain);
        return;
    }
    const std::string id = chain.id;
    chains_.emplace(id, std::move(chain));
    chainOrder_.push_back(id);
}

bool AssemblyGraph::removeChain(const std::string& chainId) {
    if (chains_.erase(chainId) == 0) {
        return false;
    }
    chainOrder_.erase(std::remove(chainOrder_.begin(), chainOrder_.end(), chainId), chainOrder_.end());
    return true;
}

void AssemblyGraph::setAdjacency(const std::string& partId, std::vector<std::string> neighbors) {
    adjacencyEntry(partId) = std::move(neighbors);
}

const AssemblyPart* AssemblyGraph::getPart(const std::string& partId) const {
    auto it = parts_.find(partId);
    return (it != parts_.end()) ? &it->second : nullptr;
}

std::vector<AssemblyPart> AssemblyGraph::parts() const {
    std::vector<AssemblyPart> result;
    result.reserve(partOrder_.size());
    for (const auto& id : partOrder_) {
        result.push_back(parts_.at(id));
    }
    return result;
}

const MatingInterface* AssemblyGraph::getInterface(const std::string& interfaceId) const {
    auto it = interfaces_.find(interfaceId);
    return (it != interfaces_.end()) ? &it->second : nullptr;
}

const tolerance::ToleranceChain* AssemblyGraph::getChain(const std::string& chainId) const {
    auto it = chains_.find(chainId);
    return (it != chains_.end()) ? &it->second : nullptr;
}

tolerance::ToleranceChain* AssemblyGraph::getChain(const std::string& chainId) {
    auto it = chains_.find(chainId);
    return (it != chains_.end()) ? &it->second : nullptr;
}

const std::vector<std::string>& AssemblyGraph::adjacentParts(const std::string& partId) const {
    static const std::vector<std::string> kEmpty;
    auto it = adjacency_.find(partId);
    return (it != adjacency_.end()) ? it->second : kEmpty;
}

bool AssemblyGraph::isAdjacencySymmetric() const {
    for (const auto& [partId, neighbors] : adjacency_) {
        for (const auto& neighbor : neighbors) {
            const auto& back = adjacentParts(neighbor);
            if (std::find(back.begin(), back.end(), partId) == back.end()) {
                return false;
            }
        }
    }
    return true;
}

void AssemblyGraph::connect(const std::string& from, const std::string& to) {
    auto& neighbors = adjacencyEntry(from);
    if (std::find(neighbors.begin(), neighbors.end(), to) == neighbors.end()) {
        neighbors.push_back(to);
    }
}

std::vector<std::string>& AssemblyGraph::adjacencyEntry(const std::string& partId) {
    auto [it, inserted] = adjacency_.try_emplace(partId);
    if (inserted) {
        adjacencyOrder_.push_back(partId);
    }
    return it->second;
}

} // namespace stackcad::core::assembly
