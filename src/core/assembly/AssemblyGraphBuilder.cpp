#include "AssemblyGraphBuilder.h"
#include "WorldTransform.h"

#include <Bnd_Box.hxx>

#include <QColor>
#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cmath>
#include <queue>
#include <unordered_map>

namespace stackcad::core::assembly {

Q_LOGGING_CATEGORY(logAssemblyGraph, "stackcad.core.assembly.graph")

namespace {

constexpr double kGoldenRatioConjugate = 0.618033988749895;

std::string pairKey(const std::string& a, const std::string& b) {
    return a + '\x1f' + b;
}

} // anonymous namespace

AssemblyGraph AssemblyGraphBuilder::build(const std::vector<AssemblyPart>& parts,
                                          const std::vector<MatingInterface>& interfaces,
                                          const GraphBuildOptions& options) {
    qCDebug(logAssemblyGraph) << "build:start"
                              << "parts=" << parts.size()
                              << "interfaces=" << interfaces.size();

    AssemblyGraph graph;
    const auto colors = generatePartColors(parts.size(), options.startHue);

    for (std::size_t i = 0; i < parts.size(); ++i) {
        AssemblyPart part = parts[i];
        if (!part.boundingBox) {
            part.boundingBox = BoundingBox{};
        }
        if (!part.color) {
            part.color = colors[i];
        }
        for (auto& face : part.faces) {
            if (face.globalId.empty()) {
                face.globalId = makeFaceGlobalId(part.id, face.id);
            }
        }

        if (!graph.addPart(std::move(part))) {
            qCWarning(logAssemblyGraph) << "build:duplicate-part"
                                        << QString::fromStdString(parts[i].id);
        }
    }

    for (const auto& iface : interfaces) {
        if (!graph.getPart(iface.partA.partId) || !graph.getPart(iface.partB.partId)) {
            qCWarning(logAssemblyGraph) << "build:dropped-interface-unknown-part"
                                        << QString::fromStdString(iface.id);
            continue;
        }
        if (!graph.addInterface(iface)) {
            qCWarning(logAssemblyGraph) << "build:duplicate-interface"
                                        << QString::fromStdString(iface.id);
        }
    }

    qCDebug(logAssemblyGraph) << "build:done"
                              << "parts=" << graph.partCount()
                              << "interfaces=" << graph.interfaceCount();
    return graph;
}

std::optional<AssemblyPath> AssemblyGraphBuilder::findPath(const AssemblyGraph& graph,
                                                           const std::string& startPartId,
                                                           const std::string& endPartId) {
    if (startPartId == endPartId) {
        return AssemblyPath{{startPartId}, {}};
    }

    // First interface joining each ordered pair, in insertion order
    std::unordered_map<std::string, std::string> hopInterface;
    for (const auto& interfaceId : graph.interfaceIds()) {
        const MatingInterface* iface = graph.getInterface(interfaceId);
        hopInterface.try_emplace(pairKey(iface->partA.partId, iface->partB.partId), interfaceId);
        hopInterface.try_emplace(pairKey(iface->partB.partId, iface->partA.partId), interfaceId);
    }

    struct Hop {
        std::string previous;
        std::string interfaceId;
    };
    std::unordered_map<std::string, Hop> reachedFrom;
    reachedFrom.emplace(startPartId, Hop{});

    std::queue<std::string> frontier;
    frontier.push(startPartId);

    while (!frontier.empty()) {
        const std::string current = frontier.front();
        frontier.pop();

        if (current == endPartId) {
            AssemblyPath path;
            std::string cursor = endPartId;
            while (cursor != startPartId) {
                const Hop& hop = reachedFrom.at(cursor);
                path.parts.push_back(cursor);
                path.interfaces.push_back(hop.interfaceId);
                cursor = hop.previous;
            }
            path.parts.push_back(startPartId);
            std::reverse(path.parts.begin(), path.parts.end());
            std::reverse(path.interfaces.begin(), path.interfaces.end());
            return path;
        }

        for (const auto& next : graph.adjacentParts(current)) {
            if (reachedFrom.count(next) > 0) {
                continue;
            }
            auto ifaceIt = hopInterface.find(pairKey(current, next));
            if (ifaceIt == hopInterface.end()) {
                continue;
            }
            reachedFrom.emplace(next, Hop{current, ifaceIt->second});
            frontier.push(next);
        }
    }

    return std::nullopt;
}

const MatingInterface* AssemblyGraphBuilder::findInterfaceBetween(const AssemblyGraph& graph,
                                                                  const std::string& partIdA,
                                                                  const std::string& partIdB) {
    for (const auto& interfaceId : graph.interfaceIds()) {
        const MatingInterface* iface = graph.getInterface(interfaceId);
        if ((iface->partA.partId == partIdA && iface->partB.partId == partIdB)
            || (iface->partA.partId == partIdB && iface->partB.partId == partIdA)) {
            return iface;
        }
    }
    return nullptr;
}

std::vector<const MatingInterface*> AssemblyGraphBuilder::getPartInterfaces(const AssemblyGraph& graph,
                                                                            const std::string& partId) {
    std::vector<const MatingInterface*> result;
    for (const auto& interfaceId : graph.interfaceIds()) {
        const MatingInterface* iface = graph.getInterface(interfaceId);
        if (iface->involves(partId)) {
            result.push_back(iface);
        }
    }
    return result;
}

bool AssemblyGraphBuilder::isJunctionPart(const AssemblyGraph& graph, const std::string& partId) {
    return getPartInterfaces(graph, partId).size() > 1;
}

std::vector<const AssemblyPart*> AssemblyGraphBuilder::getJunctionParts(const AssemblyGraph& graph) {
    std::vector<const AssemblyPart*> junctions;
    for (const auto& partId : graph.partIds()) {
        if (isJunctionPart(graph, partId)) {
            junctions.push_back(graph.getPart(partId));
        }
    }
    return junctions;
}

BoundingBox AssemblyGraphBuilder::calculateAssemblyBounds(const std::vector<AssemblyPart>& parts) {
    if (parts.empty()) {
        return BoundingBox{};
    }

    Bnd_Box box;
    for (const auto& part : parts) {
        const WorldTransform toWorld(part.transform);
        const BoundingBox local = part.boundingBox.value_or(BoundingBox{});
        for (const gp_Pnt& corner : toWorld.applyToBoxCorners(local)) {
            box.Add(corner);
        }
    }

    double xmin = 0.0, ymin = 0.0, zmin = 0.0;
    double xmax = 0.0, ymax = 0.0, zmax = 0.0;
    box.Get(xmin, ymin, zmin, xmax, ymax, zmax);

    BoundingBox bounds;
    bounds.min = {xmin, ymin, zmin};
    bounds.max = {xmax, ymax, zmax};
    return bounds;
}

std::vector<std::array<double, 3>> AssemblyGraphBuilder::generatePartColors(std::size_t count,
                                                                            double startHue) {
    std::vector<std::array<double, 3>> colors;
    colors.reserve(count);

    double hue = startHue;
    for (std::size_t i = 0; i < count; ++i) {
        hue = std::fmod(hue + kGoldenRatioConjugate, 1.0);
        const QColor color = QColor::fromHslF(static_cast<float>(hue), 0.6f, 0.5f);
        colors.push_back({color.redF(), color.greenF(), color.blueF()});
    }
    return colors;
}

} // namespace stackcad::core::assembly
