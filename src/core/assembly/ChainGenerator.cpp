#include "ChainGenerator.h"
#include "AssemblyGraph.h"

#include <QLoggingCategory>
#include <QString>

namespace stackcad::core::assembly {

Q_LOGGING_CATEGORY(logChainGenerator, "stackcad.core.assembly.chaingen")

using tolerance::ChainLink;
using tolerance::ContributionDirection;
using tolerance::DatumReference;
using tolerance::LinkType;
using tolerance::ToleranceChain;

namespace {

double partLength(const AssemblyPart& part, const ChainGeneratorConfig& config) {
    return part.boundingBox ? part.boundingBox->largestDimension() : config.fallbackPartLength;
}

ChainLink makePartLink(const std::string& id,
                       const AssemblyPart& part,
                       ContributionDirection direction,
                       const ChainGeneratorConfig& config) {
    const double length = partLength(part, config);
    ChainLink link = tolerance::createNewLink(id, LinkType::PartDimension,
                                              part.name + " Length", length);
    link.partId = part.id;
    link.plusTolerance = length * config.partToleranceRatio;
    link.minusTolerance = length * config.partToleranceRatio;
    link.direction = direction;
    return link;
}

ChainLink makeGapLink(const std::string& id,
                      const std::string& name,
                      const MatingInterface& iface,
                      const ChainGeneratorConfig& config) {
    const double gap = iface.proximity != 0.0 ? iface.proximity : config.fallbackGap;
    ChainLink link = tolerance::createNewLink(id, LinkType::InterfaceGap, name, gap);
    link.interfaceId = iface.id;
    link.plusTolerance = iface.defaultTolerance;
    link.minusTolerance = iface.defaultTolerance;
    return link;
}

const InterfaceSide& sideOf(const MatingInterface& iface, const std::string& partId) {
    return iface.partA.partId == partId ? iface.partA : iface.partB;
}

} // anonymous namespace

ToleranceChain ChainGenerator::generateFromAssembly(const std::string& chainId,
                                                    const std::vector<AssemblyPart>& parts,
                                                    const std::vector<MatingInterface>& interfaces,
                                                    const ChainGeneratorConfig& config) {
    ToleranceChain chain = tolerance::createNewChain(chainId, "Auto-Generated Stackup");

    for (size_t i = 0; i < parts.size(); ++i) {
        const auto direction = i % 2 == 0 ? ContributionDirection::Positive
                                          : ContributionDirection::Negative;
        chain.links.push_back(makePartLink("link-part-" + std::to_string(i), parts[i],
                                           direction, config));
    }

    size_t gapIndex = 0;
    for (const auto& iface : interfaces) {
        if (gapIndex >= config.maxInterfaceLinks) {
            break;
        }
        if (iface.interfaceType == InterfaceType::Unknown) {
            continue;
        }
        chain.links.push_back(makeGapLink("link-iface-" + std::to_string(gapIndex),
                                          "Interface Gap " + std::to_string(gapIndex + 1),
                                          iface, config));
        ++gapIndex;
    }

    chain.isComplete = chain.links.size() >= 2;

    qCInfo(logChainGenerator) << "generateFromAssembly:done"
                              << "links=" << chain.links.size();
    return chain;
}

ToleranceChain ChainGenerator::generateFromPath(const std::string& chainId,
                                                const AssemblyGraph& graph,
                                                const AssemblyPath& path,
                                                const ChainGeneratorConfig& config) {
    ToleranceChain chain = tolerance::createNewChain(chainId, "Path Stackup");
    if (!path.parts.empty()) {
        chain.description = path.parts.front() + " to " + path.parts.back();
    }

    for (size_t i = 0; i < path.parts.size(); ++i) {
        const AssemblyPart* part = graph.getPart(path.parts[i]);
        if (!part) {
            qCWarning(logChainGenerator) << "generateFromPath:unknown-part"
                                         << QString::fromStdString(path.parts[i]);
        } else {
            chain.links.push_back(makePartLink("link-part-" + std::to_string(i), *part,
                                               ContributionDirection::Positive, config));
        }

        if (i >= path.interfaces.size() || i + 1 >= path.parts.size()) {
            continue;
        }
        const MatingInterface* iface = graph.getInterface(path.interfaces[i]);
        if (!iface) {
            qCWarning(logChainGenerator) << "generateFromPath:unknown-interface"
                                         << QString::fromStdString(path.interfaces[i]);
            continue;
        }
        chain.links.push_back(makeGapLink("link-iface-" + std::to_string(i),
                                          "Gap " + path.parts[i] + "/" + path.parts[i + 1],
                                          *iface, config));
    }

    if (!path.interfaces.empty()) {
        const MatingInterface* first = graph.getInterface(path.interfaces.front());
        const MatingInterface* last = graph.getInterface(path.interfaces.back());
        if (first) {
            const InterfaceSide& side = sideOf(*first, path.parts.front());
            chain.startDatum = DatumReference{side.partId, side.faceId, "Start datum"};
        }
        if (last) {
            const InterfaceSide& side = sideOf(*last, path.parts.back());
            chain.endDatum = DatumReference{side.partId, side.faceId, "End datum"};
        }
    }

    chain.isComplete = chain.links.size() >= 2;

    qCInfo(logChainGenerator) << "generateFromPath:done"
                              << "parts=" << path.parts.size()
                              << "links=" << chain.links.size();
    return chain;
}

} // namespace stackcad::core::assembly
