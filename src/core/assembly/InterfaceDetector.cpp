#include "InterfaceDetector.h"
#include "WorldTransform.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cmath>
#include <future>
#include <numbers>
#include <unordered_map>
#include <utility>

namespace stackcad::core::assembly {

Q_LOGGING_CATEGORY(logInterfaceDetector, "stackcad.core.assembly.detector")

namespace {

bool isMatingCandidate(FaceType type) {
    return type == FaceType::Planar || type == FaceType::Cylindrical;
}

std::string faceGlobalId(const AssemblyPart& part, const PartFace& face) {
    return face.globalId.empty() ? makeFaceGlobalId(part.id, face.id) : face.globalId;
}

struct ScoredInterface {
    MatingInterface iface;
    double score = 0.0;
};

} // anonymous namespace

InterfaceDetector::InterfaceDetector(DetectionParams params)
    : params_(std::move(params))
{
}

InterfaceType InterfaceDetector::classify(FaceType typeA,
                                          FaceType typeB,
                                          double alignment,
                                          std::optional<double> radiusA,
                                          std::optional<double> radiusB) const {
    if (typeA == FaceType::Planar && typeB == FaceType::Planar
        && alignment < params_.faceToFaceAlignment) {
        return InterfaceType::FaceToFace;
    }

    if (typeA == FaceType::Cylindrical && typeB == FaceType::Cylindrical
        && radiusA && radiusB
        && std::abs(*radiusA - *radiusB) < params_.pinRadiusTolerance) {
        return InterfaceType::PinInHole;
    }

    if ((typeA == FaceType::Cylindrical && typeB == FaceType::Planar)
        || (typeA == FaceType::Planar && typeB == FaceType::Cylindrical)) {
        return InterfaceType::ShaftInBore;
    }

    return InterfaceType::Unknown;
}

double InterfaceDetector::estimateContactArea(const PartFace& faceA,
                                              const PartFace& faceB,
                                              InterfaceType type) const {
    switch (type) {
        case InterfaceType::FaceToFace:
            return params_.faceToFaceContactArea;
        case InterfaceType::PinInHole:
        case InterfaceType::ShaftInBore: {
            double r = params_.defaultCylinderRadius;
            if (faceA.radius && *faceA.radius > 0.0) {
                r = *faceA.radius;
            } else if (faceB.radius && *faceB.radius > 0.0) {
                r = *faceB.radius;
            }
            return std::numbers::pi_v<double> * r * r;
        }
        default:
            return params_.fallbackContactArea;
    }
}

double InterfaceDetector::proximityBound(const AssemblyPart& partA, const AssemblyPart& partB) const {
    const double diagA = partA.boundingBox ? partA.boundingBox->diagonal() : params_.missingBoxDiagonal;
    const double diagB = partB.boundingBox ? partB.boundingBox->diagonal() : params_.missingBoxDiagonal;
    return std::max({params_.proximityThreshold * params_.proximityScale, diagA * 0.5, diagB * 0.5});
}

std::optional<MatingInterface> InterfaceDetector::evaluateFacePair(const AssemblyPart& partA,
                                                                   const WorldFace& faceA,
                                                                   const AssemblyPart& partB,
                                                                   const WorldFace& faceB,
                                                                   double maxProximity,
                                                                   double& score) const {
    const PartFace& srcA = *faceA.source;
    const PartFace& srcB = *faceB.source;

    if (!isMatingCandidate(srcA.faceType) || !isMatingCandidate(srcB.faceType)) {
        return std::nullopt;
    }

    const double distance = faceA.center.Distance(faceB.center);
    if (distance > maxProximity) {
        return std::nullopt;
    }

    const double alignment = faceA.normal.Dot(faceB.normal);

    // Planar faces must oppose; cylinders pair regardless of normal sign
    const bool opposingPlanes = srcA.faceType == FaceType::Planar
                                && srcB.faceType == FaceType::Planar
                                && alignment < params_.admitAlignment;
    const bool cylinderPair = srcA.faceType == FaceType::Cylindrical
                              && srcB.faceType == FaceType::Cylindrical;
    if (!opposingPlanes && !cylinderPair) {
        return std::nullopt;
    }

    const InterfaceType type = classify(srcA.faceType, srcB.faceType, alignment, srcA.radius, srcB.radius);
    if (type == InterfaceType::Unknown) {
        return std::nullopt;
    }

    const double contactArea = estimateContactArea(srcA, srcB, type);
    if (contactArea < params_.minContactArea) {
        qCDebug(logInterfaceDetector) << "evaluateFacePair:below-min-area"
                                      << QString::fromStdString(srcA.globalId)
                                      << QString::fromStdString(srcB.globalId)
                                      << "area=" << contactArea;
        return std::nullopt;
    }

    MatingInterface iface;
    iface.partA = {partA.id, faceGlobalId(partA, srcA)};
    iface.partB = {partB.id, faceGlobalId(partB, srcB)};
    iface.interfaceType = type;
    iface.proximity = distance;
    iface.normalAlignment = std::abs(alignment);
    iface.contactArea = contactArea;
    iface.defaultTolerance = suggestedTolerance(type).plus;
    iface.defaultDistribution = tolerance::DistributionType::Normal;
    iface.contactPoint = toVec3d((faceA.center.XYZ() + faceB.center.XYZ()) * 0.5);

    score = std::abs(alignment) * (1.0 / (1.0 + distance / params_.proximityScoreLength));
    return iface;
}

std::vector<MatingInterface> InterfaceDetector::detectBetween(const AssemblyPart& partA,
                                                              const AssemblyPart& partB) const {
    const WorldTransform toWorldA(partA.transform);
    const WorldTransform toWorldB(partB.transform);

    std::vector<WorldFace> facesA;
    facesA.reserve(partA.faces.size());
    for (const auto& face : partA.faces) {
        facesA.push_back(toWorldA.applyToFace(face));
    }

    std::vector<WorldFace> facesB;
    facesB.reserve(partB.faces.size());
    for (const auto& face : partB.faces) {
        facesB.push_back(toWorldB.applyToFace(face));
    }

    const double maxProximity = proximityBound(partA, partB);

    std::vector<ScoredInterface> candidates;
    for (const auto& faceA : facesA) {
        for (const auto& faceB : facesB) {
            double score = 0.0;
            auto iface = evaluateFacePair(partA, faceA, partB, faceB, maxProximity, score);
            if (iface) {
                candidates.push_back({std::move(*iface), score});
            }
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const ScoredInterface& a, const ScoredInterface& b) {
                         return a.score > b.score;
                     });

    const std::size_t keep = std::min(candidates.size(),
                                      static_cast<std::size_t>(std::max(params_.maxInterfacesPerPair, 0)));

    std::vector<MatingInterface> result;
    result.reserve(keep);
    for (std::size_t i = 0; i < keep; ++i) {
        result.push_back(std::move(candidates[i].iface));
    }
    return result;
}

InterfaceDetectionResult InterfaceDetector::detect(const std::vector<AssemblyPart>& parts) const {
    qCInfo(logInterfaceDetector) << "detect:start"
                                 << "parts=" << parts.size()
                                 << "proximityThreshold=" << params_.proximityThreshold
                                 << "workers=" << params_.workerCount;

    std::vector<std::pair<std::size_t, std::size_t>> pairs;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        for (std::size_t j = i + 1; j < parts.size(); ++j) {
            pairs.emplace_back(i, j);
        }
    }

    std::vector<std::vector<MatingInterface>> perPair(pairs.size());
    const std::size_t workers = std::min<std::size_t>(
        static_cast<std::size_t>(std::max(params_.workerCount, 1)),
        std::max<std::size_t>(pairs.size(), 1));

    if (workers <= 1) {
        for (std::size_t p = 0; p < pairs.size(); ++p) {
            perPair[p] = detectBetween(parts[pairs[p].first], parts[pairs[p].second]);
        }
    } else {
        std::vector<std::future<void>> tasks;
        tasks.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            tasks.push_back(std::async(std::launch::async, [this, w, workers, &pairs, &parts, &perPair]() {
                for (std::size_t p = w; p < pairs.size(); p += workers) {
                    perPair[p] = detectBetween(parts[pairs[p].first], parts[pairs[p].second]);
                }
            }));
        }
        for (auto& task : tasks) {
            task.get();
        }
    }

    // Merge in pair order so ids and junction order do not depend on scheduling
    InterfaceDetectionResult result;
    std::unordered_map<std::string, int> interfaceCount;
    std::vector<std::string> appearanceOrder;

    auto countPart = [&](const std::string& partId) {
        auto [it, inserted] = interfaceCount.emplace(partId, 0);
        if (inserted) {
            appearanceOrder.push_back(partId);
        }
        it->second++;
    };

    int nextId = 0;
    for (auto& pairInterfaces : perPair) {
        for (auto& iface : pairInterfaces) {
            iface.id = "interface-" + std::to_string(nextId++);
            countPart(iface.partA.partId);
            countPart(iface.partB.partId);
            result.interfaces.push_back(std::move(iface));
        }
    }

    for (const auto& partId : appearanceOrder) {
        if (interfaceCount[partId] > 1) {
            result.junctionParts.push_back(partId);
        }
    }

    for (auto& iface : result.interfaces) {
        iface.isJunction = interfaceCount[iface.partA.partId] > 1
                           || interfaceCount[iface.partB.partId] > 1;
    }

    qCInfo(logInterfaceDetector) << "detect:done"
                                 << "pairs=" << pairs.size()
                                 << "interfaces=" << result.interfaces.size()
                                 << "junctions=" << result.junctionParts.size();
    return result;
}

} // namespace stackcad::core::assembly
