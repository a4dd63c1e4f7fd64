/**
 * @file InterfaceDetector.h
 * @brief Discovery of mating interfaces between assembly parts
 *
 * Every unordered pair of parts is compared face by face in world space.
 * Only planar and cylindrical faces take part. Candidates are classified,
 * scored by alignment and proximity, and truncated per pair.
 *
 * Cost is O(P² · F²) for P parts of F faces each. That suits assemblies of
 * tens of parts and faces; large assemblies need a spatial index.
 */
#ifndef STACKCAD_CORE_ASSEMBLY_INTERFACEDETECTOR_H
#define STACKCAD_CORE_ASSEMBLY_INTERFACEDETECTOR_H

#include "AssemblyTypes.h"

#include <optional>
#include <string>
#include <vector>

namespace stackcad::core::assembly {

struct WorldFace;

/**
 * @brief Detection thresholds. Defaults are empirically chosen.
 */
struct DetectionParams {
    /// Base contact distance (mm); scaled by proximityScale for the coarse pre-filter
    double proximityThreshold = 2.0;

    /// Minimum |alignment| for face-to-face. Not consulted by classification,
    /// which uses admitAlignment and faceToFaceAlignment.
    double normalThreshold = 0.95;

    /// Candidates with a smaller estimated contact area are dropped (mm²)
    double minContactArea = 1.0;

    /// Pre-filter bound = max(proximityThreshold × proximityScale, half box diagonals)
    double proximityScale = 50.0;

    /// Box diagonal assumed for parts without a bounding box (mm)
    double missingBoxDiagonal = 100.0;

    /// Planar pairs are admitted below this signed normal alignment
    double admitAlignment = -0.8;

    /// Planar pairs below this alignment classify as face-to-face
    double faceToFaceAlignment = -0.9;

    /// Max radius difference for pin-in-hole (mm)
    double pinRadiusTolerance = 0.5;

    /// Distance at which the proximity score halves (mm)
    double proximityScoreLength = 10.0;

    /// Candidates kept per part pair, best first
    int maxInterfacesPerPair = 10;

    /// Contact area estimates (mm²)
    double faceToFaceContactArea = 10.0;
    double defaultCylinderRadius = 5.0;
    double fallbackContactArea = 1.0;

    /// Threads evaluating part pairs (1 = caller's thread)
    int workerCount = 1;
};

struct InterfaceDetectionResult {
    std::vector<MatingInterface> interfaces;

    /// Parts on either side of more than one interface, first-appearance order
    std::vector<std::string> junctionParts;
};

class InterfaceDetector {
public:
    explicit InterfaceDetector(DetectionParams params = {});

    InterfaceDetectionResult detect(const std::vector<AssemblyPart>& parts) const;

    /**
     * @brief Interfaces between one pair, best first, ids left empty.
     */
    std::vector<MatingInterface> detectBetween(const AssemblyPart& partA,
                                               const AssemblyPart& partB) const;

    /**
     * @brief Classify a face pair from types, signed alignment and radii.
     */
    InterfaceType classify(FaceType typeA,
                           FaceType typeB,
                           double alignment,
                           std::optional<double> radiusA,
                           std::optional<double> radiusB) const;

    double estimateContactArea(const PartFace& faceA,
                               const PartFace& faceB,
                               InterfaceType type) const;

    /**
     * @brief Coarse pre-filter distance for a part pair.
     */
    double proximityBound(const AssemblyPart& partA, const AssemblyPart& partB) const;

    const DetectionParams& params() const { return params_; }

private:
    std::optional<MatingInterface> evaluateFacePair(const AssemblyPart& partA,
                                                    const WorldFace& faceA,
                                                    const AssemblyPart& partB,
                                                    const WorldFace& faceB,
                                                    double maxProximity,
                                                    double& score) const;

    DetectionParams params_;
};

} // namespace stackcad::core::assembly

#endif // STACKCAD_CORE_ASSEMBLY_INTERFACEDETECTOR_H
