/**
 * @file AssemblyTypes.h
 * @brief Type definitions for assemblies, part faces and mating interfaces
 *
 * Face summaries are produced by an external geometry front end and are
 * read-only here. Transforms are 4x4 column-major object-to-world matrices.
 */

#ifndef STACKCAD_CORE_ASSEMBLY_TYPES_H
#define STACKCAD_CORE_ASSEMBLY_TYPES_H

#include "../tolerance/ToleranceTypes.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stackcad::core::assembly {

//==============================================================================
// Basic Geometry Types
//==============================================================================

/**
 * @brief Simple 3D vector type for world-space math
 */
struct Vec3d {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

/**
 * @brief 4x4 affine matrix, column-major (translation in elements 12..14)
 */
using Transform = std::array<double, 16>;

inline Transform identityTransform() {
    return {1.0, 0.0, 0.0, 0.0,
            0.0, 1.0, 0.0, 0.0,
            0.0, 0.0, 1.0, 0.0,
            0.0, 0.0, 0.0, 1.0};
}

struct BoundingBox {
    Vec3d min{0.0, 0.0, 0.0};
    Vec3d max{1.0, 1.0, 1.0};

    Vec3d dimensions() const { return {max.x - min.x, max.y - min.y, max.z - min.z}; }

    double diagonal() const {
        const Vec3d d = dimensions();
        return std::sqrt(d.x * d.x + d.y * d.y + d.z * d.z);
    }

    double largestDimension() const {
        const Vec3d d = dimensions();
        return std::max(d.x, std::max(d.y, d.z));
    }
};

//==============================================================================
// Enumerations
//==============================================================================

enum class FaceType {
    Planar,
    Cylindrical,
    Conical,
    Spherical,
    Toroidal,
    Freeform
};

enum class InterfaceType {
    FaceToFace,
    PinInHole,
    ShaftInBore,
    ThreadEngagement,
    Unknown
};

//==============================================================================
// Parts and Faces
//==============================================================================

/**
 * @brief Per-face geometric summary in part coordinates
 */
struct PartFace {
    int id = 0;
    std::string globalId;                   // "<partId>-face-<id>"
    FaceType faceType = FaceType::Freeform;
    Vec3d normal{0.0, 0.0, 1.0};
    Vec3d center;
    double area = 0.0;                      // mm²

    // Curved faces only
    std::optional<double> radius;
    std::optional<Vec3d> axis;
};

struct AssemblyPart {
    std::string id;
    std::string name;
    std::int64_t stepEntityId = 0;
    Transform transform = identityTransform();
    std::optional<BoundingBox> boundingBox;
    std::vector<PartFace> faces;            // Owned, not shared between parts
    std::optional<std::array<double, 3>> color;
};

//==============================================================================
// Mating Interfaces
//==============================================================================

struct InterfaceSide {
    std::string partId;
    std::string faceId;                     // PartFace::globalId
};

/**
 * @brief Detected contact between two parts. Immutable after detection.
 */
struct MatingInterface {
    std::string id;
    InterfaceSide partA;
    InterfaceSide partB;
    InterfaceType interfaceType = InterfaceType::Unknown;

    double proximity = 0.0;                 // Face-center distance, world space (mm)
    double normalAlignment = 0.0;           // |dot| of world normals, 0..1
    double contactArea = 0.0;               // Estimated (mm²)

    double defaultTolerance = 0.1;
    tolerance::DistributionType defaultDistribution = tolerance::DistributionType::Normal;

    Vec3d contactPoint;
    bool isJunction = false;

    bool involves(const std::string& partId) const {
        return partA.partId == partId || partB.partId == partId;
    }
};

//==============================================================================
// Helpers
//==============================================================================

/**
 * @brief Suggested symmetric tolerance for an interface type (mm)
 */
tolerance::TolerancePair suggestedTolerance(InterfaceType type);

std::string makeFaceGlobalId(const std::string& partId, int faceId);

const char* faceTypeName(FaceType type);
const char* interfaceTypeName(InterfaceType type);

std::optional<FaceType> faceTypeFromName(const std::string& name);
std::optional<InterfaceType> interfaceTypeFromName(const std::string& name);

} // namespace stackcad::core::assembly

#endif // STACKCAD_CORE_ASSEMBLY_TYPES_H
