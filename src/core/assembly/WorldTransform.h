/**
 * @file WorldTransform.h
 * @brief Object-to-world mapping of face summaries and boxes.
 */
#ifndef STACKCAD_CORE_ASSEMBLY_WORLDTRANSFORM_H
#define STACKCAD_CORE_ASSEMBLY_WORLDTRANSFORM_H

#include "AssemblyTypes.h"

#include <gp_GTrsf.hxx>
#include <gp_Pnt.hxx>
#include <gp_XYZ.hxx>

#include <array>

namespace stackcad::core::assembly {

/**
 * @brief Face summary expressed in world coordinates
 */
struct WorldFace {
    const PartFace* source = nullptr;
    gp_Pnt center;
    gp_XYZ normal;          // Unit length unless the source normal was degenerate
};

class WorldTransform {
public:
    explicit WorldTransform(const Transform& matrix);

    /**
     * @brief Full affine mapping (rotation, scale, shear and translation).
     */
    gp_Pnt applyToPoint(const Vec3d& point) const;

    /**
     * @brief Linear part only, then renormalized.
     *
     * Vectors shorter than 1e-10 after mapping are returned unnormalized.
     */
    gp_XYZ applyToDirection(const Vec3d& direction) const;

    WorldFace applyToFace(const PartFace& face) const;

    /**
     * @brief The eight corners of a part-space box, mapped to world space.
     */
    std::array<gp_Pnt, 8> applyToBoxCorners(const BoundingBox& box) const;

    const gp_GTrsf& gtrsf() const { return trsf_; }

private:
    gp_GTrsf trsf_;
};

inline Vec3d toVec3d(const gp_XYZ& xyz) {
    return {xyz.X(), xyz.Y(), xyz.Z()};
}

inline Vec3d toVec3d(const gp_Pnt& pnt) {
    return {pnt.X(), pnt.Y(), pnt.Z()};
}

} // namespace stackcad::core::assembly

#endif // STACKCAD_CORE_ASSEMBLY_WORLDTRANSFORM_H
