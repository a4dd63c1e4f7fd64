#include "WorldTransform.h"

#include <gp_Mat.hxx>

namespace stackcad::core::assembly {

WorldTransform::WorldTransform(const Transform& matrix) {
    // Column-major: element (row, col) lives at col * 4 + row
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 4; ++col) {
            trsf_.SetValue(row + 1, col + 1, matrix[static_cast<std::size_t>(col * 4 + row)]);
        }
    }
}

gp_Pnt WorldTransform::applyToPoint(const Vec3d& point) const {
    gp_XYZ xyz(point.x, point.y, point.z);
    trsf_.Transforms(xyz);
    return gp_Pnt(xyz);
}

gp_XYZ WorldTransform::applyToDirection(const Vec3d& direction) const {
    gp_XYZ xyz(direction.x, direction.y, direction.z);
    xyz.Multiply(trsf_.VectorialPart());

    const double length = xyz.Modulus();
    if (length > 1e-10) {
        xyz.Divide(length);
    }
    return xyz;
}

WorldFace WorldTransform::applyToFace(const PartFace& face) const {
    WorldFace world;
    world.source = &face;
    world.center = applyToPoint(face.center);
    world.normal = applyToDirection(face.normal);
    return world;
}

std::array<gp_Pnt, 8> WorldTransform::applyToBoxCorners(const BoundingBox& box) const {
    const Vec3d& lo = box.min;
    const Vec3d& hi = box.max;
    return {
        applyToPoint({lo.x, lo.y, lo.z}),
        applyToPoint({hi.x, lo.y, lo.z}),
        applyToPoint({lo.x, hi.y, lo.z}),
        applyToPoint({hi.x, hi.y, lo.z}),
        applyToPoint({lo.x, lo.y, hi.z}),
        applyToPoint({hi.x, lo.y, hi.z}),
        applyToPoint({lo.x, hi.y, hi.z}),
        applyToPoint({hi.x, hi.y, hi.z}),
    };
}

} // namespace stackcad::core::assembly
