#include "AssemblyTypes.h"

namespace stackcad::core::assembly {

tolerance::TolerancePair suggestedTolerance(InterfaceType type) {
    switch (type) {
        case InterfaceType::FaceToFace: return {0.05, 0.05};
        case InterfaceType::PinInHole: return {0.025, 0.025};
        case InterfaceType::ShaftInBore: return {0.016, 0.016};
        case InterfaceType::ThreadEngagement: return {0.1, 0.1};
        case InterfaceType::Unknown:
        default: return {0.1, 0.1};
    }
}

std::string makeFaceGlobalId(const std::string& partId, int faceId) {
    return partId + "-face-" + std::to_string(faceId);
}

const char* faceTypeName(FaceType type) {
    switch (type) {
        case FaceType::Planar: return "planar";
        case FaceType::Cylindrical: return "cylindrical";
        case FaceType::Conical: return "conical";
        case FaceType::Spherical: return "spherical";
        case FaceType::Toroidal: return "toroidal";
        case FaceType::Freeform: return "freeform";
        default: return "freeform";
    }
}

const char* interfaceTypeName(InterfaceType type) {
    switch (type) {
        case InterfaceType::FaceToFace: return "face_to_face";
        case InterfaceType::PinInHole: return "pin_in_hole";
        case InterfaceType::ShaftInBore: return "shaft_in_bore";
        case InterfaceType::ThreadEngagement: return "thread_engagement";
        case InterfaceType::Unknown: return "unknown";
        default: return "unknown";
    }
}

std::optional<FaceType> faceTypeFromName(const std::string& name) {
    if (name == "planar") return FaceType::Planar;
    if (name == "cylindrical") return FaceType::Cylindrical;
    if (name == "conical") return FaceType::Conical;
    if (name == "spherical") return FaceType::Spherical;
    if (name == "toroidal") return FaceType::Toroidal;
    if (name == "freeform") return FaceType::Freeform;
    return std::nullopt;
}

std::optional<InterfaceType> interfaceTypeFromName(const std::string& name) {
    if (name == "face_to_face") return InterfaceType::FaceToFace;
    if (name == "pin_in_hole") return InterfaceType::PinInHole;
    if (name == "shaft_in_bore") return InterfaceType::ShaftInBore;
    if (name == "thread_engagement") return InterfaceType::ThreadEngagement;
    if (name == "unknown") return InterfaceType::Unknown;
    return std::nullopt;
}

} // namespace stackcad::core::assembly
