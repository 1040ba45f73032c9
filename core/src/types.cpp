#include <scenex/types.h>

namespace scenex {

namespace {

// Reverse lookup over a contiguous enum [0, Count)
template<typename Enum, size_t Count, typename NameFn>
std::optional<Enum> parseEnum(const std::string& name, NameFn nameOf) {
    for (size_t i = 0; i < Count; ++i) {
        Enum value = static_cast<Enum>(i);
        if (name == nameOf(value)) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace

const char* modelKindName(ModelKind kind) {
    switch (kind) {
        case ModelKind::Scene:  return "Scene";
        case ModelKind::Camera: return "Camera";
        case ModelKind::Image:  return "Image";
        case ModelKind::Points: return "Points";
        case ModelKind::View:   return "View";
        case ModelKind::Canvas: return "Canvas";
    }
    return "Unknown";
}

const char* nodeTypeTag(ModelKind kind) {
    switch (kind) {
        case ModelKind::Scene:  return "scene";
        case ModelKind::Camera: return "camera";
        case ModelKind::Image:  return "image";
        case ModelKind::Points: return "points";
        case ModelKind::View:   return "view";
        case ModelKind::Canvas: return "canvas";
    }
    return "unknown";
}

std::optional<ModelKind> parseNodeType(const std::string& tag) {
    auto kind = parseEnum<ModelKind, 6>(tag, nodeTypeTag);
    if (kind && !isNodeKind(*kind)) {
        return std::nullopt;
    }
    return kind;
}

const char* cameraTypeName(CameraType type) {
    switch (type) {
        case CameraType::PanZoom:     return "panzoom";
        case CameraType::Perspective: return "perspective";
    }
    return "panzoom";
}

std::optional<CameraType> parseCameraType(const std::string& name) {
    return parseEnum<CameraType, 2>(name, cameraTypeName);
}

const char* interpolationModeName(InterpolationMode mode) {
    switch (mode) {
        case InterpolationMode::Nearest: return "nearest";
        case InterpolationMode::Linear:  return "linear";
        case InterpolationMode::Bicubic: return "bicubic";
    }
    return "nearest";
}

std::optional<InterpolationMode> parseInterpolationMode(const std::string& name) {
    return parseEnum<InterpolationMode, 3>(name, interpolationModeName);
}

const char* scalingModeName(ScalingMode mode) {
    switch (mode) {
        case ScalingMode::Fixed:  return "fixed";
        case ScalingMode::Scene:  return "scene";
        case ScalingMode::Visual: return "visual";
    }
    return "fixed";
}

std::optional<ScalingMode> parseScalingMode(const std::string& name) {
    return parseEnum<ScalingMode, 3>(name, scalingModeName);
}

const char* symbolName(SymbolName symbol) {
    switch (symbol) {
        case SymbolName::Disc:         return "disc";
        case SymbolName::Arrow:        return "arrow";
        case SymbolName::Ring:         return "ring";
        case SymbolName::Clobber:      return "clobber";
        case SymbolName::Square:       return "square";
        case SymbolName::X:            return "x";
        case SymbolName::Diamond:      return "diamond";
        case SymbolName::VBar:         return "vbar";
        case SymbolName::HBar:         return "hbar";
        case SymbolName::Cross:        return "cross";
        case SymbolName::TailedArrow:  return "tailed_arrow";
        case SymbolName::TriangleUp:   return "triangle_up";
        case SymbolName::TriangleDown: return "triangle_down";
        case SymbolName::Star:         return "star";
        case SymbolName::CrossLines:   return "cross_lines";
    }
    return "disc";
}

std::optional<SymbolName> parseSymbolName(const std::string& name) {
    return parseEnum<SymbolName, 15>(name, symbolName);
}

const char* blendModeName(BlendMode mode) {
    switch (mode) {
        case BlendMode::Default:  return "default";
        case BlendMode::Opaque:   return "opaque";
        case BlendMode::Alpha:    return "alpha";
        case BlendMode::Additive: return "additive";
    }
    return "default";
}

std::optional<BlendMode> parseBlendMode(const std::string& name) {
    return parseEnum<BlendMode, 4>(name, blendModeName);
}

} // namespace scenex
