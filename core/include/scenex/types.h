#pragma once

/**
 * @file types.h
 * @brief Enumerations shared by the model, the contracts and serialization
 *
 * Each enum has a `...Name()` function returning the lowercase token used
 * in JSON documents and a `parse...()` function for the reverse direction.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace scenex {

/**
 * @brief Concrete kind of a model object
 */
enum class ModelKind : uint8_t {
    Scene,
    Camera,
    Image,
    Points,
    View,
    Canvas
};

/// "Scene", "Camera", ...
const char* modelKindName(ModelKind kind);

/// Node discriminator written to "node_type" ("scene", "camera", "image", "points")
const char* nodeTypeTag(ModelKind kind);
std::optional<ModelKind> parseNodeType(const std::string& tag);

inline bool isNodeKind(ModelKind kind) {
    return kind == ModelKind::Scene || kind == ModelKind::Camera ||
           kind == ModelKind::Image || kind == ModelKind::Points;
}

/// Camera projection / controller family
enum class CameraType : uint8_t {
    PanZoom,     ///< Orthographic camera with pan/zoom interaction
    Perspective  ///< Perspective camera with orbit interaction
};

const char* cameraTypeName(CameraType type);
std::optional<CameraType> parseCameraType(const std::string& name);

/// Image sampling mode
enum class InterpolationMode : uint8_t {
    Nearest,
    Linear,
    Bicubic
};

const char* interpolationModeName(InterpolationMode mode);
std::optional<InterpolationMode> parseInterpolationMode(const std::string& name);

/// How marker size reacts to zoom
enum class ScalingMode : uint8_t {
    Fixed,   ///< Size in screen pixels
    Scene,   ///< Size in scene units
    Visual   ///< Size in the node's local units
};

const char* scalingModeName(ScalingMode mode);
std::optional<ScalingMode> parseScalingMode(const std::string& name);

/// Marker symbol for Points
enum class SymbolName : uint8_t {
    Disc,
    Arrow,
    Ring,
    Clobber,
    Square,
    X,
    Diamond,
    VBar,
    HBar,
    Cross,
    TailedArrow,
    TriangleUp,
    TriangleDown,
    Star,
    CrossLines
};

const char* symbolName(SymbolName symbol);
std::optional<SymbolName> parseSymbolName(const std::string& name);

/// How a view is blended onto its canvas
enum class BlendMode : uint8_t {
    Default,
    Opaque,
    Alpha,
    Additive
};

const char* blendModeName(BlendMode mode);
std::optional<BlendMode> parseBlendMode(const std::string& name);

} // namespace scenex
