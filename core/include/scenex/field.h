#pragma once

/**
 * @file field.h
 * @brief Field identifiers, the FieldValue union and change notifications
 *
 * Every synchronizable property of every model type has a Field id.
 * A change notification carries the id and the new value as a FieldValue,
 * a closed std::variant over all field types. Subscribers receive the new
 * value only; old values are not kept.
 */

#include <scenex/array.h>
#include <scenex/color.h>
#include <scenex/layout.h>
#include <scenex/transform.h>
#include <scenex/types.h>
#include <glm/glm.hpp>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace scenex {

class Node;
class Scene;
class Camera;
class Image;
class Points;
class View;
class Canvas;

using NodePtr = std::shared_ptr<Node>;
using NodeList = std::vector<NodePtr>;
using ScenePtr = std::shared_ptr<Scene>;
using CameraPtr = std::shared_ptr<Camera>;
using ViewPtr = std::shared_ptr<View>;
using ViewList = std::vector<ViewPtr>;
using CanvasPtr = std::shared_ptr<Canvas>;
using PointList = std::vector<glm::vec3>;

/**
 * @brief Identifier of a synchronizable model field
 */
enum class Field : uint8_t {
    // Node
    Name,
    Visible,
    Interactive,
    Opacity,
    Order,
    Transform,
    Parent,
    Children,
    // Camera
    CameraType,
    Zoom,
    Center,
    Range,
    // Image
    Data,
    Cmap,
    Clims,
    Gamma,
    Interpolation,
    // Points
    Coords,
    PointSize,
    FaceColor,
    EdgeColor,
    EdgeWidth,
    Symbol,
    Scaling,
    Antialias,
    // View
    Scene,
    Camera,
    Layout,
    Blending,
    BackgroundColor,
    // Canvas
    Width,
    Height,
    Title,
    Views
};

/// Wire name of a field ("opacity", "face_color", "size", ...)
const char* fieldName(Field field);

/**
 * @brief New value of a field
 *
 * Alternatives are distinct types; always construct with
 * std::in_place_type to avoid implicit conversions between them.
 */
using FieldValue = std::variant<
    bool,
    int,
    float,
    std::string,
    std::optional<std::string>,
    glm::vec3,
    std::optional<glm::vec2>,
    scenex::Transform,
    Color,
    std::optional<Color>,
    Colormap,
    ArrayPtr,
    PointList,
    scenex::CameraType,
    InterpolationMode,
    ScalingMode,
    SymbolName,
    BlendMode,
    scenex::Layout,
    NodePtr,
    NodeList,
    ScenePtr,
    CameraPtr,
    ViewList
>;

/**
 * @brief Notification delivered to model subscribers
 */
struct ModelEvent {
    enum class Type : uint8_t {
        FieldChanged,  ///< `field` now holds `value`
        BatchFlushed   ///< Outermost batch() scope closed after at least one change
    };

    Type type = Type::FieldChanged;
    Field field = Field::Name;
    FieldValue value;

    const char* name() const { return fieldName(field); }
};

} // namespace scenex
