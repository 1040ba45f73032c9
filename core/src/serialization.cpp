#include <scenex/serialization.h>
#include <scenex/camera.h>
#include <scenex/errors.h>
#include <scenex/image.h>
#include <scenex/points.h>
#include <scenex/scene.h>
#include <algorithm>
#include <iterator>
#include <limits>
#include <type_traits>

namespace scenex {

using json = nlohmann::json;

namespace {

// =============================================================================
// Writing
// =============================================================================

json vec2Json(const glm::vec2& v) { return json::array({v.x, v.y}); }
json vec3Json(const glm::vec3& v) { return json::array({v.x, v.y, v.z}); }
json colorJson(const Color& c) { return json::array({c.r, c.g, c.b, c.a}); }

json transformJson(const Transform& t) {
    json out = json::array();
    const glm::mat4& m = t.matrix();
    for (int c = 0; c < 4; ++c) {
        for (int r = 0; r < 4; ++r) {
            out.push_back(m[c][r]);
        }
    }
    return out;
}

json arrayJson(const Array& a) {
    return json{{"shape", a.shape()}, {"values", a.values()}};
}

json layoutJson(const Layout& l) {
    json out = json::object();
    out["position"] = vec2Json(l.position());
    out["size"] = l.size() ? vec2Json(*l.size()) : json(nullptr);
    out["border_width"] = l.borderWidth();
    out["border_color"] = l.borderColor() ? colorJson(*l.borderColor()) : json(nullptr);
    out["padding"] = l.padding();
    out["margin"] = l.margin();
    return out;
}

json valueJson(const FieldValue& value) {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int> ||
                      std::is_same_v<T, float> || std::is_same_v<T, std::string>) {
            return json(v);
        } else if constexpr (std::is_same_v<T, std::optional<std::string>>) {
            return v ? json(*v) : json(nullptr);
        } else if constexpr (std::is_same_v<T, glm::vec3>) {
            return vec3Json(v);
        } else if constexpr (std::is_same_v<T, std::optional<glm::vec2>>) {
            return v ? vec2Json(*v) : json(nullptr);
        } else if constexpr (std::is_same_v<T, Transform>) {
            return transformJson(v);
        } else if constexpr (std::is_same_v<T, Color>) {
            return colorJson(v);
        } else if constexpr (std::is_same_v<T, std::optional<Color>>) {
            return v ? colorJson(*v) : json(nullptr);
        } else if constexpr (std::is_same_v<T, Colormap>) {
            return json(v.name);
        } else if constexpr (std::is_same_v<T, ArrayPtr>) {
            return v ? arrayJson(*v) : json(nullptr);
        } else if constexpr (std::is_same_v<T, PointList>) {
            json out = json::array();
            for (const auto& p : v) out.push_back(vec3Json(p));
            return out;
        } else if constexpr (std::is_same_v<T, CameraType>) {
            return json(cameraTypeName(v));
        } else if constexpr (std::is_same_v<T, InterpolationMode>) {
            return json(interpolationModeName(v));
        } else if constexpr (std::is_same_v<T, ScalingMode>) {
            return json(scalingModeName(v));
        } else if constexpr (std::is_same_v<T, SymbolName>) {
            return json(symbolName(v));
        } else if constexpr (std::is_same_v<T, BlendMode>) {
            return json(blendModeName(v));
        } else if constexpr (std::is_same_v<T, Layout>) {
            return layoutJson(v);
        } else {
            throw SerializationError("structural fields are not plain values");
        }
    }, value);
}

bool isStructural(Field field) {
    return field == Field::Parent || field == Field::Children || field == Field::Scene ||
           field == Field::Camera || field == Field::Views;
}

ModelPtr makeDefault(ModelKind kind) {
    switch (kind) {
        case ModelKind::Scene:  return make<Scene>();
        case ModelKind::Camera: return make<Camera>();
        case ModelKind::Image:  return make<Image>();
        case ModelKind::Points: return make<Points>();
        case ModelKind::View:   return make<View>();
        case ModelKind::Canvas: return make<Canvas>();
    }
    throw SerializationError("unknown model kind");
}

void writePlainFields(json& out, const EventedModel& model, bool excludeDefaults) {
    ModelPtr defaults = excludeDefaults ? makeDefault(model.kind()) : nullptr;
    for (Field field : model.fields()) {
        if (isStructural(field)) {
            continue;
        }
        json value = valueJson(model.get(field));
        if (defaults && value == valueJson(defaults->get(field))) {
            continue;
        }
        out[fieldName(field)] = std::move(value);
    }
}

json nodeJson(const Node& node, bool excludeDefaults, const Node* skip) {
    json out = json::object();
    out["node_type"] = nodeTypeTag(node.kind());
    writePlainFields(out, node, excludeDefaults);

    json children = json::array();
    for (const auto& child : node.children()) {
        if (child.get() != skip) {
            children.push_back(nodeJson(*child, excludeDefaults, skip));
        }
    }
    if (!excludeDefaults || !children.empty()) {
        out["children"] = std::move(children);
    }
    return out;
}

json viewJson(const View& view, bool excludeDefaults) {
    json out = json::object();
    out["scene"] = nodeJson(*view.scene(), excludeDefaults, view.camera().get());
    out["camera"] = nodeJson(*view.camera(), excludeDefaults, nullptr);

    // Position of the camera among the scene's children
    const auto& siblings = view.scene()->children();
    auto it = std::find(siblings.begin(), siblings.end(), view.camera());
    if (it != siblings.end()) {
        out["camera_index"] = std::distance(siblings.begin(), it);
    }
    writePlainFields(out, view, excludeDefaults);
    return out;
}

json canvasJson(const Canvas& canvas, bool excludeDefaults) {
    json out = json::object();
    writePlainFields(out, canvas, excludeDefaults);
    json views = json::array();
    for (const auto& view : canvas.views()) {
        views.push_back(viewJson(*view, excludeDefaults));
    }
    out["views"] = std::move(views);
    return out;
}

// =============================================================================
// Reading
// =============================================================================

template <typename Fn>
auto guarded(const char* what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const json::exception& e) {
        throw SerializationError(std::string("invalid ") + what + ": " + e.what());
    }
}

void requireObject(const json& doc, const char* what) {
    if (!doc.is_object()) {
        throw SerializationError(std::string(what) + " document must be a JSON object");
    }
}

std::vector<float> readNumbers(const json& value, const char* what, size_t minSize, size_t maxSize) {
    if (!value.is_array() || value.size() < minSize || value.size() > maxSize) {
        throw SerializationError(std::string(what) + " must be an array of " + std::to_string(minSize) +
                                 (minSize == maxSize ? "" : " to " + std::to_string(maxSize)) + " numbers");
    }
    return guarded(what, [&] { return value.get<std::vector<float>>(); });
}

glm::vec2 readVec2(const json& value, const char* what) {
    auto n = readNumbers(value, what, 2, 2);
    return {n[0], n[1]};
}

glm::vec3 readVec3(const json& value, const char* what) {
    auto n = readNumbers(value, what, 2, 3);
    return {n[0], n[1], n.size() > 2 ? n[2] : 0.0f};
}

Color readColor(const json& value, const char* what) {
    if (value.is_string()) {
        return Color::fromHex(value.get<std::string>());
    }
    auto n = readNumbers(value, what, 3, 4);
    return {n[0], n[1], n[2], n.size() > 3 ? n[3] : 1.0f};
}

std::optional<Color> readOptionalColor(const json& value, const char* what) {
    if (value.is_null()) return std::nullopt;
    return readColor(value, what);
}

Transform readTransform(const json& value) {
    auto n = readNumbers(value, "transform", 16, 16);
    glm::mat4 m(1.0f);
    for (int c = 0; c < 4; ++c) {
        for (int r = 0; r < 4; ++r) {
            m[c][r] = n[static_cast<size_t>(c * 4 + r)];
        }
    }
    return Transform(m);
}

Array readArray(const json& value) {
    requireObject(value, "array");
    return guarded("array", [&] {
        return Array(value.at("shape").get<std::vector<size_t>>(),
                     value.at("values").get<std::vector<float>>());
    });
}

template <typename Enum>
Enum readEnum(const json& value, std::optional<Enum> (*parse)(const std::string&), const char* what) {
    std::string name = guarded(what, [&] { return value.get<std::string>(); });
    auto parsed = parse(name);
    if (!parsed) {
        throw SerializationError(std::string("unknown ") + what + " '" + name + "'");
    }
    return *parsed;
}

template <typename T>
T readScalar(const json& value, const char* what) {
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        if (!value.is_number_integer()) {
            throw SerializationError(std::string(what) + " must be an integer, got " + value.dump());
        }
    }
    return guarded(what, [&] { return value.get<T>(); });
}

Layout readLayout(const json& value) {
    requireObject(value, "layout");
    glm::vec2 position = value.contains("position") ? readVec2(value["position"], "layout position") : glm::vec2(0.0f);
    std::optional<glm::vec2> size;
    if (value.contains("size") && !value["size"].is_null()) {
        size = readVec2(value["size"], "layout size");
    }
    float borderWidth = value.contains("border_width") ? readScalar<float>(value["border_width"], "border_width") : 0.0f;
    std::optional<Color> borderColor;
    if (value.contains("border_color")) {
        borderColor = readOptionalColor(value["border_color"], "border_color");
    }
    int padding = value.contains("padding") ? readScalar<int>(value["padding"], "padding") : 0;
    int margin = value.contains("margin") ? readScalar<int>(value["margin"], "margin") : 0;
    return Layout(position, size, borderWidth, borderColor, padding, margin);
}

void readNodeFields(Node& node, const json& doc) {
    if (doc.contains("name")) {
        const auto& name = doc["name"];
        node.setName(name.is_null() ? std::nullopt : std::optional<std::string>(readScalar<std::string>(name, "name")));
    }
    if (doc.contains("visible")) node.setVisible(readScalar<bool>(doc["visible"], "visible"));
    if (doc.contains("interactive")) node.setInteractive(readScalar<bool>(doc["interactive"], "interactive"));
    if (doc.contains("opacity")) node.setOpacity(readScalar<float>(doc["opacity"], "opacity"));
    if (doc.contains("order")) node.setOrder(readScalar<int>(doc["order"], "order"));
    if (doc.contains("transform")) node.setTransform(readTransform(doc["transform"]));
}

void readCameraFields(Camera& camera, const json& doc) {
    if (doc.contains("type")) camera.setType(readEnum(doc["type"], &parseCameraType, "camera type"));
    if (doc.contains("zoom")) camera.setZoom(readScalar<float>(doc["zoom"], "zoom"));
    if (doc.contains("center")) camera.setCenter(readVec3(doc["center"], "center"));
    if (doc.contains("range")) camera.setRange(readScalar<float>(doc["range"], "range"));
}

void readImageFields(Image& image, const json& doc) {
    if (doc.contains("data")) image.setData(readArray(doc["data"]));
    if (doc.contains("cmap")) image.setCmap(Colormap(readScalar<std::string>(doc["cmap"], "cmap")));
    if (doc.contains("clims")) {
        const auto& clims = doc["clims"];
        image.setClims(clims.is_null() ? std::nullopt : std::optional<glm::vec2>(readVec2(clims, "clims")));
    }
    if (doc.contains("gamma")) image.setGamma(readScalar<float>(doc["gamma"], "gamma"));
    if (doc.contains("interpolation")) {
        image.setInterpolation(readEnum(doc["interpolation"], &parseInterpolationMode, "interpolation"));
    }
}

void readPointsFields(Points& points, const json& doc) {
    if (doc.contains("coords")) {
        const auto& coords = doc["coords"];
        if (!coords.is_array()) {
            throw SerializationError("coords must be an array of points");
        }
        PointList list;
        for (const auto& p : coords) {
            list.push_back(readVec3(p, "point"));
        }
        points.setCoords(std::move(list));
    }
    if (doc.contains("size")) points.setSize(readScalar<float>(doc["size"], "size"));
    if (doc.contains("face_color")) points.setFaceColor(readColor(doc["face_color"], "face_color"));
    if (doc.contains("edge_color")) points.setEdgeColor(readColor(doc["edge_color"], "edge_color"));
    if (doc.contains("edge_width")) points.setEdgeWidth(readScalar<float>(doc["edge_width"], "edge_width"));
    if (doc.contains("symbol")) points.setSymbol(readEnum(doc["symbol"], &parseSymbolName, "symbol"));
    if (doc.contains("scaling")) points.setScaling(readEnum(doc["scaling"], &parseScalingMode, "scaling"));
    if (doc.contains("antialias")) points.setAntialias(readScalar<float>(doc["antialias"], "antialias"));
}

template <typename T>
std::shared_ptr<T> requireKind(const NodePtr& node, const char* what) {
    auto typed = nodeCast<T>(node);
    if (!typed) {
        throw SerializationError(std::string(what) + " must be a " + modelKindName(T::Kind) +
                                 ", got " + node->kindName());
    }
    return typed;
}

/**
 * Load a node document. When `insert` is set it is added to the new node's
 * children before the child at `insertAt`, or last when the document has
 * fewer children.
 */
NodePtr loadNode(const json& doc, const NodePtr& insert, size_t insertAt) {
    requireObject(doc, "node");
    if (!doc.contains("node_type")) {
        throw SerializationError("node document has no \"node_type\"");
    }
    std::string tag = readScalar<std::string>(doc["node_type"], "node_type");
    auto kind = parseNodeType(tag);
    if (!kind) {
        throw SerializationError("unknown node_type '" + tag + "'");
    }

    NodePtr node;
    switch (*kind) {
        case ModelKind::Scene:
            node = make<Scene>();
            break;
        case ModelKind::Camera: {
            auto camera = make<Camera>();
            readCameraFields(*camera, doc);
            node = camera;
            break;
        }
        case ModelKind::Image: {
            auto image = make<Image>();
            readImageFields(*image, doc);
            node = image;
            break;
        }
        case ModelKind::Points: {
            auto points = make<Points>();
            readPointsFields(*points, doc);
            node = points;
            break;
        }
        default:
            throw SerializationError("node_type '" + tag + "' is not a node");
    }
    readNodeFields(*node, doc);

    if (doc.contains("children")) {
        const auto& children = doc["children"];
        if (!children.is_array()) {
            throw SerializationError("children must be an array");
        }
        size_t position = 0;
        for (const auto& child : children) {
            if (insert && position == insertAt) {
                node->addChild(insert);
            }
            node->addChild(loadNode(child, nullptr, 0));
            ++position;
        }
    }
    if (insert) {
        node->addChild(insert);
    }
    return node;
}

} // namespace

// =============================================================================
// Public API
// =============================================================================

json toJson(const EventedModel& model, bool excludeDefaults) {
    switch (model.kind()) {
        case ModelKind::View:
            return viewJson(static_cast<const View&>(model), excludeDefaults);
        case ModelKind::Canvas:
            return canvasJson(static_cast<const Canvas&>(model), excludeDefaults);
        default:
            return nodeJson(static_cast<const Node&>(model), excludeDefaults, nullptr);
    }
}

std::string dumpJson(const EventedModel& model, int indent, bool excludeDefaults) {
    return toJson(model, excludeDefaults).dump(indent);
}

NodePtr nodeFromJson(const json& doc) {
    return loadNode(doc, nullptr, 0);
}

ViewPtr viewFromJson(const json& doc) {
    requireObject(doc, "view");
    auto view = make<View>();
    CameraPtr camera;
    if (doc.contains("camera")) {
        camera = requireKind<Camera>(nodeFromJson(doc["camera"]), "view camera");
    }
    if (doc.contains("scene")) {
        // The camera goes back to its place among the scene's children
        size_t cameraIndex = std::numeric_limits<size_t>::max();
        if (camera && doc.contains("camera_index")) {
            int index = readScalar<int>(doc["camera_index"], "camera_index");
            if (index < 0) {
                throw SerializationError("camera_index must be non-negative, got " + std::to_string(index));
            }
            cameraIndex = static_cast<size_t>(index);
        }
        view->setScene(requireKind<Scene>(loadNode(doc["scene"], camera, cameraIndex), "view scene"));
    }
    if (camera) {
        view->setCamera(camera);
    }
    if (doc.contains("layout")) view->setLayout(readLayout(doc["layout"]));
    if (doc.contains("visible")) view->setVisible(readScalar<bool>(doc["visible"], "visible"));
    if (doc.contains("blending")) view->setBlending(readEnum(doc["blending"], &parseBlendMode, "blending"));
    if (doc.contains("background_color")) {
        view->setBackgroundColor(readOptionalColor(doc["background_color"], "background_color"));
    }
    return view;
}

CanvasPtr canvasFromJson(const json& doc) {
    requireObject(doc, "canvas");
    auto canvas = make<Canvas>();
    if (doc.contains("width")) canvas->setWidth(readScalar<int>(doc["width"], "width"));
    if (doc.contains("height")) canvas->setHeight(readScalar<int>(doc["height"], "height"));
    if (doc.contains("title")) canvas->setTitle(readScalar<std::string>(doc["title"], "title"));
    if (doc.contains("background_color")) {
        canvas->setBackgroundColor(readOptionalColor(doc["background_color"], "background_color"));
    }
    if (doc.contains("visible") && readScalar<bool>(doc["visible"], "visible")) {
        canvas->show();
    }
    if (doc.contains("views")) {
        const auto& views = doc["views"];
        if (!views.is_array()) {
            throw SerializationError("views must be an array");
        }
        for (const auto& v : views) {
            canvas->addView(viewFromJson(v));
        }
    }
    return canvas;
}

ModelPtr modelFromJson(const json& doc) {
    requireObject(doc, "model");
    if (doc.contains("node_type")) {
        return nodeFromJson(doc);
    }
    if (doc.contains("views")) {
        return canvasFromJson(doc);
    }
    if (doc.contains("scene") || doc.contains("camera")) {
        return viewFromJson(doc);
    }
    throw SerializationError("cannot tell whether the document is a node, view or canvas");
}

ModelPtr loadJson(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw SerializationError(std::string("malformed JSON: ") + e.what());
    }
    return modelFromJson(doc);
}

} // namespace scenex
