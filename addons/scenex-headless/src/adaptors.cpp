#include <scenex/headless/adaptors.h>
#include <algorithm>
#include <cmath>

namespace scenex::headless {

namespace {

nlohmann::json colorProp(const std::optional<Color>& color) {
    return color ? nlohmann::json(color->toHexString()) : nlohmann::json();
}

nlohmann::json vec2Prop(const std::optional<glm::vec2>& v) {
    return v ? nlohmann::json::array({v->x, v->y}) : nlohmann::json();
}

} // namespace

// =============================================================================
// HeadlessCamera
// =============================================================================

void HeadlessCamera::setType(CameraType type) {
    object().setProp("type", cameraTypeName(type));
}

void HeadlessCamera::setZoom(float zoom) {
    object().setProp("zoom", zoom);
}

void HeadlessCamera::setCenter(const glm::vec3& center) {
    object().setProp("center", nlohmann::json::array({center.x, center.y, center.z}));
}

void HeadlessCamera::setRange(float margin) {
    m_margin = margin;
    object().setProp("range", margin);
    frame();
}

void HeadlessCamera::forceUpdate() {
    NodeImpl::forceUpdate();
    frame();
}

void HeadlessCamera::frame() {
    const Node* scene = m_camera.parent();
    if (!scene) {
        return;
    }
    Adaptor* sceneAdaptor = registry().findAdaptor(scene->id());
    if (!sceneAdaptor) {
        return;
    }
    auto bounds = nativeOf(*sceneAdaptor).worldBounds();
    if (!bounds) {
        return;
    }
    glm::vec3 extent = bounds->extent();
    float width = extent.x < 0.01f ? 1.0f : extent.x;
    float height = extent.y < 0.01f ? 1.0f : extent.y;
    m_framedSize = glm::vec2(width, height);

    glm::vec3 center = (bounds->min + bounds->max) * 0.5f;
    object().setProp("framed_width", width);
    object().setProp("framed_height", height);
    object().setProp("framed_center", nlohmann::json::array({center.x, center.y, center.z}));
    object().setProp("fit_zoom", 1.0f - m_margin);
}

// =============================================================================
// HeadlessImage
// =============================================================================

void HeadlessImage::setData(const ArrayPtr& data) {
    m_data = data;
    object().setProp("shape", data->shape());

    // HxW and HxWxC (C = 3 or 4) are flat images; anything else is a volume
    bool flat = data->rank() == 2 || (data->rank() == 3 && (data->dim(2) == 3 || data->dim(2) == 4));
    std::optional<Bounds> bounds;
    if (!data->empty()) {
        if (flat) {
            bounds = Bounds{glm::vec3(0.0f),
                            glm::vec3(static_cast<float>(data->dim(1)), static_cast<float>(data->dim(0)), 0.0f)};
        } else {
            bounds = Bounds{glm::vec3(0.0f),
                            glm::vec3(static_cast<float>(data->dim(2)), static_cast<float>(data->dim(1)),
                                      static_cast<float>(data->dim(0)))};
        }
    }
    object().setLocalBounds(bounds);
    updateClims();
}

void HeadlessImage::setCmap(const Colormap& cmap) {
    object().setProp("cmap", cmap.name);
}

void HeadlessImage::setClims(const std::optional<glm::vec2>& clims) {
    m_clims = clims;
    updateClims();
}

void HeadlessImage::updateClims() {
    if (m_clims) {
        object().setProp("clims", vec2Prop(m_clims));
        return;
    }
    // Auto limits follow the data range
    if (m_data && !m_data->empty()) {
        object().setProp("clims", nlohmann::json::array({m_data->min(), m_data->max()}));
    } else {
        object().setProp("clims", nlohmann::json());
    }
}

void HeadlessImage::setGamma(float gamma) {
    if (gamma != 1.0f) {
        throw UnsupportedCapabilityError("gamma correction is not available in the headless backend");
    }
    object().setProp("gamma", gamma);
}

void HeadlessImage::setInterpolation(InterpolationMode mode) {
    if (mode == InterpolationMode::Bicubic) {
        object().setProp("interpolation", interpolationModeName(InterpolationMode::Linear));
        throw UnsupportedCapabilityError("bicubic interpolation is not available, using linear");
    }
    object().setProp("interpolation", interpolationModeName(mode));
}

// =============================================================================
// HeadlessPoints
// =============================================================================

void HeadlessPoints::setCoords(const PointList& coords) {
    object().setProp("count", coords.size());
    if (coords.empty()) {
        object().setLocalBounds(std::nullopt);
        return;
    }
    Bounds bounds{coords.front(), coords.front()};
    for (const auto& p : coords) {
        bounds.min = glm::min(bounds.min, p);
        bounds.max = glm::max(bounds.max, p);
    }
    object().setLocalBounds(bounds);
}

void HeadlessPoints::setSize(float size) {
    object().setProp("size", size);
}

void HeadlessPoints::setFaceColor(const Color& color) {
    object().setProp("face_color", color.toHexString());
}

void HeadlessPoints::setEdgeColor(const Color& color) {
    object().setProp("edge_color", color.toHexString());
}

void HeadlessPoints::setEdgeWidth(float width) {
    object().setProp("edge_width", width);
}

void HeadlessPoints::setSymbol(SymbolName symbol) {
    object().setProp("symbol", symbolName(symbol));
}

void HeadlessPoints::setScaling(ScalingMode mode) {
    object().setProp("scaling", scalingModeName(mode));
}

void HeadlessPoints::setAntialias(float antialias) {
    object().setProp("antialias", antialias);
}

// =============================================================================
// HeadlessView
// =============================================================================

HeadlessView::HeadlessView(const View& view, AdaptorRegistry& registry)
    : ViewAdaptor(view, registry)
    , m_native(std::make_unique<NativeObject>("View")) {}

void HeadlessView::setVisible(bool visible) {
    m_visible = visible;
    m_native->setProp("visible", visible);
}

void HeadlessView::setScene(const ScenePtr& scene) {
    m_sceneId = scene ? scene->id() : 0;
    m_native->setProp("scene", m_sceneId);
}

void HeadlessView::setCamera(const CameraPtr& camera) {
    m_cameraId = camera ? camera->id() : 0;
    m_native->setProp("camera", m_cameraId);
}

void HeadlessView::setBlending(BlendMode mode) {
    m_native->setProp("blending", blendModeName(mode));
}

void HeadlessView::setBackgroundColor(const std::optional<Color>& color) {
    m_backgroundColor = color;
    m_native->setProp("background_color", colorProp(color));
}

void HeadlessView::setPosition(const glm::vec2& position) {
    m_position = position;
    m_native->setProp("position", nlohmann::json::array({position.x, position.y}));
}

void HeadlessView::setSize(const std::optional<glm::vec2>& size) {
    m_size = size;
    m_native->setProp("size", vec2Prop(size));
}

void HeadlessView::setBorderWidth(float width) {
    if (width != 0.0f) {
        throw UnsupportedCapabilityError("view borders are not drawn by the headless backend");
    }
}

void HeadlessView::setBorderColor(const std::optional<Color>& color) {
    if (color) {
        throw UnsupportedCapabilityError("view borders are not drawn by the headless backend");
    }
}

void HeadlessView::setPadding(int padding) {
    if (padding != 0) {
        throw UnsupportedCapabilityError("view padding is not available in the headless backend");
    }
}

void HeadlessView::setMargin(int margin) {
    if (margin != 0) {
        throw UnsupportedCapabilityError("view margins are not available in the headless backend");
    }
}

// =============================================================================
// HeadlessCanvas
// =============================================================================

HeadlessCanvas::HeadlessCanvas(const Canvas& canvas, AdaptorRegistry& registry)
    : CanvasAdaptor(canvas, registry)
    , m_native(std::make_unique<NativeObject>("Canvas")) {}

void HeadlessCanvas::setVisible(bool visible) {
    m_native->setProp("visible", visible);
}

void HeadlessCanvas::setWidth(int width) {
    m_width = width;
    m_native->setProp("width", width);
}

void HeadlessCanvas::setHeight(int height) {
    m_height = height;
    m_native->setProp("height", height);
}

void HeadlessCanvas::setBackgroundColor(const std::optional<Color>& color) {
    m_backgroundColor = color;
    m_native->setProp("background_color", colorProp(color));
}

void HeadlessCanvas::setTitle(const std::string& title) {
    m_native->setProp("title", title);
}

void HeadlessCanvas::close() {
    m_closed = true;
    m_native->setProp("closed", true);
}

void HeadlessCanvas::addView(const ViewPtr& view) {
    NativeObject& native = nativeOf(registry().getAdaptor(view));
    m_native->add(native);
    if (std::find(m_views.begin(), m_views.end(), view->id()) == m_views.end()) {
        m_views.push_back(view->id());
    }
}

void HeadlessCanvas::setViews(const ViewList& views) {
    std::vector<ModelId> wanted;
    std::vector<NativeObject*> order;
    for (const auto& view : views) {
        addView(view);
        wanted.push_back(view->id());
        order.push_back(&nativeOf(*registry().findAdaptor(view->id())));
    }
    for (ModelId id : m_views) {
        if (std::find(wanted.begin(), wanted.end(), id) != wanted.end()) {
            continue;
        }
        if (Adaptor* stale = registry().findAdaptor(id)) {
            m_native->remove(nativeOf(*stale));
        }
    }
    m_views = std::move(wanted);
    m_native->reorder(order);
}

Array HeadlessCanvas::render() {
    if (m_closed) {
        throw BackendSyncError("cannot render a closed canvas");
    }
    const size_t w = static_cast<size_t>(m_width);
    const size_t h = static_cast<size_t>(m_height);
    Color clear = m_backgroundColor.value_or(Color::Transparent);
    Array frame({h, w, 4}, std::vector<float>(h * w * 4, 0.0f));

    auto fill = [&](float x0, float y0, float x1, float y1, const Color& c) {
        size_t xs = static_cast<size_t>(std::clamp(x0, 0.0f, static_cast<float>(w)));
        size_t ys = static_cast<size_t>(std::clamp(y0, 0.0f, static_cast<float>(h)));
        size_t xe = static_cast<size_t>(std::clamp(x1, 0.0f, static_cast<float>(w)));
        size_t ye = static_cast<size_t>(std::clamp(y1, 0.0f, static_cast<float>(h)));
        auto& values = frame.values();
        for (size_t y = ys; y < ye; ++y) {
            for (size_t x = xs; x < xe; ++x) {
                size_t i = (y * w + x) * 4;
                values[i + 0] = c.r;
                values[i + 1] = c.g;
                values[i + 2] = c.b;
                values[i + 3] = c.a;
            }
        }
    };

    fill(0.0f, 0.0f, static_cast<float>(w), static_cast<float>(h), clear);
    for (ModelId id : m_views) {
        auto* view = dynamic_cast<HeadlessView*>(registry().findAdaptor(id));
        if (!view || !view->visible() || !view->backgroundColor()) {
            continue;
        }
        glm::vec2 origin = view->position();
        glm::vec2 extent = view->size().value_or(
            glm::vec2(static_cast<float>(w), static_cast<float>(h)) - origin);
        fill(origin.x, origin.y, origin.x + extent.x, origin.y + extent.y, *view->backgroundColor());
    }

    ++m_frameCount;
    return frame;
}

} // namespace scenex::headless
