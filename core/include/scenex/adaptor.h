#pragma once

/**
 * @file adaptor.h
 * @brief Capability contracts a rendering backend implements
 *
 * One abstract class per model kind. Every synchronizable field has a
 * strongly typed setter; the engine maps field change events onto these
 * setters (see dispatch.h). A backend that cannot honor a value throws
 * UnsupportedCapabilityError from the setter: the engine reports it and
 * carries on with the next field.
 *
 * Adaptors never own their model. The registry keeps the model alive for
 * as long as the adaptor exists, so an adaptor may hold a reference to it.
 */

#include <scenex/evented_model.h>
#include <any>
#include <optional>
#include <string>

namespace scenex {

class AdaptorRegistry;

class Adaptor {
public:
    Adaptor(const EventedModel& model, AdaptorRegistry& registry)
        : m_modelId(model.id())
        , m_modelKind(model.kind())
        , m_registry(registry) {}
    virtual ~Adaptor() = default;

    Adaptor(const Adaptor&) = delete;
    Adaptor& operator=(const Adaptor&) = delete;

    ModelId modelId() const { return m_modelId; }
    ModelKind modelKind() const { return m_modelKind; }

    /// Backend handle of the native object (backend-specific type)
    virtual std::any native() const = 0;

    virtual void setVisible(bool visible) = 0;

    /// @name Update batching
    /// Between blockUpdates() and unblockUpdates() a backend may defer the
    /// external effects of setters and apply them together on unblock.
    /// @{
    virtual void blockUpdates() {}
    virtual void unblockUpdates() {}
    /// Recompute derived backend state (bounds, camera framing)
    virtual void forceUpdate() {}
    /// @}

protected:
    AdaptorRegistry& registry() const { return m_registry; }

private:
    ModelId m_modelId;
    ModelKind m_modelKind;
    AdaptorRegistry& m_registry;
};

/**
 * @brief Contract shared by every scene-graph node
 */
class NodeAdaptor : public Adaptor {
public:
    using Adaptor::Adaptor;

    virtual void setName(const std::optional<std::string>& name) = 0;
    virtual void setParent(const NodePtr& parent) = 0;
    virtual void setChildren(const NodeList& children) = 0;
    virtual void setInteractive(bool interactive) = 0;
    virtual void setOpacity(float opacity) = 0;
    virtual void setOrder(int order) = 0;
    virtual void setTransform(const Transform& transform) = 0;

    /// Attach the native object of `node` under this node's native object
    virtual void addNode(const NodePtr& node) = 0;

    void blockUpdates() override = 0;
    void unblockUpdates() override = 0;
    void forceUpdate() override = 0;
};

class CameraAdaptor : public NodeAdaptor {
public:
    using NodeAdaptor::NodeAdaptor;

    virtual void setType(scenex::CameraType type) = 0;
    virtual void setZoom(float zoom) = 0;
    virtual void setCenter(const glm::vec3& center) = 0;

    /// Fit the camera to its scene, keeping `margin` as a fraction of the view
    virtual void setRange(float margin) = 0;
};

class ImageAdaptor : public NodeAdaptor {
public:
    using NodeAdaptor::NodeAdaptor;

    virtual void setData(const ArrayPtr& data) = 0;
    virtual void setCmap(const Colormap& cmap) = 0;
    virtual void setClims(const std::optional<glm::vec2>& clims) = 0;
    virtual void setGamma(float gamma) = 0;
    virtual void setInterpolation(InterpolationMode mode) = 0;
};

class PointsAdaptor : public NodeAdaptor {
public:
    using NodeAdaptor::NodeAdaptor;

    virtual void setCoords(const PointList& coords) = 0;
    virtual void setSize(float size) = 0;
    virtual void setFaceColor(const Color& color) = 0;
    virtual void setEdgeColor(const Color& color) = 0;
    virtual void setEdgeWidth(float width) = 0;
    virtual void setSymbol(SymbolName symbol) = 0;
    virtual void setScaling(ScalingMode mode) = 0;
    virtual void setAntialias(float antialias) = 0;
};

class ViewAdaptor : public Adaptor {
public:
    using Adaptor::Adaptor;

    virtual void setScene(const ScenePtr& scene) = 0;
    virtual void setCamera(const CameraPtr& camera) = 0;
    virtual void setBlending(BlendMode mode) = 0;
    virtual void setBackgroundColor(const std::optional<Color>& color) = 0;

    /// @name Layout
    /// The engine calls setLayout() followed by each individual setter.
    /// @{
    virtual void setLayout(const scenex::Layout&) {}
    virtual void setPosition(const glm::vec2& position) = 0;
    virtual void setSize(const std::optional<glm::vec2>& size) = 0;
    virtual void setBorderWidth(float width) = 0;
    virtual void setBorderColor(const std::optional<Color>& color) = 0;
    virtual void setPadding(int padding) = 0;
    virtual void setMargin(int margin) = 0;
    /// @}
};

class CanvasAdaptor : public Adaptor {
public:
    using Adaptor::Adaptor;

    virtual void setWidth(int width) = 0;
    virtual void setHeight(int height) = 0;
    virtual void setBackgroundColor(const std::optional<Color>& color) = 0;
    virtual void setTitle(const std::string& title) = 0;

    /// Release the native surface
    virtual void close() = 0;

    /// Draw one frame and return it as a height x width x 4 RGBA array
    virtual Array render() = 0;

    virtual void addView(const ViewPtr& view) = 0;

    /// Optional: backends that manage views only through addView() ignore this
    virtual void setViews(const ViewList&) {}
};

/**
 * @brief Maps a model type to the contract its adaptor must implement
 */
template <typename ModelT> struct AdaptorContract;
template <> struct AdaptorContract<Scene>  { using type = NodeAdaptor; };
template <> struct AdaptorContract<Camera> { using type = CameraAdaptor; };
template <> struct AdaptorContract<Image>  { using type = ImageAdaptor; };
template <> struct AdaptorContract<Points> { using type = PointsAdaptor; };
template <> struct AdaptorContract<View>   { using type = ViewAdaptor; };
template <> struct AdaptorContract<Canvas> { using type = CanvasAdaptor; };

} // namespace scenex
