#pragma once

/**
 * @file adaptors.h
 * @brief Headless adaptor for each model kind
 *
 * Capabilities this backend cannot honor throw UnsupportedCapabilityError:
 * interactive nodes, image gamma other than 1, bicubic interpolation (the
 * image falls back to linear), and view borders, padding and margins.
 */

#include <scenex/headless/node_impl.h>
#include <scenex/camera.h>
#include <scenex/canvas.h>
#include <scenex/image.h>
#include <scenex/points.h>
#include <scenex/scene.h>
#include <scenex/view.h>

namespace scenex::headless {

class HeadlessScene : public NodeImpl<NodeAdaptor> {
public:
    HeadlessScene(const Scene& scene, AdaptorRegistry& registry)
        : NodeImpl(scene, registry, "Scene") {}
};

/**
 * @brief Camera that frames the world bounds of its parent scene
 */
class HeadlessCamera : public NodeImpl<CameraAdaptor> {
public:
    HeadlessCamera(const Camera& camera, AdaptorRegistry& registry)
        : NodeImpl(camera, registry, "Camera")
        , m_camera(camera) {}

    void setType(CameraType type) override;
    void setZoom(float zoom) override;
    void setCenter(const glm::vec3& center) override;
    void setRange(float margin) override;
    void forceUpdate() override;

    /// Size of the framed region, nullopt until a scene has been framed
    std::optional<glm::vec2> framedSize() const { return m_framedSize; }

private:
    void frame();

    const Camera& m_camera;
    float m_margin = 0.1f;
    std::optional<glm::vec2> m_framedSize;
};

class HeadlessImage : public NodeImpl<ImageAdaptor> {
public:
    HeadlessImage(const Image& image, AdaptorRegistry& registry)
        : NodeImpl(image, registry, "Image") {}

    void setData(const ArrayPtr& data) override;
    void setCmap(const Colormap& cmap) override;
    void setClims(const std::optional<glm::vec2>& clims) override;
    void setGamma(float gamma) override;
    void setInterpolation(InterpolationMode mode) override;

private:
    void updateClims();

    ArrayPtr m_data;
    std::optional<glm::vec2> m_clims;
};

class HeadlessPoints : public NodeImpl<PointsAdaptor> {
public:
    HeadlessPoints(const Points& points, AdaptorRegistry& registry)
        : NodeImpl(points, registry, "Points") {}

    void setCoords(const PointList& coords) override;
    void setSize(float size) override;
    void setFaceColor(const Color& color) override;
    void setEdgeColor(const Color& color) override;
    void setEdgeWidth(float width) override;
    void setSymbol(SymbolName symbol) override;
    void setScaling(ScalingMode mode) override;
    void setAntialias(float antialias) override;
};

class HeadlessView : public ViewAdaptor {
public:
    HeadlessView(const View& view, AdaptorRegistry& registry);

    std::any native() const override { return m_native.get(); }
    NativeObject& object() const { return *m_native; }

    void setVisible(bool visible) override;
    void setScene(const ScenePtr& scene) override;
    void setCamera(const CameraPtr& camera) override;
    void setBlending(BlendMode mode) override;
    void setBackgroundColor(const std::optional<Color>& color) override;
    void setPosition(const glm::vec2& position) override;
    void setSize(const std::optional<glm::vec2>& size) override;
    void setBorderWidth(float width) override;
    void setBorderColor(const std::optional<Color>& color) override;
    void setPadding(int padding) override;
    void setMargin(int margin) override;

    void blockUpdates() override { m_native->block(); }
    void unblockUpdates() override { m_native->unblock(); }
    void forceUpdate() override { m_native->markForceUpdate(); }

    /// @name Render state
    /// @{
    bool visible() const { return m_visible; }
    const std::optional<Color>& backgroundColor() const { return m_backgroundColor; }
    const glm::vec2& position() const { return m_position; }
    const std::optional<glm::vec2>& size() const { return m_size; }
    ModelId sceneId() const { return m_sceneId; }
    ModelId cameraId() const { return m_cameraId; }
    /// @}

private:
    std::unique_ptr<NativeObject> m_native;
    bool m_visible = true;
    std::optional<Color> m_backgroundColor;
    glm::vec2 m_position{0.0f};
    std::optional<glm::vec2> m_size;
    ModelId m_sceneId = 0;
    ModelId m_cameraId = 0;
};

/**
 * @brief Canvas rendering view backgrounds into an RGBA array
 */
class HeadlessCanvas : public CanvasAdaptor {
public:
    HeadlessCanvas(const Canvas& canvas, AdaptorRegistry& registry);

    std::any native() const override { return m_native.get(); }
    NativeObject& object() const { return *m_native; }

    void setVisible(bool visible) override;
    void setWidth(int width) override;
    void setHeight(int height) override;
    void setBackgroundColor(const std::optional<Color>& color) override;
    void setTitle(const std::string& title) override;
    void close() override;
    Array render() override;
    void addView(const ViewPtr& view) override;
    void setViews(const ViewList& views) override;

    void blockUpdates() override { m_native->block(); }
    void unblockUpdates() override { m_native->unblock(); }

    bool closed() const { return m_closed; }
    size_t frameCount() const { return m_frameCount; }

private:
    std::unique_ptr<NativeObject> m_native;
    int m_width = 500;
    int m_height = 500;
    std::optional<Color> m_backgroundColor;
    std::vector<ModelId> m_views;
    bool m_closed = false;
    size_t m_frameCount = 0;
};

} // namespace scenex::headless
