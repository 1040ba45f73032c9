#pragma once

/**
 * @file view.h
 * @brief A scene seen through a camera, placed on a canvas
 *
 * A View always owns one Scene and one Camera; both are created with the
 * view and the camera is parented to the scene. A canvas the view created
 * itself is owned by the view; a canvas it was added to owns the view.
 */

#include <scenex/camera.h>
#include <scenex/evented_model.h>
#include <scenex/scene.h>

namespace scenex {

class View : public EventedModel {
public:
    static constexpr ModelKind Kind = ModelKind::View;

    explicit View(ModelKey key) : EventedModel(key) {}

    ModelKind kind() const override { return Kind; }

    const ScenePtr& scene() const { return m_scene; }

    /**
     * @brief Replace the scene, moving the current camera into it
     * @throw ValidationError if `scene` is null
     */
    void setScene(const ScenePtr& scene);

    const CameraPtr& camera() const { return m_camera; }

    /**
     * @brief Replace the camera and parent it to the current scene
     *
     * The previous camera is detached from the scene.
     *
     * @throw ValidationError if `camera` is null
     */
    void setCamera(const CameraPtr& camera);

    const scenex::Layout& layout() const { return m_layout; }
    void setLayout(const scenex::Layout& layout);

    bool visible() const { return m_visible; }
    void setVisible(bool visible);

    BlendMode blending() const { return m_blending; }
    void setBlending(BlendMode mode);

    const std::optional<Color>& backgroundColor() const { return m_backgroundColor; }
    void setBackgroundColor(const std::optional<Color>& color);

    /// @name Canvas
    /// @{

    /// Canvas this view is registered with, if it is still alive
    CanvasPtr currentCanvas() const { return m_canvas.lock(); }

    /**
     * @brief Canvas this view is registered with
     *
     * When none is alive a new canvas is created, the view is added to it
     * and keeps it alive, so later calls return the same canvas.
     */
    CanvasPtr canvas();

    /// Show the canvas (creating it if needed) and return it
    CanvasPtr show();

    /// @}

    ViewPtr sharedView() { return std::static_pointer_cast<View>(shared_from_this()); }

    std::vector<Field> fields() const override;
    FieldValue get(Field field) const override;

protected:
    void initialize() override;

private:
    friend class Canvas;

    ScenePtr m_scene;
    CameraPtr m_camera;
    scenex::Layout m_layout;
    bool m_visible = true;
    BlendMode m_blending = BlendMode::Default;
    std::optional<Color> m_backgroundColor;

    std::weak_ptr<Canvas> m_canvas;
    CanvasPtr m_ownedCanvas;
};

} // namespace scenex
