#include <scenex/view.h>
#include <scenex/canvas.h>
#include <scenex/errors.h>

namespace scenex {

void View::initialize() {
    m_scene = make<Scene>();
    m_camera = make<Camera>();
    m_camera->setParent(m_scene);
}

void View::setScene(const ScenePtr& scene) {
    if (!scene) {
        throw ValidationError("view scene cannot be null");
    }
    if (!assign(m_scene, scene, Field::Scene)) {
        return;
    }
    m_camera->setParent(m_scene);
}

void View::setCamera(const CameraPtr& camera) {
    if (!camera) {
        throw ValidationError("view camera cannot be null");
    }
    if (camera == m_camera) {
        return;
    }
    if (m_camera->parent() == m_scene.get()) {
        m_camera->setParent(nullptr);
    }
    camera->setParent(m_scene);
    m_camera = camera;
    publish(Field::Camera, FieldValue(std::in_place_type<CameraPtr>, m_camera));
}

void View::setLayout(const scenex::Layout& layout) {
    assign(m_layout, layout, Field::Layout);
}

void View::setVisible(bool visible) {
    assign(m_visible, visible, Field::Visible);
}

void View::setBlending(BlendMode mode) {
    assign(m_blending, mode, Field::Blending);
}

void View::setBackgroundColor(const std::optional<Color>& color) {
    assign(m_backgroundColor, color, Field::BackgroundColor);
}

CanvasPtr View::canvas() {
    if (auto existing = m_canvas.lock()) {
        return existing;
    }
    auto created = make<Canvas>();
    created->insertView(sharedView(), false);
    m_ownedCanvas = created;
    return created;
}

CanvasPtr View::show() {
    auto c = canvas();
    c->show();
    return c;
}

std::vector<Field> View::fields() const {
    return {Field::Scene, Field::Camera, Field::Layout, Field::Visible,
            Field::Blending, Field::BackgroundColor};
}

FieldValue View::get(Field field) const {
    switch (field) {
        case Field::Scene:           return FieldValue(std::in_place_type<ScenePtr>, m_scene);
        case Field::Camera:          return FieldValue(std::in_place_type<CameraPtr>, m_camera);
        case Field::Layout:          return FieldValue(std::in_place_type<scenex::Layout>, m_layout);
        case Field::Visible:         return FieldValue(std::in_place_type<bool>, m_visible);
        case Field::Blending:        return FieldValue(std::in_place_type<BlendMode>, m_blending);
        case Field::BackgroundColor: return FieldValue(std::in_place_type<std::optional<Color>>, m_backgroundColor);
        default:
            throw ValidationError(std::string("View has no field '") + fieldName(field) + "'");
    }
}

} // namespace scenex
