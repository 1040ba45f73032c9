#pragma once

/**
 * @file camera.h
 * @brief Camera node
 *
 * A camera looks at its parent scene. Backends frame it on the world
 * bounding box of the scene, leaving `range` as a fractional margin.
 */

#include <scenex/node.h>

namespace scenex {

class Camera : public Node {
public:
    static constexpr ModelKind Kind = ModelKind::Camera;

    explicit Camera(ModelKey key) : Node(key) {}

    ModelKind kind() const override { return Kind; }

    scenex::CameraType type() const { return m_type; }
    void setType(scenex::CameraType type);

    float zoom() const { return m_zoom; }

    /// @throw ValidationError unless positive
    void setZoom(float zoom);

    const glm::vec3& center() const { return m_center; }
    void setCenter(const glm::vec3& center);

    /// Margin around the framed bounds, as a fraction in [0, 1)
    float range() const { return m_range; }

    /// @throw ValidationError outside [0, 1)
    void setRange(float range);

    std::vector<Field> fields() const override;
    FieldValue get(Field field) const override;

private:
    scenex::CameraType m_type = scenex::CameraType::PanZoom;
    float m_zoom = 1.0f;
    glm::vec3 m_center{0.0f};
    float m_range = 0.1f;
};

} // namespace scenex
