#include <scenex/camera.h>
#include <scenex/errors.h>
#include <cmath>

namespace scenex {

void Camera::setType(scenex::CameraType type) {
    assign(m_type, type, Field::CameraType);
}

void Camera::setZoom(float zoom) {
    if (!std::isfinite(zoom) || zoom <= 0.0f) {
        throw ValidationError("camera zoom must be positive, got " + std::to_string(zoom));
    }
    assign(m_zoom, zoom, Field::Zoom);
}

void Camera::setCenter(const glm::vec3& center) {
    assign(m_center, center, Field::Center);
}

void Camera::setRange(float range) {
    if (!std::isfinite(range) || range < 0.0f || range >= 1.0f) {
        throw ValidationError("camera range must be in [0, 1), got " + std::to_string(range));
    }
    assign(m_range, range, Field::Range);
}

std::vector<Field> Camera::fields() const {
    auto list = Node::fields();
    list.insert(list.end(), {Field::CameraType, Field::Zoom, Field::Center, Field::Range});
    return list;
}

FieldValue Camera::get(Field field) const {
    switch (field) {
        case Field::CameraType: return FieldValue(std::in_place_type<scenex::CameraType>, m_type);
        case Field::Zoom:       return FieldValue(std::in_place_type<float>, m_zoom);
        case Field::Center:     return FieldValue(std::in_place_type<glm::vec3>, m_center);
        case Field::Range:      return FieldValue(std::in_place_type<float>, m_range);
        default:                return Node::get(field);
    }
}

} // namespace scenex
