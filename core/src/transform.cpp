#include <scenex/transform.h>
#include <scenex/errors.h>
#include <glm/gtc/matrix_transform.hpp>
#include <cmath>
#include <sstream>

namespace scenex {

Transform Transform::translation(const glm::vec3& offset) {
    return Transform(glm::translate(glm::mat4(1.0f), offset));
}

Transform Transform::scaling(const glm::vec3& factors) {
    return Transform(glm::scale(glm::mat4(1.0f), factors));
}

Transform Transform::rotation(float degrees, const glm::vec3& axis) {
    float len = glm::length(axis);
    if (len == 0.0f) {
        return Transform();
    }
    return Transform(glm::rotate(glm::mat4(1.0f), glm::radians(degrees), axis / len));
}

Transform Transform::chain(std::initializer_list<Transform> transforms) {
    return chain(std::vector<Transform>(transforms));
}

Transform Transform::chain(const std::vector<Transform>& transforms) {
    glm::mat4 result(1.0f);
    for (const auto& t : transforms) {
        result = result * t.m_matrix;
    }
    return Transform(result);
}

Transform Transform::inverse() const {
    float det = glm::determinant(m_matrix);
    if (!std::isfinite(det) || std::abs(det) < 1e-12f) {
        std::ostringstream msg;
        msg << "Transform is not invertible (determinant " << det << ")";
        throw SingularTransformError(msg.str());
    }
    return Transform(glm::inverse(m_matrix));
}

glm::vec3 Transform::map(const glm::vec3& point) const {
    glm::vec4 p = m_matrix * glm::vec4(point, 1.0f);
    if (p.w != 0.0f && p.w != 1.0f) {
        return glm::vec3(p) / p.w;
    }
    return glm::vec3(p);
}

glm::vec3 Transform::mapVector(const glm::vec3& vector) const {
    return glm::vec3(m_matrix * glm::vec4(vector, 0.0f));
}

float Transform::determinant() const {
    return glm::determinant(m_matrix);
}

bool Transform::isIdentity(float epsilon) const {
    return approxEqual(Transform(), epsilon);
}

bool Transform::approxEqual(const Transform& other, float epsilon) const {
    for (int c = 0; c < 4; ++c) {
        for (int r = 0; r < 4; ++r) {
            if (std::abs(m_matrix[c][r] - other.m_matrix[c][r]) > epsilon) {
                return false;
            }
        }
    }
    return true;
}

} // namespace scenex
