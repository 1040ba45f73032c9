#pragma once

/**
 * @file transform.h
 * @brief Affine transform from a node's local frame to its parent's frame
 *
 * Transform is an immutable value wrapping a glm::mat4 (column-major).
 * Composition follows matrix multiplication order: in `a * b` the
 * transform `b` is applied to a point first.
 *
 * @par Example
 * @code
 * Transform t = Transform::translation({10, 0, 0}).scaled({2, 2, 1});
 * glm::vec3 p = t.map({1, 1, 0});          // scaled first, then translated
 * Transform back = t.inverse();            // throws SingularTransformError if det == 0
 * @endcode
 */

#include <glm/glm.hpp>
#include <initializer_list>
#include <vector>

namespace scenex {

class Transform {
public:
    /// Identity transform
    Transform() : m_matrix(1.0f) {}

    /// Wrap an existing matrix
    explicit Transform(const glm::mat4& matrix) : m_matrix(matrix) {}

    // -------------------------------------------------------------------------
    /// @name Factories
    /// @{

    static Transform translation(const glm::vec3& offset);
    static Transform scaling(const glm::vec3& factors);

    /// Rotation by `degrees` around `axis` (normalized internally)
    static Transform rotation(float degrees, const glm::vec3& axis);

    /**
     * @brief Compose a sequence of transforms into one
     * @param transforms Transforms multiplied left to right
     * @return chain({A, B, C}) == A * B * C, so C is applied first
     *
     * An empty sequence yields identity and a single transform is returned
     * unchanged.
     */
    static Transform chain(std::initializer_list<Transform> transforms);
    static Transform chain(const std::vector<Transform>& transforms);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Composition
    /// @{

    /// Apply `other` after this transform
    Transform then(const Transform& other) const { return other * (*this); }

    Transform translated(const glm::vec3& offset) const { return then(translation(offset)); }
    Transform scaled(const glm::vec3& factors) const { return then(scaling(factors)); }
    Transform rotated(float degrees, const glm::vec3& axis) const { return then(rotation(degrees, axis)); }

    /// @throw SingularTransformError when the matrix is not invertible
    Transform inverse() const;

    Transform operator*(const Transform& rhs) const { return Transform(m_matrix * rhs.m_matrix); }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Access
    /// @{

    const glm::mat4& matrix() const { return m_matrix; }

    /// Map a point (w = 1)
    glm::vec3 map(const glm::vec3& point) const;

    /// Map a direction (w = 0), translation ignored
    glm::vec3 mapVector(const glm::vec3& vector) const;

    glm::vec3 translationPart() const { return glm::vec3(m_matrix[3]); }

    float determinant() const;
    bool isIdentity(float epsilon = 1e-6f) const;
    bool approxEqual(const Transform& other, float epsilon = 1e-5f) const;

    /// @}

    bool operator==(const Transform& other) const { return m_matrix == other.m_matrix; }
    bool operator!=(const Transform& other) const { return !(*this == other); }

private:
    glm::mat4 m_matrix;
};

} // namespace scenex
