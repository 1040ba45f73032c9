#pragma once

/**
 * @file array.h
 * @brief Dense N-dimensional float array used for image data and rendered frames
 *
 * Values are stored row-major (last index varies fastest), matching the
 * layout backends expect for texture uploads.
 */

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace scenex {

class Array {
public:
    /// Empty array (rank 0, no values)
    Array() = default;

    /**
     * @brief Construct from shape and values
     * @throw ValidationError if values.size() does not match the shape
     */
    Array(std::vector<size_t> shape, std::vector<float> values);

    /// Array of the given shape filled with `value`
    static Array filled(std::vector<size_t> shape, float value);
    static Array zeros(std::vector<size_t> shape) { return filled(std::move(shape), 0.0f); }

    const std::vector<size_t>& shape() const { return m_shape; }
    const std::vector<float>& values() const { return m_values; }
    std::vector<float>& values() { return m_values; }

    size_t rank() const { return m_shape.size(); }
    size_t size() const { return m_values.size(); }
    bool empty() const { return m_values.empty(); }

    /// Extent of dimension `axis` (0 when out of range)
    size_t dim(size_t axis) const { return axis < m_shape.size() ? m_shape[axis] : 0; }

    /// Element access by multi-index
    float at(std::initializer_list<size_t> index) const;

    float min() const;
    float max() const;

    /// "10x10x3"
    std::string shapeString() const;

    bool operator==(const Array& other) const {
        return m_shape == other.m_shape && m_values == other.m_values;
    }
    bool operator!=(const Array& other) const { return !(*this == other); }

private:
    size_t offset(std::initializer_list<size_t> index) const;

    std::vector<size_t> m_shape;
    std::vector<float> m_values;
};

using ArrayPtr = std::shared_ptr<const Array>;

} // namespace scenex
