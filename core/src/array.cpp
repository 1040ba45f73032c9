#include <scenex/array.h>
#include <scenex/errors.h>
#include <algorithm>
#include <functional>
#include <numeric>

namespace scenex {

static size_t elementCount(const std::vector<size_t>& shape) {
    if (shape.empty()) {
        return 0;
    }
    return std::accumulate(shape.begin(), shape.end(), size_t{1}, std::multiplies<size_t>());
}

Array::Array(std::vector<size_t> shape, std::vector<float> values)
    : m_shape(std::move(shape)), m_values(std::move(values)) {
    if (elementCount(m_shape) != m_values.size()) {
        throw ValidationError("Array of shape " + shapeString() + " needs " +
                              std::to_string(elementCount(m_shape)) + " values, got " +
                              std::to_string(m_values.size()));
    }
}

Array Array::filled(std::vector<size_t> shape, float value) {
    size_t count = elementCount(shape);
    return Array(std::move(shape), std::vector<float>(count, value));
}

size_t Array::offset(std::initializer_list<size_t> index) const {
    if (index.size() != m_shape.size()) {
        throw std::out_of_range("Array index rank " + std::to_string(index.size()) +
                                " does not match array rank " + std::to_string(m_shape.size()));
    }
    size_t flat = 0;
    size_t axis = 0;
    for (size_t i : index) {
        if (i >= m_shape[axis]) {
            throw std::out_of_range("Array index out of range on axis " + std::to_string(axis));
        }
        flat = flat * m_shape[axis] + i;
        ++axis;
    }
    return flat;
}

float Array::at(std::initializer_list<size_t> index) const {
    return m_values[offset(index)];
}

float Array::min() const {
    return m_values.empty() ? 0.0f : *std::min_element(m_values.begin(), m_values.end());
}

float Array::max() const {
    return m_values.empty() ? 0.0f : *std::max_element(m_values.begin(), m_values.end());
}

std::string Array::shapeString() const {
    std::string s;
    for (size_t i = 0; i < m_shape.size(); ++i) {
        if (i > 0) s += "x";
        s += std::to_string(m_shape[i]);
    }
    return s.empty() ? "()" : s;
}

} // namespace scenex
