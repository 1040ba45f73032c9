#include <scenex/image.h>
#include <scenex/errors.h>
#include <cmath>

namespace scenex {

Image::Image(ModelKey key)
    : Node(key)
    , m_data(std::make_shared<const Array>(Array::zeros({0, 0}))) {}

void Image::setData(ArrayPtr data) {
    if (!data) {
        throw ValidationError("image data cannot be null");
    }
    if (data->rank() < 2 || data->rank() > 4) {
        throw ValidationError("image data must have 2 to 4 dimensions, got shape " + data->shapeString());
    }
    // Equal contents count as no change even through a different array
    if (m_data == data || *m_data == *data) {
        return;
    }
    m_data = std::move(data);
    publish(Field::Data, FieldValue(std::in_place_type<ArrayPtr>, m_data));
}

void Image::setCmap(const Colormap& cmap) {
    if (cmap.name.empty()) {
        throw ValidationError("colormap name cannot be empty");
    }
    assign(m_cmap, cmap, Field::Cmap);
}

void Image::setClims(const std::optional<glm::vec2>& clims) {
    if (clims && !(clims->x < clims->y)) {
        throw ValidationError("clims must satisfy min < max");
    }
    assign(m_clims, clims, Field::Clims);
}

void Image::setGamma(float gamma) {
    if (!std::isfinite(gamma) || gamma <= 0.0f) {
        throw ValidationError("gamma must be positive, got " + std::to_string(gamma));
    }
    assign(m_gamma, gamma, Field::Gamma);
}

void Image::setInterpolation(InterpolationMode mode) {
    assign(m_interpolation, mode, Field::Interpolation);
}

std::vector<Field> Image::fields() const {
    auto list = Node::fields();
    list.insert(list.end(), {Field::Data, Field::Cmap, Field::Clims, Field::Gamma, Field::Interpolation});
    return list;
}

FieldValue Image::get(Field field) const {
    switch (field) {
        case Field::Data:          return FieldValue(std::in_place_type<ArrayPtr>, m_data);
        case Field::Cmap:          return FieldValue(std::in_place_type<Colormap>, m_cmap);
        case Field::Clims:         return FieldValue(std::in_place_type<std::optional<glm::vec2>>, m_clims);
        case Field::Gamma:         return FieldValue(std::in_place_type<float>, m_gamma);
        case Field::Interpolation: return FieldValue(std::in_place_type<InterpolationMode>, m_interpolation);
        default:                   return Node::get(field);
    }
}

} // namespace scenex
