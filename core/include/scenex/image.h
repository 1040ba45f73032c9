#pragma once

/**
 * @file image.h
 * @brief Image (or volume) node
 *
 * Data is a 2D (HxW), 3D (HxWxC or DxHxW) or 4D array. Clims are the
 * color limits; nullopt means the backend derives them from the data.
 */

#include <scenex/node.h>

namespace scenex {

class Image : public Node {
public:
    static constexpr ModelKind Kind = ModelKind::Image;

    explicit Image(ModelKey key);

    ModelKind kind() const override { return Kind; }

    const ArrayPtr& data() const { return m_data; }

    /// @throw ValidationError for a null array or a rank outside 2..4
    void setData(ArrayPtr data);
    void setData(Array data) { setData(std::make_shared<const Array>(std::move(data))); }

    const Colormap& cmap() const { return m_cmap; }

    /// @throw ValidationError for an empty colormap name
    void setCmap(const Colormap& cmap);

    const std::optional<glm::vec2>& clims() const { return m_clims; }

    /// @throw ValidationError unless min < max
    void setClims(const std::optional<glm::vec2>& clims);

    float gamma() const { return m_gamma; }

    /// @throw ValidationError unless positive
    void setGamma(float gamma);

    InterpolationMode interpolation() const { return m_interpolation; }
    void setInterpolation(InterpolationMode mode);

    std::vector<Field> fields() const override;
    FieldValue get(Field field) const override;

private:
    ArrayPtr m_data;
    Colormap m_cmap;
    std::optional<glm::vec2> m_clims;
    float m_gamma = 1.0f;
    InterpolationMode m_interpolation = InterpolationMode::Nearest;
};

} // namespace scenex
