#pragma once

/**
 * @file layout.h
 * @brief Placement of a view on its canvas
 *
 * Layout is an immutable value: it is validated once at construction and
 * replaced wholesale, never edited in place.
 */

#include <scenex/color.h>
#include <glm/glm.hpp>
#include <optional>

namespace scenex {

class Layout {
public:
    /// Full-canvas layout with no border, padding or margin
    Layout() = default;

    /**
     * @brief Construct a validated layout
     * @param position Top-left corner in canvas pixels
     * @param size Extent in pixels, or nullopt to fill the canvas
     * @param borderWidth Border thickness (>= 0)
     * @param borderColor Border color, nullopt for none
     * @param padding Inner spacing in pixels (>= 0)
     * @param margin Outer spacing in pixels (>= 0)
     * @throw ValidationError on negative widths or a non-positive size
     */
    Layout(glm::vec2 position,
           std::optional<glm::vec2> size,
           float borderWidth = 0.0f,
           std::optional<Color> borderColor = std::nullopt,
           int padding = 0,
           int margin = 0);

    const glm::vec2& position() const { return m_position; }
    const std::optional<glm::vec2>& size() const { return m_size; }
    float borderWidth() const { return m_borderWidth; }
    const std::optional<Color>& borderColor() const { return m_borderColor; }
    int padding() const { return m_padding; }
    int margin() const { return m_margin; }

    bool operator==(const Layout& other) const {
        return m_position == other.m_position && m_size == other.m_size &&
               m_borderWidth == other.m_borderWidth && m_borderColor == other.m_borderColor &&
               m_padding == other.m_padding && m_margin == other.m_margin;
    }
    bool operator!=(const Layout& other) const { return !(*this == other); }

private:
    glm::vec2 m_position{0.0f, 0.0f};
    std::optional<glm::vec2> m_size;
    float m_borderWidth = 0.0f;
    std::optional<Color> m_borderColor;
    int m_padding = 0;
    int m_margin = 0;
};

} // namespace scenex
