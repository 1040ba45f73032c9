#include <scenex/layout.h>
#include <scenex/errors.h>
#include <string>

namespace scenex {

Layout::Layout(glm::vec2 position,
               std::optional<glm::vec2> size,
               float borderWidth,
               std::optional<Color> borderColor,
               int padding,
               int margin)
    : m_position(position)
    , m_size(size)
    , m_borderWidth(borderWidth)
    , m_borderColor(borderColor)
    , m_padding(padding)
    , m_margin(margin) {
    if (m_size && (m_size->x <= 0.0f || m_size->y <= 0.0f)) {
        throw ValidationError("Layout size must be positive");
    }
    if (m_borderWidth < 0.0f) {
        throw ValidationError("Layout border_width must be >= 0, got " + std::to_string(m_borderWidth));
    }
    if (m_padding < 0 || m_margin < 0) {
        throw ValidationError("Layout padding and margin must be >= 0");
    }
}

} // namespace scenex
