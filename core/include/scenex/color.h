#pragma once

/**
 * @file color.h
 * @brief RGBA color value and named colormap reference
 *
 * Color implicitly converts to and from glm::vec4 so model fields can be
 * handed straight to backend code. Colormap only names a colormap; the
 * lookup table itself belongs to the backend.
 *
 * @par Example
 * @code
 * points->setFaceColor(Color::Coral);
 * view->setBackgroundColor(Color::fromHex("#202020"));
 * image->setCmap(Colormap("viridis"));
 * @endcode
 */

#include <glm/glm.hpp>
#include <utility>
#include <cstdint>
#include <string>

namespace scenex {

/**
 * @brief RGBA color with components in 0-1 range
 */
class Color {
public:
    float r, g, b, a;

    /// Opaque white
    constexpr Color() : r(1.0f), g(1.0f), b(1.0f), a(1.0f) {}

    constexpr Color(float r, float g, float b, float a = 1.0f)
        : r(r), g(g), b(b), a(a) {}

    constexpr Color(const glm::vec4& v)
        : r(v.r), g(v.g), b(v.b), a(v.a) {}

    constexpr operator glm::vec4() const {
        return glm::vec4(r, g, b, a);
    }

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /**
     * @brief Create color from hex integer (0xRRGGBB or 0xRRGGBBAA)
     */
    static constexpr Color fromHex(uint32_t hex) {
        if (hex > 0xFFFFFF) {
            return Color(
                ((hex >> 24) & 0xFF) / 255.0f,
                ((hex >> 16) & 0xFF) / 255.0f,
                ((hex >> 8) & 0xFF) / 255.0f,
                (hex & 0xFF) / 255.0f
            );
        }
        return Color(
            ((hex >> 16) & 0xFF) / 255.0f,
            ((hex >> 8) & 0xFF) / 255.0f,
            (hex & 0xFF) / 255.0f,
            1.0f
        );
    }

    /**
     * @brief Create color from hex string ("#RRGGBB", "#RRGGBBAA", with or without '#')
     * @throw ValidationError on malformed input
     */
    static Color fromHex(const std::string& hex);

    // =========================================================================
    // Manipulation
    // =========================================================================

    constexpr Color withAlpha(float newAlpha) const {
        return Color(r, g, b, newAlpha);
    }

    /// "#RRGGBBAA"
    std::string toHexString() const;

    const float* data() const { return &r; }

    constexpr bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    constexpr bool operator!=(const Color& other) const {
        return !(*this == other);
    }

    // =========================================================================
    // Named Colors
    // =========================================================================

    static const Color Transparent;
    static const Color Black;
    static const Color White;
    static const Color Gray;
    static const Color Red;
    static const Color Green;
    static const Color Blue;
    static const Color Coral;
};

inline constexpr Color Color::Transparent {0.000f, 0.000f, 0.000f, 0.000f};
inline constexpr Color Color::Black       {0.000f, 0.000f, 0.000f};
inline constexpr Color Color::White       {1.000f, 1.000f, 1.000f};
inline constexpr Color Color::Gray        {0.502f, 0.502f, 0.502f};
inline constexpr Color Color::Red         {1.000f, 0.000f, 0.000f};
inline constexpr Color Color::Green       {0.000f, 0.502f, 0.000f};
inline constexpr Color Color::Blue        {0.000f, 0.000f, 1.000f};
inline constexpr Color Color::Coral       {1.000f, 0.498f, 0.314f};

/**
 * @brief Reference to a named colormap ("gray", "viridis", ...)
 */
struct Colormap {
    std::string name = "gray";

    Colormap() = default;
    Colormap(std::string n) : name(std::move(n)) {}
    Colormap(const char* n) : name(n) {}

    bool operator==(const Colormap& other) const { return name == other.name; }
    bool operator!=(const Colormap& other) const { return !(*this == other); }
};

} // namespace scenex
