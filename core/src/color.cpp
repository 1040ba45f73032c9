#include <scenex/color.h>
#include <scenex/errors.h>
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace scenex {

Color Color::fromHex(const std::string& hex) {
    std::string s = hex;
    if (!s.empty() && s[0] == '#') {
        s = s.substr(1);
    }

    bool digitsOnly = std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
    if ((s.length() != 6 && s.length() != 8) || !digitsOnly) {
        throw ValidationError("Invalid hex color '" + hex + "'");
    }

    uint32_t val = static_cast<uint32_t>(std::stoul(s, nullptr, 16));
    if (s.length() == 8) {
        // 0xRRGGBBAA with a zero red channel is still four channels
        return Color(
            ((val >> 24) & 0xFF) / 255.0f,
            ((val >> 16) & 0xFF) / 255.0f,
            ((val >> 8) & 0xFF) / 255.0f,
            (val & 0xFF) / 255.0f
        );
    }
    return fromHex(val);
}

std::string Color::toHexString() const {
    auto byte = [](float v) {
        return static_cast<unsigned>(std::clamp(v, 0.0f, 1.0f) * 255.0f + 0.5f);
    };
    char buf[10];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X%02X", byte(r), byte(g), byte(b), byte(a));
    return buf;
}

} // namespace scenex
