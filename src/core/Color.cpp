#include "routegraph/core/Color.h"

#include <cctype>

namespace routegraph {

namespace {
    int hexDigit(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    }
}

std::string Color::toHex() const {
    static constexpr char DIGITS[] = "0123456789ABCDEF";
    std::string out = "#";
    for (uint8_t component : {r, g, b}) {
        out += DIGITS[component >> 4];
        out += DIGITS[component & 0x0F];
    }
    return out;
}

std::optional<Color> Color::fromHex(const std::string& hex) {
    size_t start = (!hex.empty() && hex[0] == '#') ? 1 : 0;
    if (hex.size() - start != 6) {
        return std::nullopt;
    }

    uint32_t rgb = 0;
    for (size_t i = start; i < hex.size(); ++i) {
        int digit = hexDigit(hex[i]);
        if (digit < 0) {
            return std::nullopt;
        }
        rgb = (rgb << 4) | static_cast<uint32_t>(digit);
    }
    return Color::fromRgb(rgb);
}

}  // namespace routegraph
