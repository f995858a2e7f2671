#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace routegraph {

/// 24-bit RGB color
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    constexpr Color() = default;
    constexpr Color(uint8_t r_, uint8_t g_, uint8_t b_) : r(r_), g(g_), b(b_) {}

    /// Build from 0xRRGGBB
    static constexpr Color fromRgb(uint32_t rgb) {
        return {static_cast<uint8_t>((rgb >> 16) & 0xFF),
                static_cast<uint8_t>((rgb >> 8) & 0xFF),
                static_cast<uint8_t>(rgb & 0xFF)};
    }

    constexpr uint32_t toRgb() const {
        return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;
    }

    /// "#RRGGBB" (upper-case hex)
    std::string toHex() const;

    /// Parse "#RRGGBB" or "RRGGBB" (case-insensitive). Returns nullopt on malformed input.
    static std::optional<Color> fromHex(const std::string& hex);

    constexpr bool operator==(const Color& o) const { return r == o.r && g == o.g && b == o.b; }
    constexpr bool operator!=(const Color& o) const { return !(*this == o); }
};

namespace colors {

/// Root node fill
constexpr Color ROOT = Color::fromRgb(0x2563EB);

/// Edges leaving the root
constexpr Color NEUTRAL_EDGE = Color::fromRgb(0x1F2937);

/// Branch colors handed to the root's direct children.
/// ROOT is deliberately absent so a branch never looks like the root.
constexpr std::array<Color, 7> BRANCH_PALETTE = {
    Color::fromRgb(0x1ABC9C),
    Color::fromRgb(0x2ECC71),
    Color::fromRgb(0x3498DB),
    Color::fromRgb(0x9B59B6),
    Color::fromRgb(0xF1C40F),
    Color::fromRgb(0xE67E22),
    Color::fromRgb(0xE74C3C),
};

/// Palette entry for the n-th child of the root
constexpr Color branchColor(size_t siblingIndex) {
    return BRANCH_PALETTE[siblingIndex % BRANCH_PALETTE.size()];
}

}  // namespace colors

}  // namespace routegraph
