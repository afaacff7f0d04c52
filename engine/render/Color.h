// Simple color helper.
#pragma once

#include <cstdint>

namespace Surge {

struct Color {
    unsigned char r{0};
    unsigned char g{0};
    unsigned char b{0};
    unsigned char a{255};
};

// Unpacks 0xRRGGBB as used by the archetype tables.
inline Color colorFromHex(std::uint32_t rgb) {
    return Color{static_cast<unsigned char>((rgb >> 16) & 0xFF), static_cast<unsigned char>((rgb >> 8) & 0xFF),
                 static_cast<unsigned char>(rgb & 0xFF), 255};
}

}  // namespace Surge
