#pragma once

/**
 * @file ColorPool.hpp
 * @brief Palette slot allocation for split containers
 *
 * Every live split container holds one palette slot so that nested splits
 * can be told apart by border color. Allocation always hands out the
 * lowest free slot; once the palette is exhausted slots are shared,
 * starting with the least used one.
 */

#include "splitdeck/layout/LayoutTypes.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sdeck {

struct PaletteColor {
    std::uint8_t r, g, b;
    const char* name;
};

constexpr std::array<PaletteColor, 8> SPLIT_PALETTE = {{
    {0x35, 0x84, 0xe4, "blue"},
    {0x2e, 0xc2, 0x7e, "green"},
    {0xff, 0x78, 0x00, "orange"},
    {0x91, 0x41, 0xac, "purple"},
    {0x00, 0xb4, 0xd8, "cyan"},
    {0xe0, 0x1b, 0x24, "red"},
    {0xf6, 0xd3, 0x2d, "yellow"},
    {0xe6, 0x61, 0x98, "pink"},
}};

class ColorPool {
public:
    explicit ColorPool(std::size_t palette_size = layout_constants::DEFAULT_PALETTE_SIZE);

    ColorId allocate();

    void release(ColorId color);

    bool isAllocated(ColorId color) const;

    int holders(ColorId color) const;

    std::size_t allocatedCount() const;

    std::size_t paletteSize() const { return holders_.size(); }

    static std::optional<PaletteColor> rgb(ColorId color);

    static std::string hex(ColorId color);

private:
    // live holders per slot
    std::vector<int> holders_;
};

}
