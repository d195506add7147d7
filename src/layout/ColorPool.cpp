#include "splitdeck/layout/ColorPool.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>

namespace sdeck {

ColorPool::ColorPool(std::size_t palette_size) {
    if (palette_size == 0 || palette_size > SPLIT_PALETTE.size()) {
        std::cerr << "ColorPool: Palette size " << palette_size << " out of range, using "
                  << layout_constants::DEFAULT_PALETTE_SIZE << std::endl;
        palette_size = layout_constants::DEFAULT_PALETTE_SIZE;
    }
    holders_.assign(palette_size, 0);
}

ColorId ColorPool::allocate() {
    // Lowest free slot first
    for (std::size_t i = 0; i < holders_.size(); ++i) {
        if (holders_[i] == 0) {
            holders_[i] = 1;
            return static_cast<ColorId>(i);
        }
    }

    // Palette exhausted: share the least used slot, lowest index on ties
    auto it = std::min_element(holders_.begin(), holders_.end());
    ++(*it);
    return static_cast<ColorId>(std::distance(holders_.begin(), it));
}

void ColorPool::release(ColorId color) {
    if (color < 0 || static_cast<std::size_t>(color) >= holders_.size()) {
        return;
    }
    if (holders_[color] > 0) {
        holders_[color]--;
    }
}

bool ColorPool::isAllocated(ColorId color) const {
    return holders(color) > 0;
}

int ColorPool::holders(ColorId color) const {
    if (color < 0 || static_cast<std::size_t>(color) >= holders_.size()) {
        return 0;
    }
    return holders_[color];
}

std::size_t ColorPool::allocatedCount() const {
    return static_cast<std::size_t>(
        std::count_if(holders_.begin(), holders_.end(), [](int h) { return h > 0; }));
}

std::optional<PaletteColor> ColorPool::rgb(ColorId color) {
    if (color < 0 || static_cast<std::size_t>(color) >= SPLIT_PALETTE.size()) {
        return std::nullopt;
    }
    return SPLIT_PALETTE[color];
}

std::string ColorPool::hex(ColorId color) {
    auto c = rgb(color);
    if (!c) return "";

    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", c->r, c->g, c->b);
    return buf;
}

}
