#include "splitdeck/layout/ColorPool.hpp"
#include "splitdeck/layout/TabGroups.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace sdeck;

static void test_lowest_free_slot() {
    ColorPool pool(6);
    assert(pool.paletteSize() == 6);
    assert(pool.allocatedCount() == 0);

    assert(pool.allocate() == 0);
    assert(pool.allocate() == 1);
    assert(pool.allocate() == 2);
    assert(pool.allocatedCount() == 3);

    pool.release(1);
    assert(!pool.isAllocated(1));
    assert(pool.allocate() == 1);

    pool.release(0);
    pool.release(2);
    assert(pool.allocate() == 0);
    assert(pool.allocate() == 2);
    assert(pool.allocate() == 3);
}

static void test_exhaustion_shares_least_used() {
    ColorPool pool(3);
    assert(pool.allocate() == 0);
    assert(pool.allocate() == 1);
    assert(pool.allocate() == 2);

    // All slots held once: the lowest index is shared first
    assert(pool.allocate() == 0);
    assert(pool.holders(0) == 2);
    assert(pool.allocate() == 1);
    assert(pool.holders(1) == 2);

    // A shared slot stays allocated until its last holder lets go
    pool.release(0);
    assert(pool.isAllocated(0));
    pool.release(0);
    assert(!pool.isAllocated(0));
    assert(pool.allocatedCount() == 2);
}

static void test_release_is_forgiving() {
    ColorPool pool(2);
    pool.release(NoColor);
    pool.release(7);
    pool.release(0);
    assert(pool.allocatedCount() == 0);
    assert(pool.holders(0) == 0);
    assert(pool.holders(-3) == 0);
}

static void test_out_of_range_palette_falls_back() {
    ColorPool empty(0);
    assert(empty.paletteSize() == layout_constants::DEFAULT_PALETTE_SIZE);

    ColorPool huge(64);
    assert(huge.paletteSize() == layout_constants::DEFAULT_PALETTE_SIZE);

    ColorPool full(SPLIT_PALETTE.size());
    assert(full.paletteSize() == SPLIT_PALETTE.size());
}

static void test_palette_lookup() {
    auto blue = ColorPool::rgb(0);
    assert(blue.has_value());
    assert(std::string(blue->name) == "blue");
    assert(ColorPool::hex(0) == "#3584e4");
    assert(ColorPool::hex(5) == "#e01b24");

    assert(!ColorPool::rgb(NoColor).has_value());
    assert(!ColorPool::rgb(8).has_value());
    assert(ColorPool::hex(NoColor).empty());
}

static void test_tab_groups() {
    TabGroupManager groups(3);
    assert(groups.getOrAssignColor("prod") == 0);
    assert(groups.getOrAssignColor("staging") == 1);
    assert(groups.getOrAssignColor("prod") == 0);
    assert(groups.groupCount() == 2);

    assert(groups.getColor("staging").value() == 1);
    assert(!groups.getColor("dev").has_value());

    // Indices wrap around and are not recycled
    groups.removeGroup("staging");
    assert(groups.getOrAssignColor("dev") == 2);
    assert(groups.getOrAssignColor("qa") == 0);

    auto names = groups.groupNames();
    assert(names.size() == 3);
    assert(names[0] == "dev");
    assert(names[1] == "prod");
    assert(names[2] == "qa");
}

int main() {
    test_lowest_free_slot();
    test_exhaustion_shares_least_used();
    test_release_is_forgiving();
    test_out_of_range_palette_falls_back();
    test_palette_lookup();
    test_tab_groups();

    std::cout << "test_color_pool: all tests passed" << std::endl;
    return 0;
}
