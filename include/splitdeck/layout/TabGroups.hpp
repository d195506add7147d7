#pragma once

#include "splitdeck/layout/LayoutTypes.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sdeck {

/**
 * @brief Assigns palette colors to named tab groups
 *
 * A group keeps its color for the lifetime of the manager. Indices are
 * handed out sequentially and wrap around the palette; removing a group
 * does not recycle its index.
 */
class TabGroupManager {
public:
    explicit TabGroupManager(std::size_t palette_size);

    ColorId getOrAssignColor(const std::string& group_name);

    std::optional<ColorId> getColor(const std::string& group_name) const;

    void removeGroup(const std::string& group_name);

    std::vector<std::string> groupNames() const;

    std::size_t groupCount() const { return groups_.size(); }

private:
    std::unordered_map<std::string, ColorId> groups_;
    std::size_t next_index_{0};
    std::size_t palette_size_;
};

}
