#include "splitdeck/layout/TabGroups.hpp"

#include <algorithm>

namespace sdeck {

TabGroupManager::TabGroupManager(std::size_t palette_size)
    : palette_size_(palette_size == 0 ? layout_constants::DEFAULT_PALETTE_SIZE : palette_size) {}

ColorId TabGroupManager::getOrAssignColor(const std::string& group_name) {
    auto it = groups_.find(group_name);
    if (it != groups_.end()) {
        return it->second;
    }

    ColorId color = static_cast<ColorId>(next_index_ % palette_size_);
    next_index_++;
    groups_.emplace(group_name, color);
    return color;
}

std::optional<ColorId> TabGroupManager::getColor(const std::string& group_name) const {
    auto it = groups_.find(group_name);
    if (it == groups_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void TabGroupManager::removeGroup(const std::string& group_name) {
    groups_.erase(group_name);
}

std::vector<std::string> TabGroupManager::groupNames() const {
    std::vector<std::string> names;
    names.reserve(groups_.size());
    for (const auto& [name, color] : groups_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}
