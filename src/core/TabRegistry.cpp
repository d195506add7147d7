#include "splitdeck/core/TabRegistry.hpp"

#include <iostream>

namespace sdeck {

TabRegistry::TabRegistry(std::size_t max_tabs)
    : max_tabs_(max_tabs) {}

RootTab* TabRegistry::createTab(PanelTree tree, std::string label) {
    if (!canCreateTab()) {
        std::cerr << "TabRegistry: Tab limit of " << max_tabs_ << " reached" << std::endl;
        return nullptr;
    }
    SDECK_INVARIANT(!tree.isEmpty(), "tab created with an empty tree");

    TabId id = next_id_++;
    RootTab& tab = tabs_[id];
    tab.id = id;
    tab.label = std::move(label);
    tab.tree = std::move(tree);
    tab.focused = tab.tree.firstPanel();
    return &tab;
}

bool TabRegistry::canCreateTab(std::size_t count) const {
    return max_tabs_ == 0 || tabs_.size() + count <= max_tabs_;
}

bool TabRegistry::destroyTab(TabId id) {
    return tabs_.erase(id) > 0;
}

RootTab* TabRegistry::find(TabId id) {
    auto it = tabs_.find(id);
    return it == tabs_.end() ? nullptr : &it->second;
}

const RootTab* TabRegistry::find(TabId id) const {
    auto it = tabs_.find(id);
    return it == tabs_.end() ? nullptr : &it->second;
}

std::vector<TabId> TabRegistry::tabIds() const {
    std::vector<TabId> ids;
    ids.reserve(tabs_.size());
    for (const auto& [id, tab] : tabs_) {
        ids.push_back(id);
    }
    return ids;
}

std::optional<SessionLocation> TabRegistry::findSession(SessionId session) const {
    for (const auto& [id, tab] : tabs_) {
        if (auto panel = tab.tree.findSession(session)) {
            return SessionLocation{id, *panel};
        }
    }
    return std::nullopt;
}

std::size_t TabRegistry::totalPanels() const {
    std::size_t total = 0;
    for (const auto& [id, tab] : tabs_) {
        total += tab.tree.panelCount();
    }
    return total;
}

}
