#pragma once

/**
 * @file TabRegistry.hpp
 * @brief Ownership of Root_Tabs and their panel trees
 *
 * Every tab owns exactly one PanelTree. The registry routes by tab id and
 * answers process-wide questions such as which panel holds a session.
 */

#include "splitdeck/layout/PanelTree.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sdeck {

struct RootTab {
    TabId id{NoTab};
    std::string label;
    PanelTree tree;
    PanelId focused{NoPanel};
    std::string group;
};

struct SessionLocation {
    TabId tab{NoTab};
    PanelId panel{NoPanel};
};

class TabRegistry {
public:
    using State = std::map<TabId, RootTab>;

    explicit TabRegistry(std::size_t max_tabs = 0);

    TabRegistry(const TabRegistry&) = delete;
    TabRegistry& operator=(const TabRegistry&) = delete;

    // nullptr when the registry is at capacity
    RootTab* createTab(PanelTree tree, std::string label);

    bool canCreateTab(std::size_t count = 1) const;

    bool destroyTab(TabId id);

    RootTab* find(TabId id);
    const RootTab* find(TabId id) const;

    std::vector<TabId> tabIds() const;
    std::size_t size() const { return tabs_.size(); }
    bool empty() const { return tabs_.empty(); }

    std::optional<SessionLocation> findSession(SessionId session) const;

    std::size_t totalPanels() const;

    std::size_t maxTabs() const { return max_tabs_; }

    const State& tabs() const { return tabs_; }

    State captureState() const { return tabs_; }
    void restoreState(State state) { tabs_ = std::move(state); }

private:
    State tabs_;
    TabId next_id_{1};
    std::size_t max_tabs_;
};

}
