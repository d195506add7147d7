#pragma once

/**
 * @file DragDropCoordinator.hpp
 * @brief Turns a (drag source, drop target) pair into one engine mutation
 *
 * | Source   | Empty target                  | Occupied target                         |
 * |----------|-------------------------------|-----------------------------------------|
 * | RootTab  | move, remove source panel     | replace, evictee gets a new tab,        |
 * |          |                               | remove source panel                     |
 * | Panel    | move, remove source panel     | swap sessions                           |
 * | Sidebar  | instantiate, place            | instantiate, place, evictee gets a new  |
 * |          |                               | tab                                     |
 *
 * A RootTab source drags the session of the tab's focused panel. Dropping
 * a panel onto itself is a no-op. Every drop is all-or-nothing.
 */

#include "splitdeck/core/SplitLayoutEngine.hpp"

#include <optional>
#include <variant>

namespace sdeck {

struct RootTabSource {
    TabId tab{NoTab};
};

struct PanelSource {
    TabId tab{NoTab};
    PanelId panel{NoPanel};
};

struct SidebarSource {
    ConnectionSpec spec;
};

using DragSource = std::variant<RootTabSource, PanelSource, SidebarSource>;

struct EmptyPanelTarget {
    TabId tab{NoTab};
    PanelId panel{NoPanel};
};

struct OccupiedPanelTarget {
    TabId tab{NoTab};
    PanelId panel{NoPanel};
};

using DropTarget = std::variant<EmptyPanelTarget, OccupiedPanelTarget>;

enum class DropEffect {
    NoOp,
    Placed,
    Swapped,
    Evicted
};

const char* toString(DropEffect effect);

struct DropOutcome {
    DropEffect effect{DropEffect::NoOp};
    TabId target_tab{NoTab};
    PanelId target_panel{NoPanel};

    // Session now shown in the target panel
    std::optional<SessionHandle> placed;

    // Displaced occupant and the tab it was re-homed in
    std::optional<SessionHandle> evicted;
    TabId evicted_to{NoTab};

    bool source_tab_destroyed{false};
};

struct PanelRef {
    TabId tab{NoTab};
    PanelId panel{NoPanel};

    bool operator==(const PanelRef& other) const {
        return tab == other.tab && panel == other.panel;
    }
};

class DragDropCoordinator {
public:
    explicit DragDropCoordinator(SplitLayoutEngine& engine);

    Result<DropOutcome> resolveDrop(const DragSource& source, const DropTarget& target);

    /**
     * @brief Dry run used for drop highlighting
     *
     * Performs the same validation as resolveDrop(), including tab capacity
     * for evictions, without touching any tree or calling the session layer.
     */
    Status canDrop(const DragSource& source, const DropTarget& target) const;

    // Classifies a panel by its current state
    Result<DropTarget> targetFor(TabId tab, PanelId panel) const;

private:
    SplitLayoutEngine& engine_;

    Result<PanelRef> checkTarget(const DropTarget& target) const;
    Result<PanelRef> checkSource(const DragSource& source) const;

    Result<DropOutcome> movePanel(const PanelRef& from, const PanelRef& to);
    Result<DropOutcome> swapPanels(const PanelRef& from, const PanelRef& to);
    Result<DropOutcome> replaceFromTab(const PanelRef& from, const PanelRef& to);
    Result<DropOutcome> placeFromSidebar(const ConnectionSpec& spec, const PanelRef& to,
                                         bool occupied);

    Result<SessionHandle> instantiate(const ConnectionSpec& spec);

    void focusTarget(const PanelRef& to);
};

}
