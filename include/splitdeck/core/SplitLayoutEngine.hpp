#pragma once

/**
 * @file SplitLayoutEngine.hpp
 * @brief Operation surface over all tab layouts
 *
 * Every mutating operation is synchronous and all-or-nothing: it either
 * commits completely and then notifies listeners, or returns an error and
 * leaves every tab, tree and palette slot exactly as it found them.
 * Operations must not be re-entered from a lifecycle callback or a
 * listener while they run.
 */

#include "splitdeck/core/LayoutEvents.hpp"
#include "splitdeck/core/SessionLifecycle.hpp"
#include "splitdeck/core/TabRegistry.hpp"
#include "splitdeck/layout/ColorPool.hpp"
#include "splitdeck/layout/PanelTree.hpp"
#include "splitdeck/layout/TabGroups.hpp"
#include "splitdeck/layout/TreeSnapshot.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sdeck {

struct EngineConfig {
    double default_ratio{layout_constants::DEFAULT_RATIO};
    double min_ratio{layout_constants::DEFAULT_MIN_RATIO};
    std::size_t palette_size{layout_constants::DEFAULT_PALETTE_SIZE};
    std::size_t max_tabs{0};
    bool verbose{false};
};

struct TabSummary {
    TabId id{NoTab};
    std::string label;
    std::string group;
    std::size_t panel_count{0};
    PanelId focused{NoPanel};
    bool split{false};
};

class SplitLayoutEngine {
public:
    explicit SplitLayoutEngine(ISessionLifecycle& sessions, EngineConfig config = {});

    SplitLayoutEngine(const SplitLayoutEngine&) = delete;
    SplitLayoutEngine& operator=(const SplitLayoutEngine&) = delete;

    // ========================================================================
    // Tabs
    // ========================================================================

    Result<TabId> openTab(SessionHandle session);

    Result<TabId> openConnection(const ConnectionSpec& spec);

    /**
     * @brief Terminates every session of the tab and destroys it
     */
    Status closeTab(TabId tab);

    // ========================================================================
    // Panels
    // ========================================================================

    /**
     * @brief Splits a panel in two
     * @return id of the new empty panel; the split panel keeps its id and content
     */
    Result<PanelId> split(TabId tab, PanelId panel, SplitType type);
    Result<PanelId> splitVertical(TabId tab, PanelId panel);
    Result<PanelId> splitHorizontal(TabId tab, PanelId panel);

    /**
     * @brief Removes a panel, terminating its session if it holds one
     *
     * Collapses the tree and destroys the tab when this was its last panel.
     */
    Result<CollapseResult> closePanel(TabId tab, PanelId panel);

    /**
     * @brief Detaches an occupied panel's session into a tab of its own
     */
    Result<TabId> moveToNewTab(TabId tab, PanelId panel);

    Status focusPanel(TabId tab, PanelId panel);
    Result<PanelId> focusedPanel(TabId tab) const;

    Status resizePanel(TabId tab, PanelId panel, double share);

    // Empty name clears the group and yields NoColor
    Result<ColorId> setTabGroup(TabId tab, const std::string& group);

    // ========================================================================
    // Queries
    // ========================================================================

    Result<TreeSnapshot> snapshot(TabId tab) const;

    std::vector<TabSummary> tabs() const;

    std::size_t tabCount() const { return registry_.size(); }

    std::optional<SessionLocation> locateSession(SessionId session) const;

    bool checkInvariants(std::string* why = nullptr) const;

    std::size_t subscribe(LayoutListener listener);
    void unsubscribe(std::size_t token);

    const EngineConfig& config() const { return config_; }
    const ColorPool& colors() const { return colors_; }
    const TabRegistry& registry() const { return registry_; }

private:
    friend class DragDropCoordinator;

    class Transaction;

    ISessionLifecycle& sessions_;
    EngineConfig config_;
    TabRegistry registry_;
    ColorPool colors_;
    TabGroupManager groups_;

    std::map<std::size_t, LayoutListener> listeners_;
    std::size_t next_listener_{1};
    std::vector<LayoutEvent> pending_events_;
    std::vector<SessionHandle> pending_discards_;
    bool busy_{false};

    double splitRatio() const;

    Result<RootTab*> requireTab(TabId tab);
    Result<const RootTab*> requireTab(TabId tab) const;
    Status requirePanel(const RootTab& tab, PanelId panel) const;

    // The following run inside a Transaction

    /**
     * @brief Removes a panel that no longer owns a session
     *
     * Fixes up focus and destroys the tab if its tree became empty.
     */
    CollapseResult removePanel(RootTab& tab, PanelId panel);

    // Fails with EvictionFailed when no tab can be created
    Result<TabId> rehomeInNewTab(SessionHandle session);

    // Terminated on commit, forgotten on rollback
    void discardSession(const SessionHandle& session);

    void refreshLabel(RootTab& tab);
    void queueEvent(LayoutEventType type, TabId tab);
    void flushEvents();

    /**
     * @brief Hands a session that left the layout to terminate()
     *
     * The layout change is already final, so a failing teardown is logged
     * and does not undo it.
     */
    void terminateSession(const SessionHandle& session);

    void debug(const std::string& message) const;
};

/**
 * @brief Scope of one all-or-nothing operation
 *
 * Captures tabs, palette and groups on entry and restores them on
 * destruction unless commit() was called. commit() checks the structural
 * invariants, terminates discarded sessions and then publishes queued
 * events.
 */
class SplitLayoutEngine::Transaction {
public:
    explicit Transaction(SplitLayoutEngine& engine);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    SplitLayoutEngine& engine_;
    TabRegistry::State tabs_;
    ColorPool colors_;
    TabGroupManager groups_;
    bool committed_{false};
};

}
