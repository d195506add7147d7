#include "splitdeck/core/SplitLayoutEngine.hpp"

#include <algorithm>
#include <iostream>
#include <unordered_set>

namespace sdeck {

// ============================================================================
// Transaction
// ============================================================================

SplitLayoutEngine::Transaction::Transaction(SplitLayoutEngine& engine)
    : engine_(engine)
    , tabs_(engine.registry_.captureState())
    , colors_(engine.colors_)
    , groups_(engine.groups_)
{
    SDECK_INVARIANT(!engine_.busy_, "layout operation re-entered");
    engine_.busy_ = true;
}

SplitLayoutEngine::Transaction::~Transaction() {
    if (committed_) {
        return;
    }

    engine_.registry_.restoreState(std::move(tabs_));
    engine_.colors_ = colors_;
    engine_.groups_ = groups_;
    engine_.pending_events_.clear();
    engine_.pending_discards_.clear();
    engine_.busy_ = false;
    engine_.debug("SplitLayoutEngine: operation rolled back");
}

void SplitLayoutEngine::Transaction::commit() {
    SDECK_INVARIANT(!committed_, "transaction committed twice");
    committed_ = true;

    std::string why;
    SDECK_INVARIANT(engine_.checkInvariants(&why), why);

    // Still busy: teardown callbacks must not re-enter the engine
    std::vector<SessionHandle> discarded;
    discarded.swap(engine_.pending_discards_);
    for (const auto& session : discarded) {
        engine_.terminateSession(session);
    }

    engine_.busy_ = false;
    engine_.flushEvents();
}

// ============================================================================
// Construction
// ============================================================================

SplitLayoutEngine::SplitLayoutEngine(ISessionLifecycle& sessions, EngineConfig config)
    : sessions_(sessions)
    , config_(config)
    , registry_(config.max_tabs)
    , colors_(config.palette_size)
    , groups_(colors_.paletteSize())
{
    if (config_.min_ratio <= 0.0 || config_.min_ratio >= 0.5) {
        std::cerr << "Engine: min_ratio " << config_.min_ratio << " out of range, using "
                  << layout_constants::DEFAULT_MIN_RATIO << std::endl;
        config_.min_ratio = layout_constants::DEFAULT_MIN_RATIO;
    }
    config_.palette_size = colors_.paletteSize();
}

double SplitLayoutEngine::splitRatio() const {
    return std::clamp(config_.default_ratio, config_.min_ratio, 1.0 - config_.min_ratio);
}

void SplitLayoutEngine::debug(const std::string& message) const {
    if (config_.verbose) {
        std::cerr << "[DEBUG] " << message << std::endl;
    }
}

// ============================================================================
// Lookup helpers
// ============================================================================

Result<RootTab*> SplitLayoutEngine::requireTab(TabId tab) {
    RootTab* found = registry_.find(tab);
    if (!found) {
        return Result<RootTab*>::fail(LayoutError::UnknownTab, "Unknown tab " + std::to_string(tab));
    }
    return Result<RootTab*>::ok(found);
}

Result<const RootTab*> SplitLayoutEngine::requireTab(TabId tab) const {
    const RootTab* found = registry_.find(tab);
    if (!found) {
        return Result<const RootTab*>::fail(LayoutError::UnknownTab,
                                            "Unknown tab " + std::to_string(tab));
    }
    return Result<const RootTab*>::ok(found);
}

Status SplitLayoutEngine::requirePanel(const RootTab& tab, PanelId panel) const {
    if (!tab.tree.containsPanel(panel)) {
        return Status::fail(LayoutError::UnknownPanel, "Panel " + std::to_string(panel) +
                            " is not in tab " + std::to_string(tab.id));
    }
    return Status::ok();
}

// ============================================================================
// Tabs
// ============================================================================

Result<TabId> SplitLayoutEngine::openTab(SessionHandle session) {
    if (!session.valid()) {
        return Result<TabId>::fail(LayoutError::InvalidTarget, "Invalid session handle");
    }
    if (registry_.findSession(session.id)) {
        return Result<TabId>::fail(LayoutError::InvalidTarget,
                                   "Session " + std::to_string(session.id) + " is already placed");
    }
    if (!registry_.canCreateTab()) {
        return Result<TabId>::fail(LayoutError::InvalidTarget,
                                   "Tab limit of " + std::to_string(registry_.maxTabs()) + " reached");
    }

    Transaction tx(*this);

    std::string label = session.label;
    RootTab* tab = registry_.createTab(PanelTree::withSession(std::move(session)), label);
    SDECK_INVARIANT(tab != nullptr, "tab creation failed after capacity check");
    TabId id = tab->id;
    queueEvent(LayoutEventType::TabCreated, id);

    tx.commit();
    debug("SplitLayoutEngine::openTab -> tab " + std::to_string(id));
    return Result<TabId>::ok(id);
}

Result<TabId> SplitLayoutEngine::openConnection(const ConnectionSpec& spec) {
    if (!registry_.canCreateTab()) {
        return Result<TabId>::fail(LayoutError::InvalidTarget,
                                   "Tab limit of " + std::to_string(registry_.maxTabs()) + " reached");
    }

    std::optional<SessionHandle> session;
    try {
        session = sessions_.instantiate(spec);
    } catch (const std::exception& e) {
        return Result<TabId>::fail(LayoutError::SessionInstantiationFailed,
                                   "Could not connect to " + spec.displayName() + ": " + e.what());
    }
    if (!session || !session->valid()) {
        return Result<TabId>::fail(LayoutError::SessionInstantiationFailed,
                                   "Could not connect to " + spec.displayName());
    }
    // The handle belongs to a panel already, so it is not ours to tear down
    if (registry_.findSession(session->id)) {
        return Result<TabId>::fail(LayoutError::SessionInstantiationFailed,
                                   "Session layer returned handle " + std::to_string(session->id) +
                                   " which is already placed");
    }

    auto opened = openTab(*session);
    if (!opened) {
        terminateSession(*session);
    }
    return opened;
}

Status SplitLayoutEngine::closeTab(TabId tab) {
    auto found = requireTab(tab);
    if (!found) return Status::from(found);
    RootTab* root = *found;

    Transaction tx(*this);

    for (const auto& session : root->tree.sessions()) {
        discardSession(session);
    }
    root->tree.releaseColors(colors_);
    registry_.destroyTab(tab);
    queueEvent(LayoutEventType::TabDestroyed, tab);

    tx.commit();
    debug("SplitLayoutEngine::closeTab(" + std::to_string(tab) + ")");
    return Status::ok();
}

// ============================================================================
// Panels
// ============================================================================

Result<PanelId> SplitLayoutEngine::split(TabId tab, PanelId panel, SplitType type) {
    auto found = requireTab(tab);
    if (!found) return Result<PanelId>::from(found);
    RootTab* root = *found;

    auto path = root->tree.locate(panel);
    if (!path) {
        return Result<PanelId>::fail(LayoutError::UnknownPanel, "Panel " + std::to_string(panel) +
                                     " is not in tab " + std::to_string(tab));
    }

    Transaction tx(*this);

    auto new_path = root->tree.split(*path, type, colors_, splitRatio());
    if (!new_path) {
        return Result<PanelId>::from(new_path);
    }
    auto created = root->tree.resolve(*new_path);
    SDECK_INVARIANT(created.has_value(), "new panel does not resolve");
    queueEvent(LayoutEventType::TreeChanged, tab);

    tx.commit();
    debug("SplitLayoutEngine::split(tab=" + std::to_string(tab) + ", panel=" + std::to_string(panel) +
          ", " + toString(type) + ") -> panel " + std::to_string(*created));
    return Result<PanelId>::ok(*created);
}

Result<PanelId> SplitLayoutEngine::splitVertical(TabId tab, PanelId panel) {
    return split(tab, panel, SplitType::Vertical);
}

Result<PanelId> SplitLayoutEngine::splitHorizontal(TabId tab, PanelId panel) {
    return split(tab, panel, SplitType::Horizontal);
}

Result<CollapseResult> SplitLayoutEngine::closePanel(TabId tab, PanelId panel) {
    auto found = requireTab(tab);
    if (!found) return Result<CollapseResult>::from(found);
    RootTab* root = *found;

    auto valid = requirePanel(*root, panel);
    if (!valid) return Result<CollapseResult>::from(valid);

    Transaction tx(*this);

    if (auto session = root->tree.session(panel)) {
        debug("SplitLayoutEngine::closePanel terminating session " + std::to_string(session->id));
        discardSession(*session);
    }
    CollapseResult result = removePanel(*root, panel);

    tx.commit();
    debug("SplitLayoutEngine::closePanel(tab=" + std::to_string(tab) + ", panel=" +
          std::to_string(panel) + ") dissolved " + std::to_string(result.dissolved_containers));
    return Result<CollapseResult>::ok(std::move(result));
}

Result<TabId> SplitLayoutEngine::moveToNewTab(TabId tab, PanelId panel) {
    auto found = requireTab(tab);
    if (!found) return Result<TabId>::from(found);
    RootTab* root = *found;

    auto valid = requirePanel(*root, panel);
    if (!valid) return Result<TabId>::from(valid);

    if (!root->tree.isOccupied(panel)) {
        return Result<TabId>::fail(LayoutError::InvalidTarget,
                                   "Panel " + std::to_string(panel) + " has no session to move");
    }
    // Already alone in its tab
    if (!root->tree.isSplit()) {
        return Result<TabId>::ok(tab);
    }
    if (!registry_.canCreateTab()) {
        return Result<TabId>::fail(LayoutError::EvictionFailed,
                                   "Tab limit of " + std::to_string(registry_.maxTabs()) + " reached");
    }

    Transaction tx(*this);

    SessionHandle moved = *root->tree.takeSession(panel);
    removePanel(*root, panel);

    auto created = rehomeInNewTab(std::move(moved));
    if (!created) {
        return created;
    }

    tx.commit();
    return created;
}

Status SplitLayoutEngine::focusPanel(TabId tab, PanelId panel) {
    auto found = requireTab(tab);
    if (!found) return Status::from(found);
    RootTab* root = *found;

    auto valid = requirePanel(*root, panel);
    if (!valid) return valid;

    if (root->focused == panel) {
        return Status::ok();
    }

    Transaction tx(*this);
    root->focused = panel;
    refreshLabel(*root);
    queueEvent(LayoutEventType::TreeChanged, tab);
    tx.commit();
    return Status::ok();
}

Result<PanelId> SplitLayoutEngine::focusedPanel(TabId tab) const {
    auto found = requireTab(tab);
    if (!found) return Result<PanelId>::from(found);
    return Result<PanelId>::ok((*found)->focused);
}

Status SplitLayoutEngine::resizePanel(TabId tab, PanelId panel, double share) {
    auto found = requireTab(tab);
    if (!found) return Status::from(found);
    RootTab* root = *found;

    Transaction tx(*this);

    auto resized = root->tree.setShare(panel, share, config_.min_ratio);
    if (!resized) {
        return resized;
    }
    queueEvent(LayoutEventType::TreeChanged, tab);

    tx.commit();
    return Status::ok();
}

Result<ColorId> SplitLayoutEngine::setTabGroup(TabId tab, const std::string& group) {
    auto found = requireTab(tab);
    if (!found) return Result<ColorId>::from(found);
    RootTab* root = *found;

    Transaction tx(*this);

    ColorId color = NoColor;
    if (group.empty()) {
        root->group.clear();
    } else {
        color = groups_.getOrAssignColor(group);
        root->group = group;
    }
    queueEvent(LayoutEventType::TreeChanged, tab);

    tx.commit();
    return Result<ColorId>::ok(color);
}

// ============================================================================
// Transaction-scoped helpers
// ============================================================================

CollapseResult SplitLayoutEngine::removePanel(RootTab& tab, PanelId panel) {
    auto path = tab.tree.locate(panel);
    SDECK_INVARIANT(path.has_value(), "removing a panel outside its tab");

    auto closed = tab.tree.close(*path, colors_);
    SDECK_INVARIANT(closed.isOk(), closed.message);
    CollapseResult result = *closed;

    TabId id = tab.id;
    if (result.tree_empty) {
        registry_.destroyTab(id);
        queueEvent(LayoutEventType::TabDestroyed, id);
        return result;
    }

    if (tab.focused == panel || !tab.tree.containsPanel(tab.focused)) {
        tab.focused = tab.tree.firstPanel();
    }
    refreshLabel(tab);
    queueEvent(LayoutEventType::TreeChanged, id);
    return result;
}

Result<TabId> SplitLayoutEngine::rehomeInNewTab(SessionHandle session) {
    if (!registry_.canCreateTab()) {
        return Result<TabId>::fail(LayoutError::EvictionFailed,
                                   "Tab limit of " + std::to_string(registry_.maxTabs()) +
                                   " reached, cannot re-home session " + std::to_string(session.id));
    }

    std::string label = session.label;
    RootTab* created = registry_.createTab(PanelTree::withSession(std::move(session)), label);
    SDECK_INVARIANT(created != nullptr, "tab creation failed after capacity check");
    queueEvent(LayoutEventType::TabCreated, created->id);
    return Result<TabId>::ok(created->id);
}

void SplitLayoutEngine::discardSession(const SessionHandle& session) {
    pending_discards_.push_back(session);
}

void SplitLayoutEngine::terminateSession(const SessionHandle& session) {
    try {
        sessions_.terminate(session);
    } catch (const std::exception& e) {
        std::cerr << "Engine: Terminating session " << session.id << " failed: "
                  << e.what() << std::endl;
    }
}

void SplitLayoutEngine::refreshLabel(RootTab& tab) {
    if (auto session = tab.tree.session(tab.focused)) {
        tab.label = session->label;
    }
}

void SplitLayoutEngine::queueEvent(LayoutEventType type, TabId tab) {
    if (type == LayoutEventType::TabDestroyed) {
        pending_events_.erase(
            std::remove_if(pending_events_.begin(), pending_events_.end(),
                [tab](const LayoutEvent& e) {
                    return e.tab == tab && e.type == LayoutEventType::TreeChanged;
                }),
            pending_events_.end());
    }

    for (const auto& e : pending_events_) {
        if (e.tab == tab && (e.type == type || e.type == LayoutEventType::TabDestroyed)) {
            return;
        }
    }
    pending_events_.push_back({type, tab});
}

void SplitLayoutEngine::flushEvents() {
    std::vector<LayoutEvent> events;
    events.swap(pending_events_);

    // Listeners may subscribe or unsubscribe while being notified
    auto listeners = listeners_;
    for (const auto& event : events) {
        debug(std::string("SplitLayoutEngine: event ") + toString(event.type) +
              " tab " + std::to_string(event.tab));
        for (const auto& [token, listener] : listeners) {
            listener(event);
        }
    }
}

// ============================================================================
// Queries
// ============================================================================

Result<TreeSnapshot> SplitLayoutEngine::snapshot(TabId tab) const {
    auto found = requireTab(tab);
    if (!found) return Result<TreeSnapshot>::from(found);
    const RootTab* root = *found;

    TreeSnapshot snap;
    snap.tab = root->id;
    snap.label = root->label;
    snap.group = root->group;
    if (!root->group.empty()) {
        snap.group_color = groups_.getColor(root->group).value_or(NoColor);
    }
    snap.focused = root->focused;
    snap.panel_count = root->tree.panelCount();
    if (!root->tree.isEmpty()) {
        snap.root = root->tree.snapshotNode(root->tree.root(), root->focused);
    }
    return Result<TreeSnapshot>::ok(std::move(snap));
}

std::vector<TabSummary> SplitLayoutEngine::tabs() const {
    std::vector<TabSummary> out;
    for (const auto& [id, tab] : registry_.tabs()) {
        TabSummary summary;
        summary.id = id;
        summary.label = tab.label;
        summary.group = tab.group;
        summary.panel_count = tab.tree.panelCount();
        summary.focused = tab.focused;
        summary.split = tab.tree.isSplit();
        out.push_back(std::move(summary));
    }
    return out;
}

std::optional<SessionLocation> SplitLayoutEngine::locateSession(SessionId session) const {
    return registry_.findSession(session);
}

bool SplitLayoutEngine::checkInvariants(std::string* why) const {
    auto fail = [why](const std::string& message) {
        if (why) *why = message;
        return false;
    };

    std::unordered_set<SessionId> owned;
    std::vector<int> color_counts(colors_.paletteSize(), 0);

    for (const auto& [id, tab] : registry_.tabs()) {
        std::string tree_why;
        if (!tab.tree.validate(&tree_why)) {
            return fail("tab " + std::to_string(id) + ": " + tree_why);
        }
        if (tab.tree.isEmpty()) {
            return fail("tab " + std::to_string(id) + " outlived its last panel");
        }
        if (!tab.tree.containsPanel(tab.focused)) {
            return fail("tab " + std::to_string(id) + " focuses a panel outside its tree");
        }
        for (const auto& session : tab.tree.sessions()) {
            if (!owned.insert(session.id).second) {
                return fail("session " + std::to_string(session.id) + " owned by two panels");
            }
        }
        for (ColorId color : tab.tree.colors()) {
            if (color < 0 || static_cast<std::size_t>(color) >= color_counts.size()) {
                return fail("tab " + std::to_string(id) + " holds color " +
                            std::to_string(color) + " outside the palette");
            }
            color_counts[color]++;
        }
    }

    for (std::size_t i = 0; i < color_counts.size(); ++i) {
        if (color_counts[i] != colors_.holders(static_cast<ColorId>(i))) {
            return fail("palette slot " + std::to_string(i) + " has " +
                        std::to_string(colors_.holders(static_cast<ColorId>(i))) +
                        " recorded holders but " + std::to_string(color_counts[i]) + " live containers");
        }
    }
    return true;
}

std::size_t SplitLayoutEngine::subscribe(LayoutListener listener) {
    std::size_t token = next_listener_++;
    listeners_.emplace(token, std::move(listener));
    return token;
}

void SplitLayoutEngine::unsubscribe(std::size_t token) {
    listeners_.erase(token);
}

}
