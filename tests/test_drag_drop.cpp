#include "splitdeck/dnd/DragDropCoordinator.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sdeck;

namespace {

    // Session layer whose instantiate() can be told to misbehave
    class ScriptedSessions : public SessionTable {
    public:
        enum class Mode { Normal, Refuse, Throw, Duplicate };

        Mode mode{Mode::Normal};
        SessionHandle duplicate;
        int instantiate_calls{0};

        std::optional<SessionHandle> instantiate(const ConnectionSpec& spec) override {
            instantiate_calls++;
            switch (mode) {
                case Mode::Refuse:
                    return std::nullopt;
                case Mode::Throw:
                    throw std::runtime_error("host key mismatch");
                case Mode::Duplicate:
                    return duplicate;
                case Mode::Normal:
                default:
                    return SessionTable::instantiate(spec);
            }
        }
    };

    struct EventLog {
        std::vector<LayoutEvent> events;

        void attach(SplitLayoutEngine& engine) {
            engine.subscribe([this](const LayoutEvent& e) { events.push_back(e); });
        }

        bool saw(LayoutEventType type, TabId tab) const {
            for (const auto& e : events) {
                if (e.type == type && e.tab == tab) return true;
            }
            return false;
        }
    };

    ConnectionSpec spec(const std::string& host) {
        ConnectionSpec s;
        s.host = host;
        return s;
    }

    SessionId sessionAt(const SplitLayoutEngine& engine, TabId tab, PanelId panel) {
        auto s = engine.registry().find(tab)->tree.session(panel);
        return s ? s->id : NoSession;
    }

    std::string dump(const SplitLayoutEngine& engine) {
        std::string out;
        for (TabId id : engine.registry().tabIds()) {
            out += describe(*engine.snapshot(id));
        }
        return out;
    }
}

// Split tab, drop a whole tab into the empty half, replace the other half
// from the sidebar, then close a panel
static void test_walkthrough() {
    ScriptedSessions sessions;
    SplitLayoutEngine engine(sessions);
    DragDropCoordinator dnd(engine);
    EventLog log;
    log.attach(engine);

    SessionHandle s1 = sessions.adopt("ssh://one");
    SessionHandle s2 = sessions.adopt("ssh://two");
    TabId t1 = *engine.openTab(s1);
    TabId t2 = *engine.openTab(s2);
    PanelId p1 = *engine.focusedPanel(t1);
    PanelId p2 = *engine.splitVertical(t1, p1);

    // Whole tab onto the empty half
    log.events.clear();
    auto placed = dnd.resolveDrop(RootTabSource{t2}, EmptyPanelTarget{t1, p2});
    assert(placed.isOk());
    assert(placed->effect == DropEffect::Placed);
    assert(placed->placed->id == s2.id);
    assert(placed->source_tab_destroyed);
    assert(engine.tabCount() == 1);
    assert(sessionAt(engine, t1, p2) == s2.id);
    assert(*engine.focusedPanel(t1) == p2);
    assert(log.saw(LayoutEventType::TabDestroyed, t2));
    assert(log.saw(LayoutEventType::TreeChanged, t1));
    assert(!sessions.wasTerminated(s2.id));
    assert(engine.checkInvariants());

    // Saved connection onto the occupied half
    log.events.clear();
    auto evicted = dnd.resolveDrop(SidebarSource{spec("db01")}, OccupiedPanelTarget{t1, p1});
    assert(evicted.isOk());
    assert(evicted->effect == DropEffect::Evicted);
    assert(evicted->evicted->id == s1.id);
    TabId t3 = evicted->evicted_to;
    assert(t3 != t1);
    SessionId s3 = evicted->placed->id;
    assert(sessionAt(engine, t1, p1) == s3);
    assert(sessions.isLive(s3));
    assert(!sessions.wasTerminated(s1.id));
    assert(engine.locateSession(s1.id)->tab == t3);
    assert(log.saw(LayoutEventType::TabCreated, t3));
    assert(engine.snapshot(t1)->label == "ssh://db01");
    assert(engine.checkInvariants());

    // Closing the other half dissolves the split
    auto closed = engine.closePanel(t1, p2);
    assert(closed.isOk());
    assert(sessions.wasTerminated(s2.id));
    assert(closed->became_unsplit);
    assert(engine.colors().allocatedCount() == 0);
    auto snap = engine.snapshot(t1);
    assert(snap->root->isPanel());
    assert(snap->root->session->id == s3);
    assert(engine.checkInvariants());
}

static void test_panel_onto_empty_same_tab() {
    SessionTable sessions;
    SplitLayoutEngine engine(sessions);
    DragDropCoordinator dnd(engine);

    SessionHandle s1 = sessions.adopt("a");
    TabId tab = *engine.openTab(s1);
    PanelId p1 = *engine.focusedPanel(tab);
    PanelId p2 = *engine.splitHorizontal(tab, p1);

    auto moved = dnd.resolveDrop(PanelSource{tab, p1}, EmptyPanelTarget{tab, p2});
    assert(moved.isOk());
    assert(moved->effect == DropEffect::Placed);
    assert(!moved->source_tab_destroyed);

    // The vacated panel is removed and the split collapses
    auto snap = engine.snapshot(tab);
    assert(snap->root->isPanel());
    assert(snap->root->id == p2);
    assert(snap->root->session->id == s1.id);
    assert(*engine.focusedPanel(tab) == p2);
    assert(engine.colors().allocatedCount() == 0);
    assert(engine.checkInvariants());
}

static void test_panel_onto_empty_other_tab() {
    SessionTable sessions;
    SplitLayoutEngine engine(sessions);
    DragDropCoordinator dnd(engine);

    TabId a = *engine.openTab(sessions.adopt("a1"));
    PanelId a1 = *engine.focusedPanel(a);
    PanelId a2 = *engine.splitVertical(a, a1);
    assert(dnd.resolveDrop(SidebarSource{spec("x")}, EmptyPanelTarget{a, a2}).isOk());
    SessionId moving = sessionAt(engine, a, a2);

    TabId b = *engine.openTab(sessions.adopt("b1"));
    PanelId b1 = *engine.focusedPanel(b);
    PanelId b2 = *engine.splitVertical(b, b1);

    auto moved = dnd.resolveDrop(PanelSource{a, a2}, EmptyPanelTarget{b, b2});
    assert(moved.isOk());
    assert(moved->effect == DropEffect::Placed);
    assert(!moved->source_tab_destroyed);
    assert(sessionAt(engine, b, b2) == moving);
    assert(!engine.registry().find(a)->tree.isSplit());
    assert(engine.colors().allocatedCount() == 1);
    assert(engine.checkInvariants());
}

static void test_panel_onto_occupied_swaps() {
    SessionTable sessions;
    SplitLayoutEngine engine(sessions);
    DragDropCoordinator dnd(engine);

    SessionHandle s1 = sessions.adopt("one");
    SessionHandle s2 = sessions.adopt("two");
    TabId a = *engine.openTab(s1);
    PanelId a1 = *engine.focusedPanel(a);
    PanelId a2 = *engine.splitVertical(a, a1);
    assert(dnd.resolveDrop(RootTabSource{*engine.openTab(s2)}, EmptyPanelTarget{a, a2}).isOk());

    auto swapped = dnd.resolveDrop(PanelSource{a, a1}, OccupiedPanelTarget{a, a2});
    assert(swapped.isOk());
    assert(swapped->effect == DropEffect::Swapped);
    assert(swapped->placed->id == s1.id);
    assert(sessionAt(engine, a, a1) == s2.id);
    assert(sessionAt(engine, a, a2) == s1.id);
    assert(*engine.focusedPanel(a) == a2);

    // Across tabs the trees keep their shape
    SessionHandle s3 = sessions.adopt("three");
    TabId b = *engine.openTab(s3);
    PanelId b1 = *engine.focusedPanel(b);
    auto across = dnd.resolveDrop(PanelSource{b, b1}, OccupiedPanelTarget{a, a1});
    assert(across.isOk());
    assert(sessionAt(engine, a, a1) == s3.id);
    assert(sessionAt(engine, b, b1) == s2.id);
    assert(engine.snapshot(b)->label == "two");
    assert(engine.tabCount() == 2);
    assert(sessions.terminatedCount() == 0);
    assert(engine.checkInvariants());
}

static void test_root_tab_onto_occupied() {
    SessionTable sessions;
    EngineConfig config;
    config.max_tabs = 2;
    SplitLayoutEngine engine(sessions, config);
    DragDropCoordinator dnd(engine);

    SessionHandle s1 = sessions.adopt("one");
    SessionHandle s2 = sessions.adopt("two");
    TabId a = *engine.openTab(s1);
    PanelId a1 = *engine.focusedPanel(a);
    PanelId a2 = *engine.splitVertical(a, a1);
    TabId b = *engine.openTab(s2);

    // At the limit, but the unsplit source tab frees its own slot
    assert(dnd.canDrop(RootTabSource{b}, OccupiedPanelTarget{a, a1}).isOk());
    auto replaced = dnd.resolveDrop(RootTabSource{b}, OccupiedPanelTarget{a, a1});
    assert(replaced.isOk());
    assert(replaced->effect == DropEffect::Evicted);
    assert(replaced->source_tab_destroyed);
    assert(replaced->evicted->id == s1.id);
    assert(sessionAt(engine, a, a1) == s2.id);
    assert(engine.locateSession(s1.id)->tab == replaced->evicted_to);
    assert(engine.registry().find(b) == nullptr);
    assert(engine.tabCount() == 2);
    assert(engine.registry().find(a)->tree.containsPanel(a2));
    assert(sessions.terminatedCount() == 0);
    assert(engine.checkInvariants());
}

static void test_failed_eviction_rolls_back() {
    SessionTable sessions;
    EngineConfig config;
    config.max_tabs = 2;
    SplitLayoutEngine engine(sessions, config);
    DragDropCoordinator dnd(engine);
    EventLog log;
    log.attach(engine);

    SessionHandle s1 = sessions.adopt("one");
    SessionHandle s3 = sessions.adopt("three");
    TabId a = *engine.openTab(s1);
    PanelId a1 = *engine.focusedPanel(a);
    assert(engine.splitVertical(a, a1).isOk());
    TabId b = *engine.openTab(s3);
    PanelId b1 = *engine.focusedPanel(b);
    assert(engine.splitHorizontal(b, b1).isOk());

    std::string before = dump(engine);
    std::size_t colors_before = engine.colors().allocatedCount();
    log.events.clear();

    // The source tab stays alive, so the evictee has nowhere to go
    assert(dnd.canDrop(RootTabSource{b}, OccupiedPanelTarget{a, a1}).error == LayoutError::EvictionFailed);
    auto rejected = dnd.resolveDrop(RootTabSource{b}, OccupiedPanelTarget{a, a1});
    assert(rejected.error == LayoutError::EvictionFailed);

    assert(dump(engine) == before);
    assert(engine.colors().allocatedCount() == colors_before);
    assert(sessionAt(engine, a, a1) == s1.id);
    assert(sessionAt(engine, b, b1) == s3.id);
    assert(log.events.empty());
    assert(engine.checkInvariants());

    // Operations keep working after a rollback
    assert(engine.closePanel(b, b1).isOk());
}

static void test_sidebar_onto_empty() {
    ScriptedSessions sessions;
    SplitLayoutEngine engine(sessions);
    DragDropCoordinator dnd(engine);

    TabId tab = *engine.openTab(sessions.adopt("a"));
    PanelId p1 = *engine.focusedPanel(tab);
    PanelId p2 = *engine.splitVertical(tab, p1);

    ConnectionSpec web = spec("web");
    web.name = "Web";
    auto placed = dnd.resolveDrop(SidebarSource{web}, EmptyPanelTarget{tab, p2});
    assert(placed.isOk());
    assert(placed->effect == DropEffect::Placed);
    assert(!placed->evicted.has_value());
    assert(placed->placed->label == "ssh://Web");
    assert(sessionAt(engine, tab, p2) == placed->placed->id);
    assert(engine.tabCount() == 1);
    assert(engine.checkInvariants());
}

static void test_sidebar_instantiation_failures() {
    ScriptedSessions sessions;
    SplitLayoutEngine engine(sessions);
    DragDropCoordinator dnd(engine);

    SessionHandle s1 = sessions.adopt("a");
    TabId tab = *engine.openTab(s1);
    PanelId p1 = *engine.focusedPanel(tab);
    PanelId p2 = *engine.splitVertical(tab, p1);
    std::string before = dump(engine);

    sessions.mode = ScriptedSessions::Mode::Refuse;
    auto refused = dnd.resolveDrop(SidebarSource{spec("x")}, EmptyPanelTarget{tab, p2});
    assert(refused.error == LayoutError::SessionInstantiationFailed);

    sessions.mode = ScriptedSessions::Mode::Throw;
    auto thrown = dnd.resolveDrop(SidebarSource{spec("x")}, OccupiedPanelTarget{tab, p1});
    assert(thrown.error == LayoutError::SessionInstantiationFailed);
    assert(thrown.message.find("host key mismatch") != std::string::npos);

    // A handle that is already on screen cannot be placed twice
    sessions.mode = ScriptedSessions::Mode::Duplicate;
    sessions.duplicate = s1;
    auto duplicate = dnd.resolveDrop(SidebarSource{spec("x")}, EmptyPanelTarget{tab, p2});
    assert(duplicate.error == LayoutError::SessionInstantiationFailed);

    assert(dump(engine) == before);
    assert(engine.tabCount() == 1);
    assert(engine.checkInvariants());
}

static void test_sidebar_eviction_without_room() {
    ScriptedSessions sessions;
    EngineConfig config;
    config.max_tabs = 1;
    SplitLayoutEngine engine(sessions, config);
    DragDropCoordinator dnd(engine);

    TabId tab = *engine.openTab(sessions.adopt("a"));
    PanelId p1 = *engine.focusedPanel(tab);

    assert(dnd.canDrop(SidebarSource{spec("x")}, OccupiedPanelTarget{tab, p1}).error ==
           LayoutError::EvictionFailed);
    auto rejected = dnd.resolveDrop(SidebarSource{spec("x")}, OccupiedPanelTarget{tab, p1});
    assert(rejected.error == LayoutError::EvictionFailed);

    // Nothing was connected for a drop that could not complete
    assert(sessions.instantiate_calls == 0);
    assert(sessions.liveCount() == 1);
    assert(engine.checkInvariants());
}

static void test_self_drop_is_noop() {
    SessionTable sessions;
    SplitLayoutEngine engine(sessions);
    DragDropCoordinator dnd(engine);
    EventLog log;
    log.attach(engine);

    SessionHandle s1 = sessions.adopt("a");
    TabId tab = *engine.openTab(s1);
    PanelId p1 = *engine.focusedPanel(tab);
    log.events.clear();

    auto same_panel = dnd.resolveDrop(PanelSource{tab, p1}, OccupiedPanelTarget{tab, p1});
    assert(same_panel.isOk());
    assert(same_panel->effect == DropEffect::NoOp);

    auto same_tab = dnd.resolveDrop(RootTabSource{tab}, OccupiedPanelTarget{tab, p1});
    assert(same_tab.isOk());
    assert(same_tab->effect == DropEffect::NoOp);

    assert(dnd.canDrop(PanelSource{tab, p1}, OccupiedPanelTarget{tab, p1}).isOk());
    assert(log.events.empty());
    assert(sessionAt(engine, tab, p1) == s1.id);
}

static void test_target_validation() {
    SessionTable sessions;
    SplitLayoutEngine engine(sessions);
    DragDropCoordinator dnd(engine);

    TabId tab = *engine.openTab(sessions.adopt("a"));
    PanelId p1 = *engine.focusedPanel(tab);
    PanelId p2 = *engine.splitVertical(tab, p1);
    TabId other = *engine.openTab(sessions.adopt("b"));

    // Target kind must match the panel's current state
    assert(dnd.resolveDrop(RootTabSource{other}, EmptyPanelTarget{tab, p1}).error ==
           LayoutError::InvalidTarget);
    assert(dnd.resolveDrop(RootTabSource{other}, OccupiedPanelTarget{tab, p2}).error ==
           LayoutError::InvalidTarget);

    assert(dnd.resolveDrop(RootTabSource{other}, EmptyPanelTarget{999, p2}).error ==
           LayoutError::UnknownTab);
    assert(dnd.resolveDrop(RootTabSource{other}, EmptyPanelTarget{other, p2}).error ==
           LayoutError::UnknownPanel);
    assert(dnd.resolveDrop(RootTabSource{999}, EmptyPanelTarget{tab, p2}).error ==
           LayoutError::UnknownTab);

    // Empty panels have nothing to drag
    assert(dnd.resolveDrop(PanelSource{tab, p2}, OccupiedPanelTarget{other, *engine.focusedPanel(other)}).error ==
           LayoutError::InvalidTarget);
    assert(dnd.resolveDrop(PanelSource{tab, 5555555}, EmptyPanelTarget{tab, p2}).error ==
           LayoutError::UnknownPanel);

    assert(engine.focusPanel(tab, p2).isOk());
    assert(dnd.resolveDrop(RootTabSource{tab}, OccupiedPanelTarget{other, *engine.focusedPanel(other)}).error ==
           LayoutError::InvalidTarget);

    auto occupied = dnd.targetFor(tab, p1);
    assert(occupied.isOk());
    assert(std::holds_alternative<OccupiedPanelTarget>(*occupied));
    auto empty = dnd.targetFor(tab, p2);
    assert(std::holds_alternative<EmptyPanelTarget>(*empty));
    assert(dnd.targetFor(999, p1).error == LayoutError::UnknownTab);

    assert(engine.tabCount() == 2);
    assert(engine.checkInvariants());
}

int main() {
    test_walkthrough();
    test_panel_onto_empty_same_tab();
    test_panel_onto_empty_other_tab();
    test_panel_onto_occupied_swaps();
    test_root_tab_onto_occupied();
    test_failed_eviction_rolls_back();
    test_sidebar_onto_empty();
    test_sidebar_instantiation_failures();
    test_sidebar_eviction_without_room();
    test_self_drop_is_noop();
    test_target_validation();

    std::cout << "test_drag_drop: all tests passed" << std::endl;
    return 0;
}
