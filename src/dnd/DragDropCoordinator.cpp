#include "splitdeck/dnd/DragDropCoordinator.hpp"

namespace sdeck {

const char* toString(DropEffect effect) {
    switch (effect) {
        case DropEffect::NoOp: return "noop";
        case DropEffect::Placed: return "placed";
        case DropEffect::Swapped: return "swapped";
        case DropEffect::Evicted: return "evicted";
    }
    return "unknown";
}

DragDropCoordinator::DragDropCoordinator(SplitLayoutEngine& engine)
    : engine_(engine) {}

// ============================================================================
// Validation
// ============================================================================

Result<PanelRef> DragDropCoordinator::checkTarget(const DropTarget& target) const {
    PanelRef ref = std::visit([](const auto& t) { return PanelRef{t.tab, t.panel}; }, target);
    bool expect_occupied = std::holds_alternative<OccupiedPanelTarget>(target);

    const RootTab* tab = engine_.registry_.find(ref.tab);
    if (!tab) {
        return Result<PanelRef>::fail(LayoutError::UnknownTab, "Unknown tab " + std::to_string(ref.tab));
    }
    if (!tab->tree.containsPanel(ref.panel)) {
        return Result<PanelRef>::fail(LayoutError::UnknownPanel, "Panel " + std::to_string(ref.panel) +
                                      " is not in tab " + std::to_string(ref.tab));
    }
    if (tab->tree.isOccupied(ref.panel) != expect_occupied) {
        return Result<PanelRef>::fail(LayoutError::InvalidTarget,
                                      "Panel " + std::to_string(ref.panel) + " is no longer " +
                                      (expect_occupied ? "occupied" : "empty"));
    }
    return Result<PanelRef>::ok(ref);
}

Result<PanelRef> DragDropCoordinator::checkSource(const DragSource& source) const {
    if (const auto* root = std::get_if<RootTabSource>(&source)) {
        const RootTab* tab = engine_.registry_.find(root->tab);
        if (!tab) {
            return Result<PanelRef>::fail(LayoutError::UnknownTab,
                                          "Unknown tab " + std::to_string(root->tab));
        }
        if (!tab->tree.isOccupied(tab->focused)) {
            return Result<PanelRef>::fail(LayoutError::InvalidTarget,
                                          "Tab " + std::to_string(root->tab) + " has no session to drag");
        }
        return Result<PanelRef>::ok(PanelRef{root->tab, tab->focused});
    }

    if (const auto* panel = std::get_if<PanelSource>(&source)) {
        const RootTab* tab = engine_.registry_.find(panel->tab);
        if (!tab) {
            return Result<PanelRef>::fail(LayoutError::UnknownTab,
                                          "Unknown tab " + std::to_string(panel->tab));
        }
        if (!tab->tree.containsPanel(panel->panel)) {
            return Result<PanelRef>::fail(LayoutError::UnknownPanel,
                                          "Panel " + std::to_string(panel->panel) +
                                          " is not in tab " + std::to_string(panel->tab));
        }
        if (!tab->tree.isOccupied(panel->panel)) {
            return Result<PanelRef>::fail(LayoutError::InvalidTarget, "Cannot drag an empty panel");
        }
        return Result<PanelRef>::ok(PanelRef{panel->tab, panel->panel});
    }

    // Sidebar drags carry no panel
    return Result<PanelRef>::ok(PanelRef{});
}

Status DragDropCoordinator::canDrop(const DragSource& source, const DropTarget& target) const {
    auto to = checkTarget(target);
    if (!to) return Status::from(to);
    bool occupied = std::holds_alternative<OccupiedPanelTarget>(target);

    if (std::holds_alternative<SidebarSource>(source)) {
        if (occupied && !engine_.registry_.canCreateTab()) {
            return Status::fail(LayoutError::EvictionFailed, "No room for the displaced session");
        }
        return Status::ok();
    }

    auto from = checkSource(source);
    if (!from) return Status::from(from);
    if (*from == *to) {
        return Status::ok();
    }

    if (occupied && std::holds_alternative<RootTabSource>(source)) {
        // An unsplit source tab disappears and frees its slot
        const RootTab* tab = engine_.registry_.find(from->tab);
        if (tab->tree.isSplit() && !engine_.registry_.canCreateTab()) {
            return Status::fail(LayoutError::EvictionFailed, "No room for the displaced session");
        }
    }
    return Status::ok();
}

Result<DropTarget> DragDropCoordinator::targetFor(TabId tab, PanelId panel) const {
    const RootTab* root = engine_.registry_.find(tab);
    if (!root) {
        return Result<DropTarget>::fail(LayoutError::UnknownTab, "Unknown tab " + std::to_string(tab));
    }
    if (!root->tree.containsPanel(panel)) {
        return Result<DropTarget>::fail(LayoutError::UnknownPanel, "Panel " + std::to_string(panel) +
                                        " is not in tab " + std::to_string(tab));
    }
    if (root->tree.isOccupied(panel)) {
        return Result<DropTarget>::ok(OccupiedPanelTarget{tab, panel});
    }
    return Result<DropTarget>::ok(EmptyPanelTarget{tab, panel});
}

// ============================================================================
// Resolution
// ============================================================================

Result<DropOutcome> DragDropCoordinator::resolveDrop(const DragSource& source, const DropTarget& target) {
    auto to = checkTarget(target);
    if (!to) return Result<DropOutcome>::from(to);
    bool occupied = std::holds_alternative<OccupiedPanelTarget>(target);

    Result<DropOutcome> outcome;
    if (const auto* sidebar = std::get_if<SidebarSource>(&source)) {
        outcome = placeFromSidebar(sidebar->spec, *to, occupied);
    } else {
        auto from = checkSource(source);
        if (!from) return Result<DropOutcome>::from(from);

        if (*from == *to) {
            DropOutcome noop;
            noop.target_tab = to->tab;
            noop.target_panel = to->panel;
            return Result<DropOutcome>::ok(noop);
        }

        if (!occupied) {
            outcome = movePanel(*from, *to);
        } else if (std::holds_alternative<RootTabSource>(source)) {
            outcome = replaceFromTab(*from, *to);
        } else {
            outcome = swapPanels(*from, *to);
        }
    }

    if (outcome) {
        engine_.debug(std::string("DragDropCoordinator::resolveDrop -> ") + toString(outcome->effect) +
                      " tab " + std::to_string(to->tab) + " panel " + std::to_string(to->panel));
    } else {
        engine_.debug(std::string("DragDropCoordinator::resolveDrop rejected: ") +
                      toString(outcome.error) + " " + outcome.message);
    }
    return outcome;
}

void DragDropCoordinator::focusTarget(const PanelRef& to) {
    RootTab* tab = engine_.registry_.find(to.tab);
    tab->focused = to.panel;
    engine_.refreshLabel(*tab);
    engine_.queueEvent(LayoutEventType::TreeChanged, to.tab);
}

Result<DropOutcome> DragDropCoordinator::movePanel(const PanelRef& from, const PanelRef& to) {
    SplitLayoutEngine::Transaction tx(engine_);

    RootTab* source = engine_.registry_.find(from.tab);
    RootTab* target = engine_.registry_.find(to.tab);

    SessionHandle session = *source->tree.takeSession(from.panel);
    target->tree.placeSession(to.panel, session);
    focusTarget(to);

    // The emptied source panel goes away; may collapse or destroy its tab
    CollapseResult removed = engine_.removePanel(*source, from.panel);

    DropOutcome outcome;
    outcome.effect = DropEffect::Placed;
    outcome.target_tab = to.tab;
    outcome.target_panel = to.panel;
    outcome.placed = session;
    outcome.source_tab_destroyed = removed.tree_empty;

    tx.commit();
    return Result<DropOutcome>::ok(std::move(outcome));
}

Result<DropOutcome> DragDropCoordinator::swapPanels(const PanelRef& from, const PanelRef& to) {
    SplitLayoutEngine::Transaction tx(engine_);

    RootTab* source = engine_.registry_.find(from.tab);
    RootTab* target = engine_.registry_.find(to.tab);

    SessionHandle dragged = *source->tree.takeSession(from.panel);
    SessionHandle resident = *target->tree.takeSession(to.panel);
    source->tree.placeSession(from.panel, resident);
    target->tree.placeSession(to.panel, dragged);

    engine_.refreshLabel(*source);
    engine_.queueEvent(LayoutEventType::TreeChanged, from.tab);
    focusTarget(to);

    DropOutcome outcome;
    outcome.effect = DropEffect::Swapped;
    outcome.target_tab = to.tab;
    outcome.target_panel = to.panel;
    outcome.placed = dragged;

    tx.commit();
    return Result<DropOutcome>::ok(std::move(outcome));
}

Result<DropOutcome> DragDropCoordinator::replaceFromTab(const PanelRef& from, const PanelRef& to) {
    SplitLayoutEngine::Transaction tx(engine_);

    RootTab* source = engine_.registry_.find(from.tab);
    RootTab* target = engine_.registry_.find(to.tab);

    SessionHandle dragged = *source->tree.takeSession(from.panel);
    SessionHandle evicted = *target->tree.takeSession(to.panel);
    target->tree.placeSession(to.panel, dragged);
    focusTarget(to);

    CollapseResult removed = engine_.removePanel(*source, from.panel);

    // Removing the source first lets an unsplit source tab free its slot
    auto rehomed = engine_.rehomeInNewTab(evicted);
    if (!rehomed) {
        return Result<DropOutcome>::from(rehomed);
    }

    DropOutcome outcome;
    outcome.effect = DropEffect::Evicted;
    outcome.target_tab = to.tab;
    outcome.target_panel = to.panel;
    outcome.placed = dragged;
    outcome.evicted = evicted;
    outcome.evicted_to = *rehomed;
    outcome.source_tab_destroyed = removed.tree_empty;

    tx.commit();
    return Result<DropOutcome>::ok(std::move(outcome));
}

Result<DropOutcome> DragDropCoordinator::placeFromSidebar(const ConnectionSpec& spec, const PanelRef& to,
                                                          bool occupied) {
    // Nothing is instantiated when the occupant could not be re-homed anyway
    if (occupied && !engine_.registry_.canCreateTab()) {
        return Result<DropOutcome>::fail(LayoutError::EvictionFailed,
                                         "No room for the session displaced from panel " +
                                         std::to_string(to.panel));
    }

    auto fresh = instantiate(spec);
    if (!fresh) return Result<DropOutcome>::from(fresh);
    SessionHandle session = *fresh;

    SplitLayoutEngine::Transaction tx(engine_);

    RootTab* target = engine_.registry_.find(to.tab);
    if (!target || !target->tree.containsPanel(to.panel) ||
        target->tree.isOccupied(to.panel) != occupied) {
        engine_.terminateSession(session);
        return Result<DropOutcome>::fail(LayoutError::InvalidTarget,
                                         "Drop target changed while connecting");
    }

    std::optional<SessionHandle> displaced;
    if (occupied) {
        displaced = target->tree.takeSession(to.panel);
    }
    target->tree.placeSession(to.panel, session);
    focusTarget(to);

    DropOutcome outcome;
    outcome.effect = DropEffect::Placed;
    outcome.target_tab = to.tab;
    outcome.target_panel = to.panel;
    outcome.placed = session;

    if (displaced) {
        auto rehomed = engine_.rehomeInNewTab(*displaced);
        if (!rehomed) {
            // The fresh session never became visible; discard it
            engine_.terminateSession(session);
            return Result<DropOutcome>::from(rehomed);
        }
        outcome.effect = DropEffect::Evicted;
        outcome.evicted = displaced;
        outcome.evicted_to = *rehomed;
    }

    tx.commit();
    return Result<DropOutcome>::ok(std::move(outcome));
}

Result<SessionHandle> DragDropCoordinator::instantiate(const ConnectionSpec& spec) {
    std::optional<SessionHandle> session;
    try {
        session = engine_.sessions_.instantiate(spec);
    } catch (const std::exception& e) {
        return Result<SessionHandle>::fail(LayoutError::SessionInstantiationFailed,
                                           "Could not connect to " + spec.displayName() + ": " + e.what());
    }

    if (!session || !session->valid()) {
        return Result<SessionHandle>::fail(LayoutError::SessionInstantiationFailed,
                                           "Could not connect to " + spec.displayName());
    }
    if (engine_.registry_.findSession(session->id)) {
        return Result<SessionHandle>::fail(LayoutError::SessionInstantiationFailed,
                                           "Session layer returned handle " + std::to_string(session->id) +
                                           " which is already placed");
    }
    return Result<SessionHandle>::ok(*session);
}

}
