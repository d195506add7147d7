#include "splitdeck/dnd/DragDropCoordinator.hpp"

#include <cassert>
#include <iostream>
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace sdeck;

namespace {

    struct Harness {
        SessionTable sessions;
        SplitLayoutEngine engine;
        DragDropCoordinator dnd;
        std::mt19937 rng;
        bool oversubscribed{false};
        int failures{0};

        Harness(EngineConfig config, unsigned seed)
            : engine(sessions, config)
            , dnd(engine)
            , rng(seed) {}

        std::size_t pick(std::size_t n) {
            return std::uniform_int_distribution<std::size_t>(0, n - 1)(rng);
        }

        bool randomPanel(TabId& tab, PanelId& panel) {
            auto ids = engine.registry().tabIds();
            if (ids.empty()) return false;
            tab = ids[pick(ids.size())];
            auto panels = engine.registry().find(tab)->tree.panelIds();
            panel = panels[pick(panels.size())];
            return true;
        }

        std::string dump() const {
            std::string out;
            for (TabId id : engine.registry().tabIds()) {
                out += describe(*engine.snapshot(id));
            }
            return out;
        }

        std::size_t placedSessions() const {
            std::size_t total = 0;
            for (const auto& [id, tab] : engine.registry().tabs()) {
                total += tab.tree.sessions().size();
            }
            return total;
        }

        void verify() {
            std::string why;
            if (!engine.checkInvariants(&why)) {
                std::cerr << "invariant violated: " << why << "\n" << dump() << std::endl;
                assert(false);
            }

            // Sessions are never lost or duplicated by layout changes
            assert(sessions.liveCount() == placedSessions());

            std::vector<ColorId> colors;
            for (const auto& [id, tab] : engine.registry().tabs()) {
                auto c = tab.tree.colors();
                colors.insert(colors.end(), c.begin(), c.end());
            }
            if (colors.size() > engine.colors().paletteSize()) {
                oversubscribed = true;
            }
            if (!oversubscribed) {
                std::set<ColorId> unique(colors.begin(), colors.end());
                assert(unique.size() == colors.size());
            }
        }

        template <typename T>
        void expectUnchangedOnFailure(const Result<T>& result, const std::string& before) {
            if (!result.isOk()) {
                failures++;
                assert(dump() == before);
            }
        }

        void step() {
            std::string before = dump();
            TabId tab = NoTab;
            PanelId panel = NoPanel;

            switch (pick(10)) {
                case 0: {
                    SessionHandle s = sessions.adopt("local" + std::to_string(pick(100)));
                    auto opened = engine.openTab(s);
                    if (!opened) sessions.terminate(s);
                    expectUnchangedOnFailure(opened, before);
                    break;
                }
                case 1:
                case 2: {
                    if (!randomPanel(tab, panel)) break;
                    SplitType type = pick(2) ? SplitType::Vertical : SplitType::Horizontal;
                    expectUnchangedOnFailure(engine.split(tab, panel, type), before);
                    break;
                }
                case 3: {
                    if (!randomPanel(tab, panel)) break;
                    expectUnchangedOnFailure(engine.closePanel(tab, panel), before);
                    break;
                }
                case 4:
                case 5: {
                    TabId src_tab = NoTab;
                    PanelId src_panel = NoPanel;
                    if (!randomPanel(tab, panel) || !randomPanel(src_tab, src_panel)) break;
                    auto target = dnd.targetFor(tab, panel);
                    assert(target.isOk());

                    DragSource source = PanelSource{src_tab, src_panel};
                    std::size_t kind = pick(3);
                    if (kind == 1) {
                        source = RootTabSource{src_tab};
                    } else if (kind == 2) {
                        ConnectionSpec spec;
                        spec.host = "node" + std::to_string(pick(50));
                        source = SidebarSource{spec};
                    }

                    Status predicted = dnd.canDrop(source, *target);
                    auto outcome = dnd.resolveDrop(source, *target);
                    assert(predicted.isOk() == outcome.isOk());
                    expectUnchangedOnFailure(outcome, before);
                    break;
                }
                case 6: {
                    if (!randomPanel(tab, panel)) break;
                    expectUnchangedOnFailure(engine.moveToNewTab(tab, panel), before);
                    break;
                }
                case 7: {
                    if (!randomPanel(tab, panel)) break;
                    double share = static_cast<double>(pick(100)) / 100.0;
                    expectUnchangedOnFailure(engine.resizePanel(tab, panel, share), before);
                    break;
                }
                case 8: {
                    if (!randomPanel(tab, panel)) break;
                    expectUnchangedOnFailure(engine.focusPanel(tab, panel), before);
                    break;
                }
                case 9: {
                    // Keep tab closes rare so trees get a chance to grow
                    if (pick(4) != 0 || !randomPanel(tab, panel)) break;
                    expectUnchangedOnFailure(engine.closeTab(tab), before);
                    break;
                }
            }

            verify();
        }
    };
}

static void run(EngineConfig config, unsigned seed, int steps) {
    Harness h(config, seed);
    for (int i = 0; i < 3; ++i) {
        assert(h.engine.openTab(h.sessions.adopt("seed" + std::to_string(i))).isOk());
    }
    h.verify();

    for (int i = 0; i < steps; ++i) {
        h.step();
    }
    assert(h.failures > 0);
}

int main() {
    EngineConfig roomy;
    roomy.palette_size = 8;

    EngineConfig tight;
    tight.max_tabs = 4;
    tight.palette_size = 3;

    for (unsigned seed = 1; seed <= 8; ++seed) {
        run(roomy, seed, 400);
        run(tight, seed * 7919, 400);
    }

    std::cout << "test_invariants: all tests passed" << std::endl;
    return 0;
}
