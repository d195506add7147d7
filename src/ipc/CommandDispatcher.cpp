#include "splitdeck/ipc/CommandDispatcher.hpp"

#include <sstream>
#include <stdexcept>

namespace sdeck {

namespace {

    std::uint64_t parseId(const std::string& arg) {
        std::size_t pos = 0;
        unsigned long long value = 0;
        try {
            if (!arg.empty() && arg[0] == '-') throw std::invalid_argument(arg);
            value = std::stoull(arg, &pos);
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Expected a number, got '" + arg + "'");
        }
        if (pos != arg.size()) {
            throw std::invalid_argument("Expected a number, got '" + arg + "'");
        }
        return value;
    }

    int parsePort(const std::string& arg) {
        std::uint64_t value = parseId(arg);
        if (value == 0 || value > 65535) {
            throw std::invalid_argument("Port out of range: " + arg);
        }
        return static_cast<int>(value);
    }

    double parseShare(const std::string& arg) {
        std::size_t pos = 0;
        double value = 0.0;
        try {
            value = std::stod(arg, &pos);
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Expected a fraction, got '" + arg + "'");
        }
        if (pos != arg.size()) {
            throw std::invalid_argument("Expected a fraction, got '" + arg + "'");
        }
        return value;
    }

    template <typename T>
    IPCResponse failure(const Result<T>& result) {
        return IPCResponse::error(std::string(toString(result.error)) + ": " + result.message);
    }

    const char* boolJSON(bool b) { return b ? "true" : "false"; }
}

std::string IPCResponse::format() const {
    if (success) {
        return "OK|" + message + "|" + data;
    }
    return "ERROR|" + message;
}

CommandDispatcher::CommandDispatcher(SplitLayoutEngine& engine, DragDropCoordinator& dnd)
    : engine_(engine)
    , dnd_(dnd) {}

std::vector<std::string> CommandDispatcher::parseCommand(const std::string& input) {
    std::vector<std::string> args;
    std::istringstream iss(input);
    std::string arg;

    while (iss >> arg) {
        args.push_back(arg);
    }

    return args;
}

bool CommandDispatcher::isQuit(const std::string& line) {
    auto args = parseCommand(line);
    return !args.empty() && (args[0] == "quit" || args[0] == "exit");
}

IPCResponse CommandDispatcher::execute(const std::string& line) {
    auto args = parseCommand(line);
    if (args.empty()) {
        return IPCResponse::error("Empty command");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return dispatch(args);
    }
    catch (const std::exception& e) {
        return IPCResponse::error(std::string("Error: ") + e.what());
    }
}

IPCResponse CommandDispatcher::dispatch(const std::vector<std::string>& args) {
    const std::string& cmd = args[0];

    if (cmd == "open") return cmdOpen(args);
    if (cmd == "split") return cmdSplit(args);
    if (cmd == "close") return cmdClose(args);
    if (cmd == "closetab") return cmdCloseTab(args);
    if (cmd == "detach") return cmdDetach(args);
    if (cmd == "focus") return cmdFocus(args);
    if (cmd == "resize") return cmdResize(args);
    if (cmd == "group") return cmdGroup(args);
    if (cmd == "drop") return cmdDrop(args);
    if (cmd == "tabs") return cmdTabs();
    if (cmd == "tree") return cmdTree(args, true);
    if (cmd == "show") return cmdTree(args, false);
    if (cmd == "check") return cmdCheck();
    if (cmd == "help") return IPCResponse::ok("Help", helpText());
    if (cmd == "quit" || cmd == "exit") {
        return IPCResponse::ok("Command sent", R"({"action": "quit"})");
    }
    return IPCResponse::error("Unknown command: " + cmd);
}

std::string CommandDispatcher::helpText() {
    return R"({"commands": [
    {"name": "open", "params": ["protocol", "host", "port?"]},
    {"name": "split", "params": ["v|h", "tab", "panel"]},
    {"name": "close", "params": ["tab", "panel"]},
    {"name": "closetab", "params": ["tab"]},
    {"name": "detach", "params": ["tab", "panel"]},
    {"name": "focus", "params": ["tab", "panel"]},
    {"name": "resize", "params": ["tab", "panel", "share"]},
    {"name": "group", "params": ["tab", "name?"]},
    {"name": "drop tab", "params": ["src_tab", "tab", "panel"]},
    {"name": "drop panel", "params": ["src_tab", "src_panel", "tab", "panel"]},
    {"name": "drop sidebar", "params": ["protocol", "host", "port", "tab", "panel"]},
    {"name": "tabs", "params": []},
    {"name": "tree", "params": ["tab"]},
    {"name": "show", "params": ["tab"]},
    {"name": "check", "params": []},
    {"name": "quit", "params": []}
]})";
}

// ============================================================================
// Tabs & Panels
// ============================================================================

IPCResponse CommandDispatcher::cmdOpen(const std::vector<std::string>& args) {
    if (args.size() < 3 || args.size() > 4) {
        return IPCResponse::error("Usage: open <protocol> <host> [port]");
    }

    ConnectionSpec spec;
    spec.protocol = args[1];
    spec.host = args[2];
    if (args.size() == 4) {
        spec.port = parsePort(args[3]);
    }

    auto opened = engine_.openConnection(spec);
    if (!opened) return failure(opened);

    auto focused = engine_.focusedPanel(*opened);
    std::ostringstream ss;
    ss << R"({"tab": )" << *opened << R"(, "panel": )" << (focused ? *focused : NoPanel) << "}";
    return IPCResponse::ok("Tab opened", ss.str());
}

IPCResponse CommandDispatcher::cmdSplit(const std::vector<std::string>& args) {
    if (args.size() != 4) {
        return IPCResponse::error("Usage: split <v|h> <tab> <panel>");
    }

    SplitType type;
    if (args[1] == "v" || args[1] == "vertical") {
        type = SplitType::Vertical;
    } else if (args[1] == "h" || args[1] == "horizontal") {
        type = SplitType::Horizontal;
    } else {
        return IPCResponse::error("Split direction must be v or h");
    }

    auto created = engine_.split(parseId(args[2]), parseId(args[3]), type);
    if (!created) return failure(created);

    return IPCResponse::ok("Panel split", R"({"panel": )" + std::to_string(*created) + "}");
}

IPCResponse CommandDispatcher::cmdClose(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        return IPCResponse::error("Usage: close <tab> <panel>");
    }

    auto closed = engine_.closePanel(parseId(args[1]), parseId(args[2]));
    if (!closed) return failure(closed);

    std::ostringstream ss;
    ss << R"({"dissolved": )" << closed->dissolved_containers
       << R"(, "unsplit": )" << boolJSON(closed->became_unsplit)
       << R"(, "tab_destroyed": )" << boolJSON(closed->tree_empty) << "}";
    return IPCResponse::ok("Panel closed", ss.str());
}

IPCResponse CommandDispatcher::cmdCloseTab(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return IPCResponse::error("Usage: closetab <tab>");
    }

    auto closed = engine_.closeTab(parseId(args[1]));
    if (!closed) return failure(closed);
    return IPCResponse::ok("Tab closed");
}

IPCResponse CommandDispatcher::cmdDetach(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        return IPCResponse::error("Usage: detach <tab> <panel>");
    }

    auto moved = engine_.moveToNewTab(parseId(args[1]), parseId(args[2]));
    if (!moved) return failure(moved);
    return IPCResponse::ok("Panel detached", R"({"tab": )" + std::to_string(*moved) + "}");
}

IPCResponse CommandDispatcher::cmdFocus(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        return IPCResponse::error("Usage: focus <tab> <panel>");
    }

    auto focused = engine_.focusPanel(parseId(args[1]), parseId(args[2]));
    if (!focused) return failure(focused);
    return IPCResponse::ok("Panel focused");
}

IPCResponse CommandDispatcher::cmdResize(const std::vector<std::string>& args) {
    if (args.size() != 4) {
        return IPCResponse::error("Usage: resize <tab> <panel> <share>");
    }

    auto resized = engine_.resizePanel(parseId(args[1]), parseId(args[2]), parseShare(args[3]));
    if (!resized) return failure(resized);
    return IPCResponse::ok("Panel resized");
}

IPCResponse CommandDispatcher::cmdGroup(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return IPCResponse::error("Usage: group <tab> [name]");
    }

    // Group names may contain spaces
    std::string name;
    for (std::size_t i = 2; i < args.size(); ++i) {
        if (i > 2) name += " ";
        name += args[i];
    }

    auto color = engine_.setTabGroup(parseId(args[1]), name);
    if (!color) return failure(color);
    return IPCResponse::ok(name.empty() ? "Group cleared" : "Group set",
                           R"({"color": )" + std::to_string(*color) + "}");
}

// ============================================================================
// Drag & Drop
// ============================================================================

IPCResponse CommandDispatcher::cmdDrop(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return IPCResponse::error("Usage: drop <tab|panel|sidebar> ...");
    }

    const std::string& kind = args[1];
    if (kind == "tab") {
        if (args.size() != 5) {
            return IPCResponse::error("Usage: drop tab <src_tab> <tab> <panel>");
        }
        return dropOnto(RootTabSource{parseId(args[2])}, parseId(args[3]), parseId(args[4]));
    }
    if (kind == "panel") {
        if (args.size() != 6) {
            return IPCResponse::error("Usage: drop panel <src_tab> <src_panel> <tab> <panel>");
        }
        return dropOnto(PanelSource{parseId(args[2]), parseId(args[3])},
                        parseId(args[4]), parseId(args[5]));
    }
    if (kind == "sidebar") {
        if (args.size() != 7) {
            return IPCResponse::error("Usage: drop sidebar <protocol> <host> <port> <tab> <panel>");
        }
        ConnectionSpec spec;
        spec.protocol = args[2];
        spec.host = args[3];
        spec.port = parsePort(args[4]);
        return dropOnto(SidebarSource{spec}, parseId(args[5]), parseId(args[6]));
    }
    return IPCResponse::error("Unknown drag source: " + kind);
}

IPCResponse CommandDispatcher::dropOnto(const DragSource& source, TabId tab, PanelId panel) {
    auto target = dnd_.targetFor(tab, panel);
    if (!target) return failure(target);

    auto outcome = dnd_.resolveDrop(source, *target);
    if (!outcome) return failure(outcome);

    std::ostringstream ss;
    ss << R"({"effect": ")" << toString(outcome->effect)
       << R"(", "tab": )" << outcome->target_tab
       << R"(, "panel": )" << outcome->target_panel
       << R"(, "evicted_to": )" << outcome->evicted_to
       << R"(, "source_tab_destroyed": )" << boolJSON(outcome->source_tab_destroyed) << "}";
    return IPCResponse::ok("Drop resolved", ss.str());
}

// ============================================================================
// Queries
// ============================================================================

IPCResponse CommandDispatcher::cmdTabs() const {
    std::ostringstream ss;
    ss << R"({"tabs": [)";
    bool first = true;
    for (const auto& tab : engine_.tabs()) {
        if (!first) ss << ", ";
        first = false;
        ss << R"({"id": )" << tab.id
           << R"(, "label": ")" << escapeJSON(tab.label)
           << R"(", "group": ")" << escapeJSON(tab.group)
           << R"(", "panels": )" << tab.panel_count
           << R"(, "focused": )" << tab.focused
           << R"(, "split": )" << boolJSON(tab.split) << "}";
    }
    ss << "]}";
    return IPCResponse::ok("Tabs retrieved", ss.str());
}

IPCResponse CommandDispatcher::cmdTree(const std::vector<std::string>& args, bool json) const {
    if (args.size() != 2) {
        return IPCResponse::error(std::string("Usage: ") + (json ? "tree" : "show") + " <tab>");
    }

    auto snap = engine_.snapshot(parseId(args[1]));
    if (!snap) return failure(snap);
    return IPCResponse::ok("Tree retrieved", json ? toJSON(*snap) : describe(*snap));
}

IPCResponse CommandDispatcher::cmdCheck() const {
    std::string why;
    if (!engine_.checkInvariants(&why)) {
        return IPCResponse::error("Invariant violated: " + why);
    }
    std::ostringstream ss;
    ss << R"({"tabs": )" << engine_.tabCount()
       << R"(, "panels": )" << engine_.registry().totalPanels() << "}";
    return IPCResponse::ok("Layout consistent", ss.str());
}

}
