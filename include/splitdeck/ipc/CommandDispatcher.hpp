#pragma once

#include "splitdeck/core/SplitLayoutEngine.hpp"
#include "splitdeck/dnd/DragDropCoordinator.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace sdeck {

struct IPCResponse {
    bool success;
    std::string message;
    std::string data;

    static IPCResponse ok(const std::string& msg = "", const std::string& json = "") {
        return {true, msg, json};
    }

    static IPCResponse error(const std::string& msg) {
        return {false, msg, ""};
    }

    // OK|message|data or ERROR|message
    std::string format() const;
};

/**
 * @brief Text command surface shared by the socket server and stdin
 *
 * Each command runs to completion while holding the engine mutex, so
 * commands from concurrent clients never interleave.
 */
class CommandDispatcher {
public:
    CommandDispatcher(SplitLayoutEngine& engine, DragDropCoordinator& dnd);

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    IPCResponse execute(const std::string& line);

    static std::vector<std::string> parseCommand(const std::string& input);

    static bool isQuit(const std::string& line);

    static std::string helpText();

private:
    SplitLayoutEngine& engine_;
    DragDropCoordinator& dnd_;
    std::mutex mutex_;

    IPCResponse dispatch(const std::vector<std::string>& args);

    IPCResponse cmdOpen(const std::vector<std::string>& args);
    IPCResponse cmdSplit(const std::vector<std::string>& args);
    IPCResponse cmdClose(const std::vector<std::string>& args);
    IPCResponse cmdCloseTab(const std::vector<std::string>& args);
    IPCResponse cmdDetach(const std::vector<std::string>& args);
    IPCResponse cmdFocus(const std::vector<std::string>& args);
    IPCResponse cmdResize(const std::vector<std::string>& args);
    IPCResponse cmdGroup(const std::vector<std::string>& args);
    IPCResponse cmdDrop(const std::vector<std::string>& args);
    IPCResponse cmdTabs() const;
    IPCResponse cmdTree(const std::vector<std::string>& args, bool json) const;
    IPCResponse cmdCheck() const;

    IPCResponse dropOnto(const DragSource& source, TabId tab, PanelId panel);
};

}
