#pragma once

#include "splitdeck/layout/LayoutTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sdeck {

enum class NodeKind {
    Panel,
    Split
};

/**
 * @brief Read-only copy of one tree node handed to the rendering layer
 */
struct NodeSnapshot {
    NodeKind kind{NodeKind::Panel};
    NodeId id{NoNode};

    std::optional<SessionHandle> session;
    bool focused{false};

    SplitType split_type{SplitType::Vertical};
    ColorId color{NoColor};
    std::vector<double> weights;
    std::vector<NodeSnapshot> children;

    bool isPanel() const { return kind == NodeKind::Panel; }
    bool occupied() const { return session.has_value(); }
};

struct TreeSnapshot {
    TabId tab{NoTab};
    std::string label;
    std::string group;
    ColorId group_color{NoColor};
    PanelId focused{NoPanel};
    std::size_t panel_count{0};
    std::optional<NodeSnapshot> root;
};

// Indented, one node per line. Used by the `show` command and in logs.
std::string describe(const TreeSnapshot& snapshot);

std::string toJSON(const TreeSnapshot& snapshot);

std::string escapeJSON(const std::string& in);

}
