#pragma once

/**
 * @file PanelTree.hpp
 * @brief Recursive panel layout of one tab
 *
 * Nodes live in an arena keyed by NodeId. Split containers store the ids
 * of their children, panels are the leaves. A tree is either empty, a
 * single panel (plain unsplit tab), or a split container root.
 *
 * Panel ids are stable for the lifetime of the panel. Paths (child indices
 * from the root) are recomputed on demand and change whenever the
 * structure does.
 */

#include "splitdeck/layout/ColorPool.hpp"
#include "splitdeck/layout/LayoutTypes.hpp"
#include "splitdeck/layout/TreeSnapshot.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sdeck {

using PanelPath = std::vector<std::size_t>;

std::string toString(const PanelPath& path);

struct TreeNode {
    NodeId id{NoNode};
    NodeKind kind{NodeKind::Panel};
    NodeId parent{NoNode};

    // Split containers
    SplitType split_type{SplitType::Vertical};
    std::vector<NodeId> children;
    std::vector<double> weights;
    ColorId color{NoColor};

    // Panels
    std::optional<SessionHandle> session;

    bool isPanel() const { return kind == NodeKind::Panel; }
    bool isSplit() const { return kind == NodeKind::Split; }
};

/**
 * @brief What a panel removal did to the tree
 */
struct CollapseResult {
    PanelId removed_panel{NoPanel};
    std::optional<SessionHandle> removed_session;
    std::vector<ColorId> released_colors;
    int dissolved_containers{0};
    bool became_unsplit{false};
    bool tree_empty{false};
};

class PanelTree {
public:
    PanelTree() = default;

    static PanelTree withSession(SessionHandle session);
    static PanelTree withEmptyPanel();

    bool isEmpty() const { return root_ == NoNode; }
    bool isSplit() const;

    NodeId root() const { return root_; }
    const TreeNode* node(NodeId id) const;

    std::size_t panelCount() const;
    std::size_t containerCount() const;
    int depth() const;

    std::vector<PanelId> panelIds() const;
    PanelId firstPanel() const;
    bool containsPanel(PanelId panel) const;

    std::optional<PanelPath> locate(PanelId panel) const;
    std::optional<NodeId> resolve(const PanelPath& path) const;

    std::optional<SessionHandle> session(PanelId panel) const;
    bool isOccupied(PanelId panel) const { return session(panel).has_value(); }
    std::optional<PanelId> findSession(SessionId session) const;
    std::vector<SessionHandle> sessions() const;
    std::vector<ColorId> colors() const;

    Result<PanelPath> split(const PanelPath& target, SplitType type, ColorPool& colors,
                            double ratio = layout_constants::DEFAULT_RATIO);

    Result<CollapseResult> close(const PanelPath& target, ColorPool& colors);

    // Ownership transfer helpers. The engine guarantees the preconditions.
    std::optional<SessionHandle> takeSession(PanelId panel);
    void placeSession(PanelId panel, SessionHandle session);

    Status setShare(PanelId panel, double share, double min_ratio);

    int collapse(ColorPool& colors);

    void releaseColors(ColorPool& colors) const;

    bool validate(std::string* why = nullptr) const;

    NodeSnapshot snapshotNode(NodeId id, PanelId focused) const;

private:
    std::unordered_map<NodeId, TreeNode> nodes_;
    NodeId root_{NoNode};

    static NodeId nextNodeId();

    TreeNode& createNode(NodeKind kind);
    TreeNode* mutableNode(NodeId id);
    const TreeNode* panelNode(PanelId panel) const;

    void replaceChild(NodeId parent, NodeId old_child, NodeId new_child);
    void collapseFrom(NodeId container, ColorPool& colors, CollapseResult& result);
    void dissolve(TreeNode& container, ColorPool& colors, CollapseResult& result);

    void collectPanels(NodeId id, std::vector<PanelId>& out) const;
    int depthOf(NodeId id) const;
    bool validateNode(NodeId id, NodeId expected_parent, std::size_t& visited,
                      std::string* why) const;
};

}
