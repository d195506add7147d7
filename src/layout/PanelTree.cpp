#include "splitdeck/layout/PanelTree.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <numeric>
#include <sstream>

namespace sdeck {

namespace {

    constexpr double WEIGHT_EPSILON = 1e-6;

    void normalizeWeights(std::vector<double>& weights) {
        double total = std::accumulate(weights.begin(), weights.end(), 0.0);
        if (weights.empty()) return;
        if (total <= 0.0) {
            std::fill(weights.begin(), weights.end(), 1.0 / weights.size());
            return;
        }
        for (double& w : weights) {
            w /= total;
        }
    }

    std::size_t indexOf(const std::vector<NodeId>& children, NodeId child) {
        auto it = std::find(children.begin(), children.end(), child);
        return static_cast<std::size_t>(std::distance(children.begin(), it));
    }
}

std::string toString(const PanelPath& path) {
    std::ostringstream oss;
    oss << "[";
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << path[i];
    }
    oss << "]";
    return oss.str();
}

// ============================================================================
// Construction
// ============================================================================

NodeId PanelTree::nextNodeId() {
    // Ids are process-wide so a panel keeps its identity when trees are copied
    static std::atomic<NodeId> counter{1};
    return counter.fetch_add(1);
}

TreeNode& PanelTree::createNode(NodeKind kind) {
    NodeId id = nextNodeId();
    TreeNode& node = nodes_[id];
    node.id = id;
    node.kind = kind;
    return node;
}

PanelTree PanelTree::withSession(SessionHandle session) {
    PanelTree tree;
    TreeNode& panel = tree.createNode(NodeKind::Panel);
    panel.session = std::move(session);
    tree.root_ = panel.id;
    return tree;
}

PanelTree PanelTree::withEmptyPanel() {
    PanelTree tree;
    tree.root_ = tree.createNode(NodeKind::Panel).id;
    return tree;
}

// ============================================================================
// Queries
// ============================================================================

bool PanelTree::isSplit() const {
    const TreeNode* r = node(root_);
    return r && r->isSplit();
}

const TreeNode* PanelTree::node(NodeId id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

TreeNode* PanelTree::mutableNode(NodeId id) {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

const TreeNode* PanelTree::panelNode(PanelId panel) const {
    const TreeNode* n = node(panel);
    return (n && n->isPanel()) ? n : nullptr;
}

std::size_t PanelTree::panelCount() const {
    return static_cast<std::size_t>(std::count_if(nodes_.begin(), nodes_.end(),
        [](const auto& entry) { return entry.second.isPanel(); }));
}

std::size_t PanelTree::containerCount() const {
    return nodes_.size() - panelCount();
}

int PanelTree::depth() const {
    return depthOf(root_);
}

int PanelTree::depthOf(NodeId id) const {
    const TreeNode* n = node(id);
    if (!n) return 0;
    if (n->isPanel()) return 1;

    int deepest = 0;
    for (NodeId child : n->children) {
        deepest = std::max(deepest, depthOf(child));
    }
    return deepest + 1;
}

void PanelTree::collectPanels(NodeId id, std::vector<PanelId>& out) const {
    const TreeNode* n = node(id);
    if (!n) return;
    if (n->isPanel()) {
        out.push_back(id);
        return;
    }
    for (NodeId child : n->children) {
        collectPanels(child, out);
    }
}

std::vector<PanelId> PanelTree::panelIds() const {
    std::vector<PanelId> out;
    collectPanels(root_, out);
    return out;
}

PanelId PanelTree::firstPanel() const {
    const TreeNode* n = node(root_);
    while (n && n->isSplit()) {
        n = node(n->children.front());
    }
    return n ? n->id : NoPanel;
}

bool PanelTree::containsPanel(PanelId panel) const {
    return panelNode(panel) != nullptr;
}

std::optional<PanelPath> PanelTree::locate(PanelId panel) const {
    const TreeNode* n = panelNode(panel);
    if (!n) return std::nullopt;

    PanelPath path;
    while (n->parent != NoNode) {
        const TreeNode* parent = node(n->parent);
        SDECK_INVARIANT(parent != nullptr, "dangling parent link");
        path.push_back(indexOf(parent->children, n->id));
        n = parent;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

std::optional<NodeId> PanelTree::resolve(const PanelPath& path) const {
    const TreeNode* n = node(root_);
    if (!n) return std::nullopt;

    for (std::size_t index : path) {
        if (!n->isSplit() || index >= n->children.size()) {
            return std::nullopt;
        }
        n = node(n->children[index]);
    }
    return n->id;
}

std::optional<SessionHandle> PanelTree::session(PanelId panel) const {
    const TreeNode* n = panelNode(panel);
    if (!n) return std::nullopt;
    return n->session;
}

std::optional<PanelId> PanelTree::findSession(SessionId session) const {
    for (const auto& [id, n] : nodes_) {
        if (n.isPanel() && n.session && n.session->id == session) {
            return id;
        }
    }
    return std::nullopt;
}

std::vector<SessionHandle> PanelTree::sessions() const {
    std::vector<SessionHandle> out;
    for (PanelId panel : panelIds()) {
        const TreeNode* n = node(panel);
        if (n->session) out.push_back(*n->session);
    }
    return out;
}

std::vector<ColorId> PanelTree::colors() const {
    std::vector<ColorId> out;
    for (const auto& [id, n] : nodes_) {
        if (n.isSplit()) out.push_back(n.color);
    }
    std::sort(out.begin(), out.end());
    return out;
}

// ============================================================================
// Split
// ============================================================================

Result<PanelPath> PanelTree::split(const PanelPath& target, SplitType type, ColorPool& colors,
                                   double ratio) {
    auto id = resolve(target);
    if (!id || !node(*id)->isPanel()) {
        return Result<PanelPath>::fail(LayoutError::InvalidPath,
                                       "No panel at path " + toString(target));
    }
    if (ratio <= 0.0 || ratio >= 1.0) {
        ratio = layout_constants::DEFAULT_RATIO;
    }

    NodeId leaf_id = *id;
    NodeId parent_id = node(leaf_id)->parent;

    // The container takes the leaf's place; the leaf keeps its identity and
    // content as child 0
    TreeNode& container = createNode(NodeKind::Split);
    container.split_type = type;
    container.color = colors.allocate();
    container.parent = parent_id;

    TreeNode& fresh = createNode(NodeKind::Panel);
    fresh.parent = container.id;

    container.children = {leaf_id, fresh.id};
    container.weights = {ratio, 1.0 - ratio};

    if (parent_id == NoNode) {
        root_ = container.id;
    } else {
        replaceChild(parent_id, leaf_id, container.id);
    }
    nodes_.at(leaf_id).parent = container.id;

    PanelPath new_path = target;
    new_path.push_back(1);
    return Result<PanelPath>::ok(new_path);
}

void PanelTree::replaceChild(NodeId parent, NodeId old_child, NodeId new_child) {
    TreeNode& p = nodes_.at(parent);
    std::size_t index = indexOf(p.children, old_child);
    SDECK_INVARIANT(index < p.children.size(), "child not linked to its parent");
    p.children[index] = new_child;
}

// ============================================================================
// Close & Collapse
// ============================================================================

Result<CollapseResult> PanelTree::close(const PanelPath& target, ColorPool& colors) {
    auto id = resolve(target);
    if (!id || !node(*id)->isPanel()) {
        return Result<CollapseResult>::fail(LayoutError::InvalidPath,
                                            "No panel at path " + toString(target));
    }

    bool was_split = isSplit();

    CollapseResult result;
    result.removed_panel = *id;

    TreeNode& leaf = nodes_.at(*id);
    result.removed_session = std::move(leaf.session);
    NodeId parent_id = leaf.parent;
    nodes_.erase(*id);

    // Sole panel of an unsplit tab
    if (parent_id == NoNode) {
        root_ = NoNode;
        result.tree_empty = true;
        return Result<CollapseResult>::ok(std::move(result));
    }

    TreeNode& parent = nodes_.at(parent_id);
    std::size_t index = indexOf(parent.children, *id);
    SDECK_INVARIANT(index < parent.children.size(), "removed panel not linked to its parent");
    parent.children.erase(parent.children.begin() + index);
    parent.weights.erase(parent.weights.begin() + index);
    normalizeWeights(parent.weights);

    collapseFrom(parent_id, colors, result);

    result.became_unsplit = was_split && !isSplit();
    return Result<CollapseResult>::ok(std::move(result));
}

void PanelTree::collapseFrom(NodeId container, ColorPool& colors, CollapseResult& result) {
    NodeId current = container;
    while (current != NoNode) {
        TreeNode& c = nodes_.at(current);
        if (c.children.size() >= 2) {
            break;
        }
        SDECK_INVARIANT(!c.children.empty(), "split container left without children");

        NodeId next = c.parent;
        dissolve(c, colors, result);
        current = next;
    }
}

void PanelTree::dissolve(TreeNode& container, ColorPool& colors, CollapseResult& result) {
    NodeId container_id = container.id;
    NodeId survivor = container.children.front();
    NodeId parent_id = container.parent;
    ColorId color = container.color;

    // The survivor inherits the container's slot and weight in the grandparent
    nodes_.at(survivor).parent = parent_id;
    if (parent_id == NoNode) {
        root_ = survivor;
    } else {
        replaceChild(parent_id, container_id, survivor);
    }

    colors.release(color);
    result.released_colors.push_back(color);
    result.dissolved_containers++;

    nodes_.erase(container_id);
}

int PanelTree::collapse(ColorPool& colors) {
    int dissolved = 0;
    bool changed = true;

    while (changed) {
        changed = false;
        for (auto& [id, n] : nodes_) {
            if (n.isSplit() && n.children.size() < 2) {
                SDECK_INVARIANT(!n.children.empty(), "split container left without children");
                CollapseResult scratch;
                dissolve(n, colors, scratch);
                dissolved++;
                changed = true;
                break;
            }
        }
    }
    return dissolved;
}

void PanelTree::releaseColors(ColorPool& colors) const {
    for (const auto& [id, n] : nodes_) {
        if (n.isSplit()) colors.release(n.color);
    }
}

// ============================================================================
// Session transfer & resizing
// ============================================================================

std::optional<SessionHandle> PanelTree::takeSession(PanelId panel) {
    TreeNode* n = mutableNode(panel);
    if (!n || !n->isPanel()) return std::nullopt;

    std::optional<SessionHandle> taken = std::move(n->session);
    n->session.reset();
    return taken;
}

void PanelTree::placeSession(PanelId panel, SessionHandle session) {
    TreeNode* n = mutableNode(panel);
    SDECK_INVARIANT(n && n->isPanel(), "placing a session into a missing panel");
    SDECK_INVARIANT(!n->session, "placing a session into an occupied panel");
    n->session = std::move(session);
}

Status PanelTree::setShare(PanelId panel, double share, double min_ratio) {
    const TreeNode* n = panelNode(panel);
    if (!n) {
        return Status::fail(LayoutError::UnknownPanel, "Unknown panel " + std::to_string(panel));
    }
    if (n->parent == NoNode) {
        return Status::fail(LayoutError::InvalidTarget, "Panel is not inside a split");
    }

    TreeNode& container = nodes_.at(n->parent);
    std::size_t index = indexOf(container.children, panel);
    std::size_t count = container.children.size();

    double lo = min_ratio;
    double hi = 1.0 - min_ratio * static_cast<double>(count - 1);
    share = std::clamp(share, lo, std::max(lo, hi));

    double rest = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        if (i != index) rest += container.weights[i];
    }

    for (std::size_t i = 0; i < count; ++i) {
        if (i == index) {
            container.weights[i] = share;
        } else if (rest > 0.0) {
            container.weights[i] = container.weights[i] / rest * (1.0 - share);
        } else {
            container.weights[i] = (1.0 - share) / static_cast<double>(count - 1);
        }
    }
    return Status::ok();
}

// ============================================================================
// Validation & Snapshot
// ============================================================================

bool PanelTree::validate(std::string* why) const {
    if (root_ == NoNode) {
        if (!nodes_.empty()) {
            if (why) *why = "empty tree still holds nodes";
            return false;
        }
        return true;
    }

    const TreeNode* r = node(root_);
    if (!r || r->parent != NoNode) {
        if (why) *why = "root missing or has a parent";
        return false;
    }

    std::size_t visited = 0;
    if (!validateNode(root_, NoNode, visited, why)) {
        return false;
    }
    if (visited != nodes_.size()) {
        if (why) *why = "unreachable nodes in arena";
        return false;
    }
    return true;
}

bool PanelTree::validateNode(NodeId id, NodeId expected_parent, std::size_t& visited,
                             std::string* why) const {
    const TreeNode* n = node(id);
    if (!n) {
        if (why) *why = "dangling child id " + std::to_string(id);
        return false;
    }
    if (n->parent != expected_parent) {
        if (why) *why = "node " + std::to_string(id) + " has a stale parent link";
        return false;
    }
    visited++;

    if (n->isPanel()) {
        if (!n->children.empty()) {
            if (why) *why = "panel " + std::to_string(id) + " has children";
            return false;
        }
        if (n->session && !n->session->valid()) {
            if (why) *why = "panel " + std::to_string(id) + " holds an invalid session";
            return false;
        }
        return true;
    }

    if (n->children.size() < 2) {
        if (why) *why = "container " + std::to_string(id) + " has fewer than two children";
        return false;
    }
    if (n->weights.size() != n->children.size()) {
        if (why) *why = "container " + std::to_string(id) + " weight count mismatch";
        return false;
    }
    double total = std::accumulate(n->weights.begin(), n->weights.end(), 0.0);
    if (std::fabs(total - 1.0) > WEIGHT_EPSILON) {
        if (why) *why = "container " + std::to_string(id) + " weights do not sum to 1";
        return false;
    }
    if (n->color == NoColor) {
        if (why) *why = "container " + std::to_string(id) + " has no color";
        return false;
    }

    for (NodeId child : n->children) {
        if (!validateNode(child, id, visited, why)) {
            return false;
        }
    }
    return true;
}

NodeSnapshot PanelTree::snapshotNode(NodeId id, PanelId focused) const {
    const TreeNode* n = node(id);
    SDECK_INVARIANT(n != nullptr, "snapshot of a missing node");

    NodeSnapshot snap;
    snap.kind = n->kind;
    snap.id = n->id;

    if (n->isPanel()) {
        snap.session = n->session;
        snap.focused = (n->id == focused);
        return snap;
    }

    snap.split_type = n->split_type;
    snap.color = n->color;
    snap.weights = n->weights;
    for (NodeId child : n->children) {
        snap.children.push_back(snapshotNode(child, focused));
    }
    return snap;
}

}
