/**
 * @file RiverForest.cpp
 * @brief River network construction, traversal and cleanup
 */

#include "RiverForest.hpp"
#include "Geometry.hpp"

#include <algorithm>
#include <deque>
#include <iterator>
#include <sstream>

namespace hydromesh {

namespace {

bool is_self_crossing(const LineString& line) {
    const auto& c = line.coords;
    const size_t segments = c.size() - 1;
    for (size_t i = 0; i + 2 < segments + 1; ++i) {
        BoundingBox bi;
        bi.expand(c[i]);
        bi.expand(c[i + 1]);
        for (size_t j = i + 2; j < segments; ++j) {
            // First and last segment of a closed reach legitimately meet
            if (i == 0 && j == segments - 1 && line.front() == line.back()) continue;

            BoundingBox bj;
            bj.expand(c[j]);
            bj.expand(c[j + 1]);
            if (!bi.intersects(bj)) continue;
            if (segment_intersection(c[i], c[i + 1], c[j], c[j + 1])) return true;
        }
    }
    return false;
}

void validate_reach(const LineString& reach, size_t index) {
    if (reach.size() < 2 || reach.length() == 0.0) {
        throw TopologyError("reach " + std::to_string(index) + " is degenerate (" +
                            std::to_string(reach.size()) + " coordinates, zero length)");
    }
    if (is_self_crossing(reach)) {
        throw TopologyError("reach " + std::to_string(index) + " crosses itself");
    }
}

} // anonymous namespace

// ============================================================================
// RiverTree
// ============================================================================

RiverTree::DfsIterator::DfsIterator(const RiverTree* tree, size_t start) : tree_(tree) {
    stack_.push_back(start);
}

RiverTree::DfsIterator& RiverTree::DfsIterator::operator++() {
    size_t current = stack_.back();
    stack_.pop_back();
    const auto& children = tree_->node(current).children;
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        stack_.push_back(*it);
    }
    if (stack_.empty()) {
        tree_ = nullptr;
    }
    return *this;
}

RiverTree::DfsIterator RiverTree::DfsRange::begin() const {
    if (tree_ == nullptr || tree_->size() == 0) return DfsIterator();
    return DfsIterator(tree_, 0);
}

RiverTree::RiverTree(LineString outlet_reach) {
    nodes_.push_back(RiverNode{std::move(outlet_reach), {}, std::nullopt});
}

size_t RiverTree::add_child(size_t parent, LineString reach) {
    size_t id = nodes_.size();
    nodes_.at(parent).children.push_back(id);
    nodes_.push_back(RiverNode{std::move(reach), {}, parent});
    return id;
}

std::vector<size_t> RiverTree::preorder() const {
    std::vector<size_t> order;
    order.reserve(nodes_.size());
    for (auto it = dfs().begin(); it != dfs().end(); ++it) {
        order.push_back(it.node_id());
    }
    return order;
}

double RiverTree::total_length() const {
    double total = 0.0;
    for (const auto& node : nodes_) total += node.reach.length();
    return total;
}

void RiverTree::compact(const std::vector<bool>& keep) {
    std::vector<RiverNode> rebuilt;
    rebuilt.reserve(nodes_.size());

    // (old id, new parent id)
    std::vector<std::pair<size_t, std::optional<size_t>>> stack{{0, std::nullopt}};
    while (!stack.empty()) {
        auto [old_id, new_parent] = stack.back();
        stack.pop_back();
        if (old_id != 0 && !keep[old_id]) continue;

        size_t new_id = rebuilt.size();
        rebuilt.push_back(RiverNode{std::move(nodes_[old_id].reach), {}, new_parent});
        if (new_parent.has_value()) {
            rebuilt[*new_parent].children.push_back(new_id);
        }
        const auto& children = nodes_[old_id].children;
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.emplace_back(*it, new_id);
        }
    }
    nodes_ = std::move(rebuilt);
}

void RiverTree::merge_with_child(size_t id) {
    RiverNode& node = nodes_.at(id);
    if (node.children.size() != 1) {
        throw TopologyError("cannot merge reach " + std::to_string(id) + " with " +
                            std::to_string(node.children.size()) + " tributaries");
    }
    size_t child_id = node.children.front();
    RiverNode& child = nodes_[child_id];

    // Tributary flows into this reach: child coordinates come first
    std::vector<Point2D> joined = child.reach.coords;
    joined.insert(joined.end(), node.reach.coords.begin() + 1, node.reach.coords.end());
    node.reach = LineString(std::move(joined));

    node.children = std::move(child.children);
    child.children.clear();
    for (size_t grandchild : node.children) {
        nodes_[grandchild].parent = id;
    }

    std::vector<bool> keep(nodes_.size(), true);
    keep[child_id] = false;
    compact(keep);
}

void RiverTree::dissolve(size_t id) {
    if (id == 0 || id >= nodes_.size()) {
        throw TopologyError("cannot dissolve reach " + std::to_string(id) + " of a " +
                            std::to_string(nodes_.size()) + "-reach river");
    }
    const size_t parent = *nodes_[id].parent;
    std::vector<size_t> lifted = std::move(nodes_[id].children);
    nodes_[id].children.clear();

    auto& siblings = nodes_[parent].children;
    auto pos = siblings.erase(std::find(siblings.begin(), siblings.end(), id));
    siblings.insert(pos, lifted.begin(), lifted.end());
    for (size_t child : lifted) {
        nodes_[child].parent = parent;
    }

    std::vector<bool> keep(nodes_.size(), true);
    keep[id] = false;
    compact(keep);
}

RiverTree RiverTree::subtree(size_t id) const {
    RiverTree result(nodes_.at(id).reach);

    // (old id, new id)
    std::vector<std::pair<size_t, size_t>> stack{{id, 0}};
    while (!stack.empty()) {
        auto [old_id, new_id] = stack.back();
        stack.pop_back();
        for (size_t child : nodes_[old_id].children) {
            stack.emplace_back(child, result.add_child(new_id, nodes_[child].reach));
        }
    }
    return result;
}

// ============================================================================
// RiverForest
// ============================================================================

RiverForest::RiverForest() : logger_("RiverForest") {
}

RiverForest::RiverForest(std::vector<RiverTree> trees)
    : trees_(std::move(trees)), logger_("RiverForest") {
}

RiverForest RiverForest::make_global_tree(const MultiLineString& reaches, double tolerance) {
    RiverForest forest;
    const size_t n = reaches.size();

    for (size_t i = 0; i < n; ++i) {
        validate_reach(reaches[i], i);
    }

    PointGrid inlets(tolerance);
    for (size_t i = 0; i < n; ++i) {
        inlets.insert(reaches[i].front(), i);
    }

    std::vector<std::optional<size_t>> parent(n);
    std::vector<std::vector<size_t>> children(n);
    for (size_t a = 0; a < n; ++a) {
        for (size_t b : inlets.query(reaches[a].back(), tolerance)) {
            if (b == a) continue;
            parent[a] = b;
            break;
        }
    }
    for (size_t a = 0; a < n; ++a) {
        if (parent[a].has_value()) children[*parent[a]].push_back(a);
    }

    std::vector<bool> placed(n, false);
    for (size_t root = 0; root < n; ++root) {
        if (parent[root].has_value()) continue;

        RiverTree tree(reaches[root]);
        placed[root] = true;
        std::deque<std::pair<size_t, size_t>> queue{{root, 0}};
        while (!queue.empty()) {
            auto [reach_id, node_id] = queue.front();
            queue.pop_front();
            for (size_t child : children[reach_id]) {
                size_t child_node = tree.add_child(node_id, reaches[child]);
                placed[child] = true;
                queue.emplace_back(child, child_node);
            }
        }
        forest.trees_.push_back(std::move(tree));
    }

    std::vector<size_t> cyclic;
    for (size_t i = 0; i < n; ++i) {
        if (!placed[i]) cyclic.push_back(i);
    }
    if (!cyclic.empty()) {
        std::ostringstream msg;
        msg << "reach network contains a cycle through reaches";
        for (size_t i = 0; i < std::min<size_t>(cyclic.size(), 10); ++i) msg << " " << cyclic[i];
        if (cyclic.size() > 10) msg << " ...";
        throw TopologyError(msg.str());
    }

    forest.logger_.detailed("Built " + std::to_string(forest.trees_.size()) + " river trees from " +
                            std::to_string(n) + " reaches");
    return forest;
}

size_t RiverForest::num_reaches() const {
    size_t total = 0;
    for (const auto& tree : trees_) total += tree.size();
    return total;
}

MultiLineString RiverForest::forest_to_list() const {
    MultiLineString lines;
    lines.reserve(num_reaches());
    for (const auto& tree : trees_) {
        for (const auto& reach : tree.dfs()) {
            lines.push_back(reach);
        }
    }
    return lines;
}

size_t RiverForest::prune_by_reach_count(size_t min_reaches) {
    size_t removed = 0;
    std::vector<RiverTree> kept;
    for (auto& tree : trees_) {
        if (tree.size() < min_reaches) {
            logger_.info("  ...removing river with " + std::to_string(tree.size()) + " reaches");
            ++removed;
        } else {
            logger_.info("  ...keeping river with " + std::to_string(tree.size()) + " reaches");
            kept.push_back(std::move(tree));
        }
    }
    trees_ = std::move(kept);
    return removed;
}

size_t RiverForest::remove_collapsed_reaches() {
    size_t removed = 0;
    std::deque<RiverTree> pending(std::make_move_iterator(trees_.begin()),
                                  std::make_move_iterator(trees_.end()));
    std::vector<RiverTree> kept;

    while (!pending.empty()) {
        RiverTree tree = std::move(pending.front());
        pending.pop_front();

        if (tree.reach(0).size() < 2) {
            ++removed;
            const auto& children = tree.node(0).children;
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                pending.push_front(tree.subtree(*it));
            }
            continue;
        }

        bool changed = true;
        while (changed) {
            changed = false;
            for (size_t id = 1; id < tree.size(); ++id) {
                if (tree.reach(id).size() < 2) {
                    tree.dissolve(id);
                    ++removed;
                    changed = true;
                    break;
                }
            }
        }
        kept.push_back(std::move(tree));
    }

    trees_ = std::move(kept);
    if (removed > 0) {
        logger_.detailed("Removed " + std::to_string(removed) + " collapsed reaches");
    }
    return removed;
}

void RiverForest::cleanup(double simplify_tol, double prune_tol, double merge_tol,
                          const PlanarGeometryKernel& kernel) {
    size_t pruned = 0;
    size_t merged = 0;

    for (auto& tree : trees_) {
        for (size_t id = 0; id < tree.size(); ++id) {
            LineString& reach = tree.reach(id);
            remove_repeated_points(reach);
            reach = kernel.simplify(reach, simplify_tol);
        }

        if (prune_tol > 0.0) {
            std::vector<bool> keep(tree.size(), true);
            for (size_t id = 1; id < tree.size(); ++id) {
                const RiverNode& node = tree.node(id);
                if (node.children.empty() && node.reach.length() < prune_tol) {
                    keep[id] = false;
                    ++pruned;
                }
            }
            if (std::find(keep.begin(), keep.end(), false) != keep.end()) {
                tree.compact(keep);
            }
        }

        if (merge_tol > 0.0) {
            bool changed = true;
            while (changed) {
                changed = false;
                for (size_t id = 0; id < tree.size(); ++id) {
                    const RiverNode& node = tree.node(id);
                    if (node.children.size() == 1 && node.reach.length() < merge_tol) {
                        tree.merge_with_child(id);
                        ++merged;
                        changed = true;
                        break;
                    }
                }
            }
        }
    }

    logger_.detailed("Cleanup pruned " + std::to_string(pruned) + " short tributaries and merged " +
                     std::to_string(merged) + " short reaches");
}

} // namespace hydromesh
