/**
 * @file RiverForest.hpp
 * @brief River networks as index-addressed trees of reaches
 *
 * Reaches are oriented upstream to downstream: front() is the inlet,
 * back() the outlet. A tributary's outlet meets its parent's inlet.
 */

#pragma once

#include "hydromesh.hpp"
#include "PlanarGeometryKernel.hpp"
#include "Logger.hpp"

#include <iterator>
#include <optional>
#include <vector>

namespace hydromesh {

struct RiverNode {
    LineString reach;
    std::vector<size_t> children;      ///< Upstream tributaries, owned
    std::optional<size_t> parent;      ///< Downstream reach; absent for the outlet
};

/**
 * @brief One connected river network; node 0 is the outlet reach
 */
class RiverTree {
public:
    /**
     * @brief Pre-order depth-first iterator over reaches
     */
    class DfsIterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = LineString;
        using difference_type = std::ptrdiff_t;
        using pointer = const LineString*;
        using reference = const LineString&;

        DfsIterator() : tree_(nullptr) {}
        DfsIterator(const RiverTree* tree, size_t start);

        reference operator*() const { return tree_->node(stack_.back()).reach; }
        pointer operator->() const { return &tree_->node(stack_.back()).reach; }

        size_t node_id() const { return stack_.back(); }

        DfsIterator& operator++();
        DfsIterator operator++(int) {
            DfsIterator copy = *this;
            ++(*this);
            return copy;
        }

        bool operator==(const DfsIterator& other) const { return stack_ == other.stack_; }
        bool operator!=(const DfsIterator& other) const { return !(*this == other); }

    private:
        const RiverTree* tree_;
        std::vector<size_t> stack_;
    };

    /**
     * @brief Restartable view; every begin() starts a fresh traversal
     */
    class DfsRange {
    public:
        explicit DfsRange(const RiverTree* tree) : tree_(tree) {}
        DfsIterator begin() const;
        DfsIterator end() const { return DfsIterator(); }

    private:
        const RiverTree* tree_;
    };

    explicit RiverTree(LineString outlet_reach);

    /**
     * @brief Attach a tributary upstream of parent
     * @return Id of the new node
     */
    size_t add_child(size_t parent, LineString reach);

    size_t size() const { return nodes_.size(); }
    const RiverNode& node(size_t id) const { return nodes_.at(id); }
    const RiverNode& root() const { return nodes_.front(); }

    LineString& reach(size_t id) { return nodes_.at(id).reach; }
    const LineString& reach(size_t id) const { return nodes_.at(id).reach; }

    DfsRange dfs() const { return DfsRange(this); }

    /**
     * @brief Node ids in the same pre-order as dfs()
     */
    std::vector<size_t> preorder() const;

    double total_length() const;

    /**
     * @brief Drop nodes marked false together with their subtrees
     *
     * Survivors are renumbered in pre-order. The outlet is always kept.
     */
    void compact(const std::vector<bool>& keep);

    /**
     * @brief Replace a node by its only child, joining the two reaches
     */
    void merge_with_child(size_t id);

    /**
     * @brief Remove a non-outlet node, handing its tributaries to its parent
     *
     * The tributaries take the removed node's place in the parent's child
     * list.
     */
    void dissolve(size_t id);

    /**
     * @brief Copy of the subtree rooted at id, with id as the new outlet
     */
    RiverTree subtree(size_t id) const;

private:
    std::vector<RiverNode> nodes_;
};

/**
 * @brief Disjoint river networks
 */
class RiverForest {
public:
    RiverForest();
    explicit RiverForest(std::vector<RiverTree> trees);

    /**
     * @brief Connect reaches into trees by endpoint adjacency
     *
     * Reach A becomes a tributary of reach B when A's outlet lies within
     * tolerance of B's inlet; the nearest inlet wins, ties going to the
     * lowest reach index. Children keep input order.
     *
     * @throws TopologyError for degenerate or self-crossing reaches and for
     *         cyclic networks
     */
    static RiverForest make_global_tree(const MultiLineString& reaches, double tolerance);

    size_t size() const { return trees_.size(); }
    bool empty() const { return trees_.empty(); }
    size_t num_reaches() const;

    const std::vector<RiverTree>& trees() const { return trees_; }
    std::vector<RiverTree>& trees() { return trees_; }
    const RiverTree& tree(size_t i) const { return trees_.at(i); }
    RiverTree& tree(size_t i) { return trees_.at(i); }

    std::vector<RiverTree>::const_iterator begin() const { return trees_.begin(); }
    std::vector<RiverTree>::const_iterator end() const { return trees_.end(); }

    /**
     * @brief All reaches of all trees, tree by tree in depth-first order
     */
    MultiLineString forest_to_list() const;

    /**
     * @brief Remove whole trees with fewer than min_reaches reaches
     * @return Number of trees removed
     */
    size_t prune_by_reach_count(size_t min_reaches);

    /**
     * @brief Remove reaches left with fewer than two coordinates
     *
     * Tributaries of a removed reach move to its parent; when the removed
     * reach is an outlet, each tributary becomes the outlet of a tree of
     * its own. A tree with nothing left is dropped.
     *
     * @return Number of reaches removed
     */
    size_t remove_collapsed_reaches();

    /**
     * @brief Tidy reach geometry without moving junctions
     *
     * Drops repeated coordinates, simplifies each reach with its endpoints
     * fixed, removes leaf tributaries shorter than prune_tol and folds
     * reaches shorter than merge_tol into their single upstream child.
     */
    void cleanup(double simplify_tol, double prune_tol, double merge_tol,
                 const PlanarGeometryKernel& kernel);

private:
    std::vector<RiverTree> trees_;
    Logger logger_;
};

} // namespace hydromesh
