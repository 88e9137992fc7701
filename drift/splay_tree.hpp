#pragma once

/**
 * SplayTree - Self-adjusting ordered map keyed by float coordinates
 *
 * Every access (insert, find, boundary/successor lookup, remove) rotates
 * the touched node to the root with bottom-up zig / zig-zig / zig-zag
 * steps. No balance information is stored: a single operation may cost
 * O(n), but any sequence costs O(log n) amortized per operation, and
 * accesses close in key order to the previous one are O(1) amortized.
 * Float placement walks down the page in document order, which is
 * exactly that access pattern.
 *
 * Nodes live in an arena (std::vector) and refer to each other by index.
 * Indices stay valid across rotations; a removed node's slot goes on a
 * free list and is reused by a later insert. Growing the arena may move
 * nodes in memory, so do not hold a Node& across insert().
 *
 * Scans that must not disturb the tree shape use next()/prev(), which
 * step in key order through the parent links without splaying.
 */

#include <cstdint>
#include <cstddef>
#include <vector>
#include <utility>

namespace drift {

/**
 * Tree statistics, see SplayTree::get_stats()
 */
struct SplayTreeStats {
    int node_count;          // live nodes
    int height;              // longest root-to-leaf path, in nodes
    double average_depth;    // mean depth of all nodes (root = 1)
    uint64_t rotations;      // rotations performed since construction or clear()
};

template <typename Value>
class SplayTree {
public:
    typedef uint32_t NodeId;
    static constexpr NodeId NIL = UINT32_MAX;

    struct Node {
        float key;
        Value value;
        NodeId parent;
        NodeId left;
        NodeId right;
    };

    SplayTree() : root_(NIL), size_(0), rotations_(0) {}

    // --- Accessors ---

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    NodeId root() const { return root_; }

    float key(NodeId id) const { return nodes_[id].key; }
    Value& value(NodeId id) { return nodes_[id].value; }
    const Value& value(NodeId id) const { return nodes_[id].value; }
    const Node& node(NodeId id) const { return nodes_[id]; }

    void clear() {
        nodes_.clear();
        free_list_.clear();
        root_ = NIL;
        size_ = 0;
        rotations_ = 0;
    }

    // --- Splaying operations ---

    /**
     * Insert key with value. If key is already present the existing node is
     * returned unchanged and *inserted is set to false.
     */
    NodeId insert(float key, const Value& value, bool* inserted = nullptr) {
        if (root_ == NIL) {
            root_ = alloc_node(key, value, NIL);
            size_ = 1;
            if (inserted) *inserted = true;
            return root_;
        }

        NodeId last = NIL;
        NodeId found = descend(key, &last);
        if (found != NIL) {
            splay(found);
            if (inserted) *inserted = false;
            return found;
        }

        NodeId id = alloc_node(key, value, last);
        if (key < nodes_[last].key) {
            nodes_[last].left = id;
        } else {
            nodes_[last].right = id;
        }
        size_++;
        splay(id);
        if (inserted) *inserted = true;
        return id;
    }

    /**
     * Exact lookup. On a miss the last node visited is splayed.
     */
    NodeId find(float key) {
        NodeId last = NIL;
        NodeId found = descend(key, &last);
        splay(found != NIL ? found : last);
        return found;
    }

    /**
     * Node with the greatest key <= key, i.e. the interval containing key
     * when nodes are interval starts. NIL if key precedes every node.
     */
    NodeId find_boundary(float key) {
        NodeId best = NIL;
        NodeId last = NIL;
        NodeId cur = root_;
        while (cur != NIL) {
            last = cur;
            if (nodes_[cur].key <= key) {
                best = cur;
                if (nodes_[cur].key == key) break;
                cur = nodes_[cur].right;
            } else {
                cur = nodes_[cur].left;
            }
        }
        splay(best != NIL ? best : last);
        return best;
    }

    /**
     * Node with the smallest key strictly greater than key, or NIL.
     */
    NodeId successor(float key) {
        NodeId best = NIL;
        NodeId last = NIL;
        NodeId cur = root_;
        while (cur != NIL) {
            last = cur;
            if (nodes_[cur].key > key) {
                best = cur;
                cur = nodes_[cur].left;
            } else {
                cur = nodes_[cur].right;
            }
        }
        splay(best != NIL ? best : last);
        return best;
    }

    /**
     * Node with the greatest key strictly less than key, or NIL.
     */
    NodeId predecessor(float key) {
        NodeId best = NIL;
        NodeId last = NIL;
        NodeId cur = root_;
        while (cur != NIL) {
            last = cur;
            if (nodes_[cur].key < key) {
                best = cur;
                cur = nodes_[cur].right;
            } else {
                cur = nodes_[cur].left;
            }
        }
        splay(best != NIL ? best : last);
        return best;
    }

    NodeId first() {
        NodeId id = leftmost(root_);
        splay(id);
        return id;
    }

    NodeId last() {
        NodeId id = rightmost(root_);
        splay(id);
        return id;
    }

    /**
     * Remove key. The node is splayed to the root, then its subtrees are
     * joined by splaying the maximum of the left subtree.
     * @return false if key is not present
     */
    bool remove(float key) {
        NodeId x = find(key);
        if (x == NIL) return false;

        NodeId left = nodes_[x].left;
        NodeId right = nodes_[x].right;
        free_node(x);

        if (left == NIL) {
            root_ = right;
            if (right != NIL) nodes_[right].parent = NIL;
        } else {
            nodes_[left].parent = NIL;
            root_ = left;
            NodeId max = rightmost(left);
            splay(max);
            nodes_[max].right = right;
            if (right != NIL) nodes_[right].parent = max;
        }
        size_--;
        return true;
    }

    /**
     * Rotate x to the root.
     */
    void splay(NodeId x) {
        if (x == NIL) return;
        while (nodes_[x].parent != NIL) {
            NodeId p = nodes_[x].parent;
            NodeId g = nodes_[p].parent;
            if (g != NIL) {
                bool zig_zig = (nodes_[g].left == p) == (nodes_[p].left == x);
                rotate(zig_zig ? p : x);
            }
            rotate(x);
        }
    }

    // --- Non-splaying traversal ---

    /**
     * In-order successor of a node, without restructuring.
     */
    NodeId next(NodeId id) const {
        if (id == NIL) return NIL;
        if (nodes_[id].right != NIL) return leftmost(nodes_[id].right);
        NodeId p = nodes_[id].parent;
        while (p != NIL && nodes_[p].right == id) {
            id = p;
            p = nodes_[p].parent;
        }
        return p;
    }

    /**
     * In-order predecessor of a node, without restructuring.
     */
    NodeId prev(NodeId id) const {
        if (id == NIL) return NIL;
        if (nodes_[id].left != NIL) return rightmost(nodes_[id].left);
        NodeId p = nodes_[id].parent;
        while (p != NIL && nodes_[p].left == id) {
            id = p;
            p = nodes_[p].parent;
        }
        return p;
    }

    /**
     * Visit nodes in key order. fn(const Node&) returns false to stop.
     * @return number of nodes visited
     */
    template <typename Fn>
    int foreach_inorder(Fn fn) const {
        int count = 0;
        for (NodeId id = leftmost(root_); id != NIL; id = next(id)) {
            count++;
            if (!fn(nodes_[id])) break;
        }
        return count;
    }

    // --- Validation and debug ---

    int height() const {
        SplayTreeStats stats;
        get_stats(&stats);
        return stats.height;
    }

    /**
     * Check ordering, parent links and the node count.
     */
    bool validate() const {
        if (root_ == NIL) return size_ == 0;
        if (nodes_[root_].parent != NIL) return false;

        size_t count = 0;
        std::vector<NodeId> stack;
        stack.push_back(root_);
        while (!stack.empty()) {
            NodeId id = stack.back();
            stack.pop_back();
            count++;
            if (count > size_) return false;  // cycle
            const Node& n = nodes_[id];
            if (n.left != NIL) {
                if (nodes_[n.left].parent != id) return false;
                stack.push_back(n.left);
            }
            if (n.right != NIL) {
                if (nodes_[n.right].parent != id) return false;
                stack.push_back(n.right);
            }
        }
        if (count != size_) return false;

        NodeId prev_id = NIL;
        for (NodeId id = leftmost(root_); id != NIL; id = next(id)) {
            if (prev_id != NIL && !(nodes_[prev_id].key < nodes_[id].key)) return false;
            prev_id = id;
        }
        return true;
    }

    void get_stats(SplayTreeStats* stats) const {
        stats->node_count = static_cast<int>(size_);
        stats->height = 0;
        stats->average_depth = 0;
        stats->rotations = rotations_;
        if (root_ == NIL) return;

        // iterative: a splay tree may degenerate into a list
        double depth_sum = 0;
        std::vector<std::pair<NodeId, int> > stack;
        stack.push_back(std::make_pair(root_, 1));
        while (!stack.empty()) {
            std::pair<NodeId, int> top = stack.back();
            stack.pop_back();
            depth_sum += top.second;
            if (top.second > stats->height) stats->height = top.second;
            const Node& n = nodes_[top.first];
            if (n.left != NIL) stack.push_back(std::make_pair(n.left, top.second + 1));
            if (n.right != NIL) stack.push_back(std::make_pair(n.right, top.second + 1));
        }
        stats->average_depth = depth_sum / static_cast<double>(size_);
    }

private:
    NodeId alloc_node(float key, const Value& value, NodeId parent) {
        Node n = {key, value, parent, NIL, NIL};
        if (!free_list_.empty()) {
            NodeId id = free_list_.back();
            free_list_.pop_back();
            nodes_[id] = n;
            return id;
        }
        nodes_.push_back(n);
        return static_cast<NodeId>(nodes_.size() - 1);
    }

    void free_node(NodeId id) {
        nodes_[id].parent = nodes_[id].left = nodes_[id].right = NIL;
        free_list_.push_back(id);
    }

    /**
     * Exact-match descent without restructuring; *last receives the final
     * node visited (the attachment point for an insert).
     */
    NodeId descend(float key, NodeId* last) const {
        NodeId cur = root_;
        while (cur != NIL) {
            *last = cur;
            float k = nodes_[cur].key;
            if (key == k) return cur;
            cur = key < k ? nodes_[cur].left : nodes_[cur].right;
        }
        return NIL;
    }

    NodeId leftmost(NodeId id) const {
        if (id == NIL) return NIL;
        while (nodes_[id].left != NIL) id = nodes_[id].left;
        return id;
    }

    NodeId rightmost(NodeId id) const {
        if (id == NIL) return NIL;
        while (nodes_[id].right != NIL) id = nodes_[id].right;
        return id;
    }

    /**
     * Rotate x above its parent.
     */
    void rotate(NodeId x) {
        NodeId p = nodes_[x].parent;
        NodeId g = nodes_[p].parent;
        if (nodes_[p].left == x) {
            NodeId b = nodes_[x].right;
            nodes_[p].left = b;
            if (b != NIL) nodes_[b].parent = p;
            nodes_[x].right = p;
        } else {
            NodeId b = nodes_[x].left;
            nodes_[p].right = b;
            if (b != NIL) nodes_[b].parent = p;
            nodes_[x].left = p;
        }
        nodes_[p].parent = x;
        nodes_[x].parent = g;
        if (g == NIL) {
            root_ = x;
        } else if (nodes_[g].left == p) {
            nodes_[g].left = x;
        } else {
            nodes_[g].right = x;
        }
        rotations_++;
    }

    std::vector<Node> nodes_;
    std::vector<NodeId> free_list_;
    NodeId root_;
    size_t size_;
    uint64_t rotations_;
};

}  // namespace drift
