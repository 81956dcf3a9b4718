/// @file traversal.hpp
/// @brief Explicit-stack, resumable depth-first walk over a node tree.

#pragma once

#include <blocktree-cpp/node.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace blocktree_cpp {

/// A node produced by a Traversal.
struct VisitedNode {
    NodePtr node;            ///< The visited node.
    std::size_t pos{0};      ///< Absolute position directly before the node.
    std::size_t depth{0};    ///< Depth of the node (children of the root are at depth 1).
    std::size_t index{0};    ///< Index of the node inside its parent.
    NodePtr parent;          ///< The node's parent.
};

/// A lazy depth-first (pre-order) sequence of the descendants of a node.
///
/// The walk keeps its own stack instead of recursing, so it handles deeply
/// nested documents and can be paused and resumed freely: every call to
/// next() yields one node. Call skip_children() to keep the walk from
/// descending into the node that was just yielded, or stop() to end it.
///
/// @code
/// auto walk = Traversal{doc};
/// while (auto v = walk.next()) {
///     if (v->node->role() == NodeRole::block_content) walk.skip_children();
/// }
/// @endcode
class Traversal {
public:
    /// Walk the descendants of `root`, whose content starts at absolute
    /// position `content_start` (0 for a document).
    explicit Traversal(NodePtr root, std::size_t content_start = 0);

    /// The next node, or nullopt when the walk is exhausted or stopped.
    auto next() -> std::optional<VisitedNode>;

    /// Do not descend into the node most recently returned by next().
    void skip_children() noexcept { descend_ = false; }

    /// End the walk. Subsequent calls to next() return nullopt.
    void stop() noexcept {
        stack_.clear();
        descend_ = false;
    }

    /// True when no further nodes will be produced.
    auto done() const noexcept -> bool { return stack_.empty() && !descend_; }

private:
    struct Frame {
        NodePtr node;
        std::size_t index;
        std::size_t pos;    // absolute position of the next child
        std::size_t depth;  // depth of the children
    };

    std::vector<Frame> stack_;
    std::optional<VisitedNode> last_;
    bool descend_ = false;
};

/// What a visitor wants the walk to do next.
enum class Visit : std::uint8_t {
    descend,        ///< Continue into the node's children.
    skip_children,  ///< Continue with the node's next sibling.
    stop,           ///< End the walk.
};

/// Visit every descendant of `root` in document order.
template <typename Fn>
    requires std::invocable<Fn, const VisitedNode&>
void for_each_descendant(const NodePtr& root, Fn&& fn, std::size_t content_start = 0) {
    auto walk = Traversal{root, content_start};
    while (auto v = walk.next()) {
        switch (fn(*v)) {
            case Visit::descend:       break;
            case Visit::skip_children: walk.skip_children(); break;
            case Visit::stop:          walk.stop(); break;
        }
    }
}

}  // namespace blocktree_cpp
