/// @file resolved_pos.hpp
/// @brief ResolvedPos: a document position with its ancestor path.

#pragma once

#include <blocktree-cpp/mark.hpp>
#include <blocktree-cpp/node.hpp>

#include <cstddef>
#include <vector>

namespace blocktree_cpp {

/// A position resolved against a document snapshot.
///
/// Holds, for every depth from the root (0) down to the innermost node whose
/// content contains the position, the node, the index of the child the
/// position points into, and the absolute start of that node's content.
///
/// @code
/// auto rpos = ResolvedPos::resolve(doc, 5);
/// auto container = rpos.node(rpos.depth() - 1);
/// @endcode
class ResolvedPos {
public:
    /// Resolve `pos` inside `doc`. Throws invalid_position when `pos`
    /// lies outside [0, doc->content_size()].
    static auto resolve(const NodePtr& doc, std::size_t pos) -> ResolvedPos;

    /// The resolved position.
    auto pos() const noexcept -> std::size_t { return pos_; }

    /// Depth of the innermost parent node (0 = the document itself).
    auto depth() const noexcept -> std::size_t { return path_.size() - 1; }

    /// The ancestor at a given depth.
    auto node(std::size_t depth) const -> const NodePtr& { return path_.at(depth).node; }

    /// The innermost parent.
    auto parent() const -> const NodePtr& { return path_.back().node; }

    /// Index into the ancestor at `depth` that the position points at.
    auto index(std::size_t depth) const -> std::size_t { return path_.at(depth).index; }

    /// Index of the child of the parent that the position points at.
    auto index() const -> std::size_t { return path_.back().index; }

    /// Absolute position at the start of the content of the ancestor at `depth`.
    auto start(std::size_t depth) const -> std::size_t;

    /// Absolute position at the end of the content of the ancestor at `depth`.
    auto end(std::size_t depth) const -> std::size_t;

    /// Absolute position directly before the ancestor at `depth` (depth >= 1).
    auto before(std::size_t depth) const -> std::size_t;

    /// Absolute position directly after the ancestor at `depth` (depth >= 1).
    auto after(std::size_t depth) const -> std::size_t;

    /// Offset of the position inside its parent's content.
    auto parent_offset() const -> std::size_t { return pos_ - start(depth()); }

    /// Offset into the text node the position points into (0 at a boundary).
    auto text_offset() const -> std::size_t;

    /// The node directly after the position, or nullptr.
    auto node_after() const -> NodePtr;

    /// The node directly before the position, or nullptr.
    auto node_before() const -> NodePtr;

    /// Marks active at the position: those of the text before it, or of the
    /// text after it at the start of a textblock.
    auto marks() const -> MarkSet;

private:
    struct Entry {
        NodePtr node;
        std::size_t index;
        std::size_t offset;  // absolute position of child `index` (start of content when depth = 0)
    };

    ResolvedPos(std::size_t pos, std::vector<Entry> path)
        : pos_{pos}, path_{std::move(path)} {}

    std::size_t pos_;
    std::vector<Entry> path_;
};

}  // namespace blocktree_cpp
