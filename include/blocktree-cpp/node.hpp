/// @file node.hpp
/// @brief Immutable flat-document nodes and fragment helpers.

#pragma once

#include <blocktree-cpp/mark.hpp>
#include <blocktree-cpp/types.hpp>
#include <blocktree-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace blocktree_cpp {

/// The structural role of a node in the flat document.
///
/// The document shape is fixed:
/// doc > block_group > block_container* ;
/// block_container > block_content [block_group] ;
/// block_content > (text | hard_break)*.
enum class NodeRole : std::uint8_t {
    doc,              ///< The root. Holds exactly one block group.
    block_group,      ///< A list of block frames (the root list or a children group).
    block_container,  ///< A block frame. Carries the block id.
    block_content,    ///< The content node of a block. Carries type and props.
    text,             ///< A run of text with a mark set.
    hard_break,       ///< A line break inside inline content.
};

/// Convert a NodeRole to its string representation.
constexpr auto to_string_view(NodeRole role) noexcept -> std::string_view {
    switch (role) {
        case NodeRole::doc:             return "doc";
        case NodeRole::block_group:     return "blockGroup";
        case NodeRole::block_container: return "blockContainer";
        case NodeRole::block_content:   return "blockContent";
        case NodeRole::text:            return "text";
        case NodeRole::hard_break:      return "hardBreak";
    }
    return "unknown";
}

class Node;

/// Shared handle to an immutable node. Unchanged subtrees are shared
/// between snapshots, so handle identity doubles as structural identity.
using NodePtr = std::shared_ptr<const Node>;

/// An ordered sequence of sibling nodes.
using Fragment = std::vector<NodePtr>;

/// An immutable node of the flat document.
///
/// Nodes are never modified after construction: every change produces a new
/// node (with a new serial), and untouched nodes keep their identity across
/// snapshots. Positions follow the usual flat-tree convention: a text node
/// spans one position per code point, a hard break spans one position, and
/// every other node spans its content plus one open and one close token.
class Node {
    struct Private { explicit Private() = default; };

public:
    Node(Private, NodeRole role, std::string type, Attrs attrs, Fragment content,
         std::string text, MarkSet marks);

    Node(const Node&) = delete;
    auto operator=(const Node&) -> Node& = delete;

    // -- Factories ------------------------------------------------------------

    /// Create the document root around a single block group.
    static auto doc(NodePtr block_group) -> NodePtr;

    /// Create a block group holding the given block frames.
    static auto block_group(Fragment frames) -> NodePtr;

    /// Create a block frame: a content node and an optional children group.
    static auto block_container(std::string id, NodePtr content_node,
                                NodePtr children_group = nullptr) -> NodePtr;

    /// Create a content node of the given block type.
    static auto block_content(std::string type, Attrs attrs, Fragment inline_content = {}) -> NodePtr;

    /// Create a text node. Throws invalid_content for empty text.
    static auto text(std::string text, MarkSet marks = {}) -> NodePtr;

    /// Create a hard break node.
    static auto hard_break(MarkSet marks = {}) -> NodePtr;

    // -- Accessors ------------------------------------------------------------

    auto role() const noexcept -> NodeRole { return role_; }
    auto type() const noexcept -> const std::string& { return type_; }
    auto attrs() const noexcept -> const Attrs& { return attrs_; }
    auto content() const noexcept -> const Fragment& { return content_; }
    auto text() const noexcept -> const std::string& { return text_; }
    auto marks() const noexcept -> const MarkSet& { return marks_; }
    auto serial() const noexcept -> NodeSerial { return serial_; }

    /// Get an attribute by name, or nullptr.
    auto attr(std::string_view name) const -> const PropValue*;

    /// The block id of a block container (empty for other roles).
    auto block_id() const -> std::string;

    auto child_count() const noexcept -> std::size_t { return content_.size(); }
    auto child(std::size_t index) const -> const NodePtr& { return content_.at(index); }
    auto first_child() const -> const NodePtr& { return content_.at(0); }
    auto last_child() const -> const NodePtr& { return content_.at(content_.size() - 1); }

    /// Number of positions this node spans in its parent.
    auto node_size() const noexcept -> std::size_t { return node_size_; }

    /// Number of positions spanned by this node's children.
    auto content_size() const noexcept -> std::size_t { return content_size_; }

    auto is_text() const noexcept -> bool { return role_ == NodeRole::text; }
    auto is_inline() const noexcept -> bool {
        return role_ == NodeRole::text || role_ == NodeRole::hard_break;
    }
    auto is_leaf() const noexcept -> bool { return is_inline(); }
    auto is_textblock() const noexcept -> bool { return role_ == NodeRole::block_content; }

    /// Concatenated text of all descendant text nodes.
    auto text_content() const -> std::string;

    // -- Derivation -----------------------------------------------------------

    /// Copy of this node with different children.
    auto with_content(Fragment content) const -> NodePtr;

    /// Copy of this node with a different type and attributes, same children.
    auto with_markup(std::string type, Attrs attrs) const -> NodePtr;

    /// Copy of an inline node with a different mark set.
    auto with_marks(MarkSet marks) const -> NodePtr;

    /// Slice of a text node between two code-point offsets.
    auto cut_text(std::size_t from, std::size_t to) const -> NodePtr;

    /// Structural equality (role, type, attrs, text, marks and children).
    auto same_as(const Node& other) const -> bool;

private:
    NodeRole role_;
    std::string type_;
    Attrs attrs_;
    Fragment content_;
    std::string text_;
    MarkSet marks_;
    NodeSerial serial_;
    std::size_t content_size_;
    std::size_t node_size_;
};

// -- Fragment helpers ---------------------------------------------------------

/// Total size of a fragment.
auto fragment_size(const Fragment& fragment) noexcept -> std::size_t;

/// Locate the child containing (or starting at) an offset into a fragment.
///
/// Returns {index, offset of that child}. An offset that falls exactly on a
/// child boundary resolves to the child that starts there; the fragment size
/// resolves to {child_count, size}.
auto find_index(const Fragment& fragment, std::size_t pos) -> std::pair<std::size_t, std::size_t>;

/// The part of a fragment between two offsets. Only text nodes may be split;
/// a cut through any other node throws invalid_position.
auto cut_fragment(const Fragment& fragment, std::size_t from, std::size_t to) -> Fragment;

/// Append a node, merging it into a trailing text node with the same marks.
void append_inline(Fragment& fragment, NodePtr node);

/// Merge adjacent text nodes with equal mark sets.
auto normalize_inline(const Fragment& fragment) -> Fragment;

// -- Node schema --------------------------------------------------------------

/// The content node types a document accepts, with what each may contain.
///
/// The structural roles are fixed; only content node types are registered.
/// Every edit is checked against this table.
struct NodeSchema {
    std::map<std::string, ContentKind, std::less<>> content_types;

    /// Content kind of a registered type, or nullopt.
    auto content_kind(std::string_view type) const -> std::optional<ContentKind> {
        auto it = content_types.find(type);
        if (it == content_types.end()) return std::nullopt;
        return it->second;
    }
};

/// Check a node and all of its descendants against the document shape and
/// `schema`. Throws invalid_document on the first violation.
void check_node(const Node& node, const NodeSchema& schema, bool root_group = false);

}  // namespace blocktree_cpp
