/// @file node_conversions.hpp
/// @brief Conversions between flat nodes and Block values.

#pragma once

#include <blocktree-cpp/block.hpp>
#include <blocktree-cpp/block_cache.hpp>
#include <blocktree-cpp/id_generator.hpp>
#include <blocktree-cpp/mark.hpp>
#include <blocktree-cpp/node.hpp>
#include <blocktree-cpp/schema.hpp>

#include <vector>

namespace blocktree_cpp {

// -- Styles and marks ---------------------------------------------------------

/// The marks expressing a set of styles (link marks are not styles).
auto styles_to_marks(const Styles& styles) -> MarkSet;

/// The styles expressed by a mark set. Unknown marks and links are ignored.
auto marks_to_styles(const MarkSet& marks) -> Styles;

// -- Inline content -----------------------------------------------------------

/// Convert inline content to inline nodes. Links become a `link` mark on
/// their runs and "\n" becomes a hard break node.
auto inline_content_to_nodes(const std::vector<InlineContent>& content) -> Fragment;

/// Convert the inline children of a content node to inline content.
///
/// A new run starts whenever the style set changes; consecutive runs with
/// the same link target are grouped into one Link.
auto content_node_to_inline_content(const Node& content_node) -> std::vector<InlineContent>;

// -- Blocks -------------------------------------------------------------------

/// Build a block frame from a partial block, recursively.
///
/// Missing ids are taken from `ids`, missing props from the schema
/// defaults, missing content is empty. Throws unknown_block_type when the
/// type is missing or unregistered, invalid_prop for bad props and
/// invalid_content for inline content on a content-less type.
auto block_to_node(const PartialBlock& block, const BlockSchema& schema,
                   const IdGenerator& ids) -> NodePtr;

/// Convert a block frame and all of its nested frames to a Block.
///
/// Frames found in `cache` are reused as is; every frame converted here is
/// added to it. Walks nested frames with an explicit stack. Throws
/// unknown_block_type for a content node whose type is not registered.
auto node_to_block(const NodePtr& frame, const BlockSchema& schema,
                   BlockCache* cache = nullptr) -> Block;

}  // namespace blocktree_cpp
