/// @file format.hpp
/// @brief HTML and Markdown codecs for block trees.

#pragma once

#include <blocktree-cpp/block.hpp>
#include <blocktree-cpp/schema.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace blocktree_cpp {

/// Serialize blocks to HTML.
///
/// Consecutive list items are grouped into `<ul>`/`<ol>`, with nested list
/// items inside the `<li>`. Children of other blocks follow their parent
/// unnested. Text and attribute values are escaped.
auto blocks_to_html(const std::vector<Block>& blocks) -> std::string;

/// Parse HTML into partial blocks (without ids).
///
/// `p`, `h1`-`h6` (levels above 3 clamp to 3), `ul`/`ol`/`li` with nesting,
/// `img` and `div[data-content-type]` become blocks; `strong`, `em`, `u`,
/// `s`, `code`, `a` and `span[data-text-color|data-background-color]` become
/// styled inline content and `br` a hard break. Unrecognized tags are
/// skipped and their text lands in the enclosing block or a new paragraph.
/// Whitespace collapses as in rendered HTML except inside `pre`. A block
/// type missing from `schema` becomes a paragraph.
auto html_to_blocks(std::string_view html, const BlockSchema& schema)
    -> std::vector<PartialBlock>;

/// Serialize blocks to Markdown.
///
/// Underline and colours have no Markdown form and are dropped; children of
/// non-list blocks follow their parent unnested.
auto blocks_to_markdown(const std::vector<Block>& blocks) -> std::string;

/// Parse Markdown into partial blocks (without ids).
///
/// Recognizes ATX headings, bullet and ordered list items nested by
/// indentation, image lines, paragraphs and inline emphasis, strong, strike,
/// code and links. A block type missing from `schema` becomes a paragraph.
auto markdown_to_blocks(std::string_view markdown, const BlockSchema& schema)
    -> std::vector<PartialBlock>;

}  // namespace blocktree_cpp
