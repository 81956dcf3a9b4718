/// @file mark.hpp
/// @brief Mark type for inline formatting on text nodes.

#pragma once

#include <blocktree-cpp/value.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace blocktree_cpp {

/// An inline mark attached to a text node.
///
/// Marks carry the inline formatting of a block's content: toggled styles
/// ("bold", "italic", "underline", "strike", "code"), colours
/// ("textColor", "backgroundColor" with a "color" attribute) and links
/// ("link" with an "href" attribute). A text node carries a sorted,
/// duplicate-free set of marks; see normalize_marks().
struct Mark {
    std::string type;  ///< The mark name (e.g. "bold", "link").
    Attrs attrs;       ///< Mark attributes (e.g. {"href": "https://..."}).

    auto operator==(const Mark&) const -> bool = default;
};

/// A normalized set of marks.
using MarkSet = std::vector<Mark>;

/// Rank of a mark type inside a mark set. Links sort first so that link
/// runs enclose the styled text inside them.
auto mark_rank(std::string_view type) noexcept -> int;

/// Sort marks by rank and keep only the last mark of every type.
auto normalize_marks(MarkSet marks) -> MarkSet;

/// Return a copy of `marks` with `mark` added (replacing any mark of the same type).
auto add_to_set(const MarkSet& marks, const Mark& mark) -> MarkSet;

/// Return a copy of `marks` without any mark of the given type.
auto remove_from_set(const MarkSet& marks, std::string_view type) -> MarkSet;

/// Find the mark of the given type in a set.
auto find_mark(const MarkSet& marks, std::string_view type) -> const Mark*;

}  // namespace blocktree_cpp
