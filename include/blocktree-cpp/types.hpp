/// @file types.hpp
/// @brief Core identity and addressing types: NodeSerial, Placement, TextSelection.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace blocktree_cpp {

/// A process-unique handle of a flat node.
///
/// Every node receives a fresh serial when it is constructed and serials
/// are never reused, so two live nodes share a serial only if they are the
/// same object. The identity cache is keyed by serial.
using NodeSerial = std::uint64_t;

/// Where inserted blocks go relative to a reference block.
enum class Placement : std::uint8_t {
    before,  ///< Siblings, immediately before the reference block.
    after,   ///< Siblings, immediately after the reference block.
    nested,  ///< First children of the reference block.
};

/// Convert a Placement to its string representation.
constexpr auto to_string_view(Placement placement) noexcept -> std::string_view {
    switch (placement) {
        case Placement::before: return "before";
        case Placement::after:  return "after";
        case Placement::nested: return "nested";
    }
    return "unknown";
}

/// What a block's content node may hold.
enum class ContentKind : std::uint8_t {
    inline_content,  ///< Text runs, links and hard breaks.
    none,            ///< Nothing; the block is fully described by its props.
};

/// Convert a ContentKind to its string representation.
constexpr auto to_string_view(ContentKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ContentKind::inline_content: return "inline";
        case ContentKind::none:           return "none";
    }
    return "unknown";
}

/// Where the text cursor goes inside a block.
enum class CursorPlacement : std::uint8_t {
    start,
    end,
};

/// A text selection in document positions.
///
/// `from` is always <= `to`; an empty selection (from == to) is a caret.
struct TextSelection {
    std::size_t from{0};
    std::size_t to{0};

    auto empty() const noexcept -> bool { return from == to; }

    auto operator==(const TextSelection&) const -> bool = default;
};

}  // namespace blocktree_cpp
