/// @file block.hpp
/// @brief Block values: Block, PartialBlock, inline content and identifiers.

#pragma once

#include <blocktree-cpp/value.hpp>

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace blocktree_cpp {

/// Text styles of an inline run. Unset colours mean "default".
struct Styles {
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool strike = false;
    bool code = false;
    std::optional<std::string> text_color;
    std::optional<std::string> background_color;

    auto empty() const noexcept -> bool {
        return !bold && !italic && !underline && !strike && !code &&
               !text_color && !background_color;
    }

    auto operator==(const Styles&) const -> bool = default;
};

/// A run of text sharing one set of styles. A "\n" in the text stands for a
/// hard break.
struct StyledText {
    std::string text;
    Styles styles;

    auto operator==(const StyledText&) const -> bool = default;
};

/// A hyperlink around one or more styled runs.
struct Link {
    std::string href;
    std::vector<StyledText> content;

    auto operator==(const Link&) const -> bool = default;
};

/// One element of a block's inline content.
using InlineContent = std::variant<StyledText, Link>;

/// A snapshot of one block and its nested children.
///
/// Blocks are plain values: they are materialized on demand from the live
/// document and go stale as soon as the document changes.
struct Block {
    std::string id;
    std::string type;
    PropMap props;
    std::vector<InlineContent> content;
    std::vector<Block> children;

    auto operator==(const Block&) const -> bool = default;
};

/// A block description used as mutation input. Unset fields are filled from
/// the schema defaults when creating a block, and left untouched when
/// updating one.
struct PartialBlock {
    std::optional<std::string> id;
    std::optional<std::string> type;
    PropMap props;
    std::optional<std::vector<InlineContent>> content;
    std::optional<std::vector<PartialBlock>> children;

    auto operator==(const PartialBlock&) const -> bool = default;
};

/// Any value with a string `id` member: Block, or a caller's own type.
template <typename T>
concept HasBlockId = requires(const T& t) {
    { t.id } -> std::convertible_to<std::string>;
};

/// A reference to an existing block: its id, or any value carrying one.
class BlockIdentifier {
public:
    BlockIdentifier(std::string id) : id_{std::move(id)} {}
    BlockIdentifier(std::string_view id) : id_{id} {}
    BlockIdentifier(const char* id) : id_{id} {}

    template <HasBlockId T>
    BlockIdentifier(const T& block) : id_{block.id} {}

    /// Throws block_not_found when the partial block carries no id.
    BlockIdentifier(const PartialBlock& block);

    auto id() const noexcept -> const std::string& { return id_; }

private:
    std::string id_;
};

/// The block holding the text cursor and its siblings at the same level.
struct TextCursorPosition {
    Block block;
    std::optional<Block> prev_block;
    std::optional<Block> next_block;

    auto operator==(const TextCursorPosition&) const -> bool = default;
};

/// The blocks covered by a selection.
struct Selection {
    std::vector<Block> blocks;

    auto operator==(const Selection&) const -> bool = default;
};

/// The link under the selection and the selected text.
struct ActiveLink {
    std::string text;
    std::string url;

    auto operator==(const ActiveLink&) const -> bool = default;
};

/// Inline content holding one unstyled run (empty for empty text).
auto plain_content(std::string text) -> std::vector<InlineContent>;

/// Concatenated plain text of inline content (links included).
auto plain_text(const std::vector<InlineContent>& content) -> std::string;

}  // namespace blocktree_cpp
