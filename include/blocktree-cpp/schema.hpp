/// @file schema.hpp
/// @brief Block schema: prop specs, block specs and the default block set.

#pragma once

#include <blocktree-cpp/block.hpp>
#include <blocktree-cpp/node.hpp>
#include <blocktree-cpp/types.hpp>
#include <blocktree-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace blocktree_cpp {

/// Declaration of one block prop: its default and, optionally, the closed
/// set of values it may take. The prop's kind is the kind of its default.
struct PropSpec {
    PropValue default_value;
    std::vector<PropValue> values;

    auto kind() const noexcept -> PropKind { return kind_of(default_value); }

    /// Coerce `value` to this prop's kind and check it against the allowed
    /// values. Integral numbers convert between integer and number props.
    /// Returns nullopt when the value is not acceptable.
    auto accept(const PropValue& value) const -> std::optional<PropValue>;

    auto operator==(const PropSpec&) const -> bool = default;
};

using PropSchema = std::map<std::string, PropSpec, std::less<>>;

/// Declaration of one block type.
struct BlockSpec {
    std::string type;
    ContentKind content = ContentKind::inline_content;
    bool allows_children = true;
    PropSchema prop_schema;

    auto operator==(const BlockSpec&) const -> bool = default;
};

/// The registered block types of an editor.
///
/// Built once at construction. Every prop read from the document and every
/// prop written to it goes through resolve_props(), so block props always
/// hold exactly the declared names with values of the declared kinds.
class BlockSchema {
public:
    /// Register `specs`. Throws invalid_config for an empty or duplicated
    /// type name, or a prop whose allowed values disagree with its default.
    explicit BlockSchema(std::vector<BlockSpec> specs);

    /// The BlockSpec of a type, or nullptr.
    auto find(std::string_view type) const -> const BlockSpec*;

    /// The BlockSpec of a type. Throws unknown_block_type.
    auto at(std::string_view type) const -> const BlockSpec&;

    auto contains(std::string_view type) const -> bool { return find(type) != nullptr; }
    auto specs() const noexcept -> const std::vector<BlockSpec>& { return specs_; }
    auto size() const noexcept -> std::size_t { return specs_.size(); }

    /// The content node table for the document engine.
    auto node_schema() const -> NodeSchema;

    /// Complete and validate props for a block of `type`.
    ///
    /// Every declared prop takes its value from `given`, else from
    /// `fallback`, else its default. With `strict`, a value in `given` that
    /// is undeclared or unacceptable throws invalid_prop; otherwise such
    /// values are dropped.
    auto resolve_props(std::string_view type, const PropMap& given,
                       const PropMap& fallback = {}, bool strict = true) const -> PropMap;

private:
    std::vector<BlockSpec> specs_;
    std::map<std::string, std::size_t, std::less<>> index_;
};

/// The default block set: paragraph, heading, bulletListItem,
/// numberedListItem and image.
auto default_block_specs() -> std::vector<BlockSpec>;

// -- Typed props of the default block set --------------------------------------

enum class TextAlignment : std::uint8_t { left, center, right, justify };

struct ParagraphProps {
    std::string background_color;
    std::string text_color;
    TextAlignment text_alignment;

    auto operator==(const ParagraphProps&) const -> bool = default;
};

struct HeadingProps {
    std::string background_color;
    std::string text_color;
    TextAlignment text_alignment;
    std::int64_t level;

    auto operator==(const HeadingProps&) const -> bool = default;
};

struct ListItemProps {
    std::string background_color;
    std::string text_color;
    TextAlignment text_alignment;
    bool numbered;

    auto operator==(const ListItemProps&) const -> bool = default;
};

struct ImageProps {
    std::string background_color;
    TextAlignment text_alignment;
    std::string url;
    std::string caption;
    std::int64_t width;

    auto operator==(const ImageProps&) const -> bool = default;
};

/// Props of a block of the default set, one alternative per block kind.
using DefaultBlockProps = std::variant<ParagraphProps, HeadingProps, ListItemProps, ImageProps>;

/// Typed view of a default-set block's props, or nullopt for other types.
/// Missing or mistyped props read as their defaults.
auto typed_props(const Block& block) -> std::optional<DefaultBlockProps>;

}  // namespace blocktree_cpp
