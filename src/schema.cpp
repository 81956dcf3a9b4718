#include <blocktree-cpp/schema.hpp>
#include <blocktree-cpp/error.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

namespace blocktree_cpp {

namespace {

auto shared_props() -> PropSchema {
    return PropSchema{
        {"backgroundColor", PropSpec{.default_value = std::string{"default"}, .values = {}}},
        {"textColor", PropSpec{.default_value = std::string{"default"}, .values = {}}},
        {"textAlignment", PropSpec{
            .default_value = std::string{"left"},
            .values = {std::string{"left"}, std::string{"center"}, std::string{"right"},
                       std::string{"justify"}},
        }},
    };
}

auto alignment_from(const PropMap& props) -> TextAlignment {
    auto value = get_prop<std::string>(props, "textAlignment").value_or("left");
    if (value == "center") return TextAlignment::center;
    if (value == "right") return TextAlignment::right;
    if (value == "justify") return TextAlignment::justify;
    return TextAlignment::left;
}

auto string_prop(const PropMap& props, std::string_view name, std::string fallback) -> std::string {
    return get_prop<std::string>(props, name).value_or(std::move(fallback));
}

}  // anonymous namespace

// -- PropSpec -----------------------------------------------------------------

auto PropSpec::accept(const PropValue& value) const -> std::optional<PropValue> {
    auto v = value;
    auto k = kind();
    if (k == PropKind::number) {
        if (const auto* i = std::get_if<std::int64_t>(&v)) v = static_cast<double>(*i);
    } else if (k == PropKind::integer) {
        // 2^63 is exact as a double; values outside [-2^63, 2^63) stay doubles
        // and fail the kind check below.
        if (const auto* d = std::get_if<double>(&v);
            d && std::trunc(*d) == *d && *d >= -9223372036854775808.0 && *d < 9223372036854775808.0) {
            v = static_cast<std::int64_t>(*d);
        }
    }
    if (kind_of(v) != k) return std::nullopt;
    if (!values.empty() && std::ranges::find(values, v) == values.end()) return std::nullopt;
    return v;
}

// -- BlockSchema --------------------------------------------------------------

BlockSchema::BlockSchema(std::vector<BlockSpec> specs) : specs_{std::move(specs)} {
    for (std::size_t i = 0; i < specs_.size(); ++i) {
        const auto& spec = specs_[i];
        if (spec.type.empty()) {
            throw BlockTreeError{ErrorKind::invalid_config, "block spec without a type name"};
        }
        if (!index_.emplace(spec.type, i).second) {
            throw BlockTreeError{ErrorKind::invalid_config,
                                 "block type '" + spec.type + "' registered twice"};
        }
        for (const auto& [name, prop] : spec.prop_schema) {
            auto consistent = std::ranges::all_of(prop.values, [&](const PropValue& v) {
                return kind_of(v) == prop.kind();
            });
            if (!consistent || (!prop.values.empty() &&
                                std::ranges::find(prop.values, prop.default_value) == prop.values.end())) {
                throw BlockTreeError{ErrorKind::invalid_config,
                                     "prop '" + name + "' of block type '" + spec.type +
                                     "' has a default outside its allowed values"};
            }
        }
    }
}

auto BlockSchema::find(std::string_view type) const -> const BlockSpec* {
    auto it = index_.find(type);
    return it != index_.end() ? &specs_[it->second] : nullptr;
}

auto BlockSchema::at(std::string_view type) const -> const BlockSpec& {
    if (const auto* spec = find(type)) return *spec;
    throw BlockTreeError{ErrorKind::unknown_block_type,
                         "unknown block type '" + std::string{type} + "'"};
}

auto BlockSchema::node_schema() const -> NodeSchema {
    auto result = NodeSchema{};
    for (const auto& spec : specs_) {
        result.content_types.emplace(spec.type, spec.content);
    }
    return result;
}

auto BlockSchema::resolve_props(std::string_view type, const PropMap& given,
                                const PropMap& fallback, bool strict) const -> PropMap {
    const auto& spec = at(type);
    if (strict) {
        for (const auto& [name, value] : given) {
            if (!spec.prop_schema.contains(name)) {
                throw BlockTreeError{ErrorKind::invalid_prop,
                                     "prop '" + name + "' is not declared for block type '" +
                                     spec.type + "'"};
            }
        }
    }

    auto result = PropMap{};
    for (const auto& [name, prop] : spec.prop_schema) {
        if (auto it = given.find(name); it != given.end()) {
            if (auto accepted = prop.accept(it->second)) {
                result.emplace(name, std::move(*accepted));
                continue;
            }
            if (strict) {
                throw BlockTreeError{ErrorKind::invalid_prop,
                                     "invalid value '" + to_string(it->second) + "' for prop '" +
                                     name + "' of block type '" + spec.type + "'"};
            }
        }
        if (auto it = fallback.find(name); it != fallback.end()) {
            if (auto accepted = prop.accept(it->second)) {
                result.emplace(name, std::move(*accepted));
                continue;
            }
        }
        result.emplace(name, prop.default_value);
    }
    return result;
}

auto default_block_specs() -> std::vector<BlockSpec> {
    auto heading = shared_props();
    heading.emplace("level", PropSpec{
        .default_value = std::int64_t{1},
        .values = {std::int64_t{1}, std::int64_t{2}, std::int64_t{3}},
    });

    auto image = PropSchema{
        {"backgroundColor", PropSpec{.default_value = std::string{"default"}, .values = {}}},
        {"textAlignment", PropSpec{
            .default_value = std::string{"center"},
            .values = {std::string{"left"}, std::string{"center"}, std::string{"right"},
                       std::string{"justify"}},
        }},
        {"url", PropSpec{.default_value = std::string{}, .values = {}}},
        {"caption", PropSpec{.default_value = std::string{}, .values = {}}},
        {"width", PropSpec{.default_value = std::int64_t{512}, .values = {}}},
    };

    return {
        BlockSpec{.type = "paragraph", .content = ContentKind::inline_content,
                  .allows_children = true, .prop_schema = shared_props()},
        BlockSpec{.type = "heading", .content = ContentKind::inline_content,
                  .allows_children = true, .prop_schema = std::move(heading)},
        BlockSpec{.type = "bulletListItem", .content = ContentKind::inline_content,
                  .allows_children = true, .prop_schema = shared_props()},
        BlockSpec{.type = "numberedListItem", .content = ContentKind::inline_content,
                  .allows_children = true, .prop_schema = shared_props()},
        BlockSpec{.type = "image", .content = ContentKind::none,
                  .allows_children = true, .prop_schema = std::move(image)},
    };
}

// -- Typed props --------------------------------------------------------------

auto typed_props(const Block& block) -> std::optional<DefaultBlockProps> {
    const auto& p = block.props;
    if (block.type == "paragraph") {
        return ParagraphProps{
            .background_color = string_prop(p, "backgroundColor", "default"),
            .text_color = string_prop(p, "textColor", "default"),
            .text_alignment = alignment_from(p),
        };
    }
    if (block.type == "heading") {
        return HeadingProps{
            .background_color = string_prop(p, "backgroundColor", "default"),
            .text_color = string_prop(p, "textColor", "default"),
            .text_alignment = alignment_from(p),
            .level = get_prop<std::int64_t>(p, "level").value_or(1),
        };
    }
    if (block.type == "bulletListItem" || block.type == "numberedListItem") {
        return ListItemProps{
            .background_color = string_prop(p, "backgroundColor", "default"),
            .text_color = string_prop(p, "textColor", "default"),
            .text_alignment = alignment_from(p),
            .numbered = block.type == "numberedListItem",
        };
    }
    if (block.type == "image") {
        return ImageProps{
            .background_color = string_prop(p, "backgroundColor", "default"),
            .text_alignment = p.contains("textAlignment") ? alignment_from(p) : TextAlignment::center,
            .url = string_prop(p, "url", ""),
            .caption = string_prop(p, "caption", ""),
            .width = get_prop<std::int64_t>(p, "width").value_or(512),
        };
    }
    return std::nullopt;
}

}  // namespace blocktree_cpp
