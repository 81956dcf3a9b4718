#include <blocktree-cpp/json.hpp>
#include <blocktree-cpp/error.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace blocktree_cpp {

namespace {

[[noreturn]] void malformed(const std::string& what) {
    throw BlockTreeError{ErrorKind::invalid_content, what};
}

auto props_to_json(const PropMap& props) -> nlohmann::json {
    auto j = nlohmann::json::object();
    for (const auto& [name, value] : props) {
        to_json(j[name], value);
    }
    return j;
}

auto props_from_json(const nlohmann::json& j) -> PropMap {
    if (!j.is_object()) malformed("block props must be an object");
    auto props = PropMap{};
    for (const auto& [name, value] : j.items()) {
        auto v = PropValue{};
        from_json(value, v);
        props.insert_or_assign(name, std::move(v));
    }
    return props;
}

auto string_field(const nlohmann::json& j, const char* key) -> std::string {
    if (!j.contains(key) || !j[key].is_string()) {
        malformed(std::string{"missing string field '"} + key + "'");
    }
    return j[key].get<std::string>();
}

template <typename T>
auto parse_array(const nlohmann::json& j, std::string_view what) -> std::vector<T> {
    if (!j.is_array()) malformed(std::string{what} + " must be an array");
    auto result = std::vector<T>{};
    result.reserve(j.size());
    for (const auto& item : j) {
        auto value = T{};
        from_json(item, value);
        result.push_back(std::move(value));
    }
    return result;
}

/// Parse an array field, or an empty vector when the key is absent.
template <typename T>
auto array_field(const nlohmann::json& j, const char* key) -> std::vector<T> {
    if (!j.contains(key) || j[key].is_null()) return {};
    return parse_array<T>(j[key], std::string{"field '"} + key + "'");
}

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

// -- PropValue ----------------------------------------------------------------

void to_json(nlohmann::json& j, const PropValue& v) {
    std::visit(overload{
        [&](const std::string& s) { j = s; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](bool b) { j = b; },
    }, v);
}

void from_json(const nlohmann::json& j, PropValue& v) {
    if (j.is_boolean()) {
        v = j.get<bool>();
    } else if (j.is_number_unsigned()) {
        auto val = j.get<std::uint64_t>();
        if (val > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            malformed("prop value out of range");
        }
        v = static_cast<std::int64_t>(val);
    } else if (j.is_number_integer()) {
        v = j.get<std::int64_t>();
    } else if (j.is_number_float()) {
        v = j.get<double>();
    } else if (j.is_string()) {
        v = j.get<std::string>();
    } else {
        malformed("cannot convert JSON " + std::string{j.type_name()} + " to a prop value");
    }
}

// -- Inline content -------------------------------------------------------------

void to_json(nlohmann::json& j, const Styles& s) {
    j = nlohmann::json::object();
    if (s.bold) j["bold"] = true;
    if (s.italic) j["italic"] = true;
    if (s.underline) j["underline"] = true;
    if (s.strike) j["strike"] = true;
    if (s.code) j["code"] = true;
    if (s.text_color) j["textColor"] = *s.text_color;
    if (s.background_color) j["backgroundColor"] = *s.background_color;
}

void from_json(const nlohmann::json& j, Styles& s) {
    if (!j.is_object()) malformed("styles must be an object");
    s = Styles{
        .bold = j.value("bold", false),
        .italic = j.value("italic", false),
        .underline = j.value("underline", false),
        .strike = j.value("strike", false),
        .code = j.value("code", false),
        .text_color = {},
        .background_color = {},
    };
    if (j.contains("textColor")) s.text_color = j["textColor"].get<std::string>();
    if (j.contains("backgroundColor")) s.background_color = j["backgroundColor"].get<std::string>();
}

void to_json(nlohmann::json& j, const StyledText& t) {
    j = nlohmann::json{{"type", "text"}, {"text", t.text}};
    to_json(j["styles"], t.styles);
}

void from_json(const nlohmann::json& j, StyledText& t) {
    t.text = string_field(j, "text");
    t.styles = Styles{};
    if (j.contains("styles")) from_json(j["styles"], t.styles);
}

void to_json(nlohmann::json& j, const Link& l) {
    j = nlohmann::json{{"type", "link"}, {"href", l.href}, {"content", nlohmann::json::array()}};
    for (const auto& run : l.content) {
        auto run_json = nlohmann::json{};
        to_json(run_json, run);
        j["content"].push_back(std::move(run_json));
    }
}

void from_json(const nlohmann::json& j, Link& l) {
    l.href = string_field(j, "href");
    l.content = array_field<StyledText>(j, "content");
}

void to_json(nlohmann::json& j, const InlineContent& c) {
    std::visit([&](const auto& item) { to_json(j, item); }, c);
}

void from_json(const nlohmann::json& j, InlineContent& c) {
    if (!j.is_object()) malformed("inline content must be an object");
    auto type = j.value("type", std::string{"text"});
    if (type == "text") {
        auto t = StyledText{};
        from_json(j, t);
        c = std::move(t);
    } else if (type == "link") {
        auto l = Link{};
        from_json(j, l);
        c = std::move(l);
    } else {
        malformed("unknown inline content type '" + type + "'");
    }
}

namespace {

auto content_to_json(const std::vector<InlineContent>& content) -> nlohmann::json {
    auto j = nlohmann::json::array();
    for (const auto& item : content) {
        auto item_json = nlohmann::json{};
        to_json(item_json, item);
        j.push_back(std::move(item_json));
    }
    return j;
}

}  // anonymous namespace

// -- Blocks -------------------------------------------------------------------

void to_json(nlohmann::json& j, const Block& b) {
    j = nlohmann::json{
        {"id", b.id},
        {"type", b.type},
        {"props", props_to_json(b.props)},
        {"content", content_to_json(b.content)},
        {"children", nlohmann::json::array()},
    };
    for (const auto& child : b.children) {
        auto child_json = nlohmann::json{};
        to_json(child_json, child);
        j["children"].push_back(std::move(child_json));
    }
}

void from_json(const nlohmann::json& j, Block& b) {
    if (!j.is_object()) malformed("a block must be an object");
    b.id = string_field(j, "id");
    b.type = string_field(j, "type");
    b.props = j.contains("props") ? props_from_json(j["props"]) : PropMap{};
    b.content = array_field<InlineContent>(j, "content");
    b.children = array_field<Block>(j, "children");
}

void to_json(nlohmann::json& j, const PartialBlock& b) {
    j = nlohmann::json::object();
    if (b.id) j["id"] = *b.id;
    if (b.type) j["type"] = *b.type;
    if (!b.props.empty()) j["props"] = props_to_json(b.props);
    if (b.content) j["content"] = content_to_json(*b.content);
    if (b.children) {
        j["children"] = nlohmann::json::array();
        for (const auto& child : *b.children) {
            auto child_json = nlohmann::json{};
            to_json(child_json, child);
            j["children"].push_back(std::move(child_json));
        }
    }
}

void from_json(const nlohmann::json& j, PartialBlock& b) {
    if (!j.is_object()) malformed("a block must be an object");
    b = PartialBlock{};
    if (j.contains("id")) b.id = string_field(j, "id");
    if (j.contains("type")) b.type = string_field(j, "type");
    if (j.contains("props")) b.props = props_from_json(j["props"]);
    if (j.contains("content")) {
        if (j["content"].is_string()) {
            b.content = plain_content(j["content"].get<std::string>());
        } else {
            b.content = array_field<InlineContent>(j, "content");
        }
    }
    if (j.contains("children")) b.children = array_field<PartialBlock>(j, "children");
}

void to_json(nlohmann::json& j, const TextCursorPosition& p) {
    j = nlohmann::json::object();
    to_json(j["block"], p.block);
    if (p.prev_block) {
        to_json(j["prevBlock"], *p.prev_block);
    } else {
        j["prevBlock"] = nullptr;
    }
    if (p.next_block) {
        to_json(j["nextBlock"], *p.next_block);
    } else {
        j["nextBlock"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, TextCursorPosition& p) {
    if (!j.is_object() || !j.contains("block")) malformed("cursor position requires a block");
    from_json(j["block"], p.block);
    p.prev_block.reset();
    p.next_block.reset();
    if (j.contains("prevBlock") && !j["prevBlock"].is_null()) {
        from_json(j["prevBlock"], p.prev_block.emplace());
    }
    if (j.contains("nextBlock") && !j["nextBlock"].is_null()) {
        from_json(j["nextBlock"], p.next_block.emplace());
    }
}

// -- Schema -------------------------------------------------------------------

void to_json(nlohmann::json& j, const BlockSpec& s) {
    j = nlohmann::json{
        {"type", s.type},
        {"content", std::string{to_string_view(s.content)}},
        {"allowsChildren", s.allows_children},
        {"propSchema", nlohmann::json::object()},
    };
    for (const auto& [name, prop] : s.prop_schema) {
        auto& p = j["propSchema"][name];
        to_json(p["default"], prop.default_value);
        if (!prop.values.empty()) {
            p["values"] = nlohmann::json::array();
            for (const auto& value : prop.values) {
                auto value_json = nlohmann::json{};
                to_json(value_json, value);
                p["values"].push_back(std::move(value_json));
            }
        }
    }
}

void from_json(const nlohmann::json& j, BlockSpec& s) {
    if (!j.is_object()) malformed("a block spec must be an object");
    s = BlockSpec{};
    s.type = string_field(j, "type");

    auto content = j.value("content", std::string{"inline"});
    if (content == "inline") {
        s.content = ContentKind::inline_content;
    } else if (content == "none") {
        s.content = ContentKind::none;
    } else {
        malformed("unknown content kind '" + content + "'");
    }
    s.allows_children = j.value("allowsChildren", true);

    if (!j.contains("propSchema")) return;
    for (const auto& [name, prop_json] : j["propSchema"].items()) {
        if (!prop_json.contains("default")) {
            malformed("prop '" + name + "' of block type '" + s.type + "' has no default");
        }
        auto prop = PropSpec{};
        from_json(prop_json["default"], prop.default_value);
        prop.values = array_field<PropValue>(prop_json, "values");
        s.prop_schema.emplace(name, std::move(prop));
    }
}

// =============================================================================
// Bulk import / export
// =============================================================================

auto blocks_to_json(const std::vector<Block>& blocks) -> nlohmann::json {
    auto j = nlohmann::json::array();
    for (const auto& block : blocks) {
        auto block_json = nlohmann::json{};
        to_json(block_json, block);
        j.push_back(std::move(block_json));
    }
    return j;
}

auto blocks_from_json(const nlohmann::json& j) -> std::vector<Block> {
    try {
        return parse_array<Block>(j, "blocks");
    } catch (const nlohmann::json::exception& e) {
        malformed(std::string{"malformed block JSON: "} + e.what());
    }
}

auto partial_blocks_from_json(const nlohmann::json& j) -> std::vector<PartialBlock> {
    try {
        return parse_array<PartialBlock>(j, "blocks");
    } catch (const nlohmann::json::exception& e) {
        malformed(std::string{"malformed block JSON: "} + e.what());
    }
}

auto options_from_json(const nlohmann::json& j) -> EditorOptions {
    auto options = EditorOptions{};
    try {
        if (!j.is_object()) malformed("editor options must be an object");
        if (j.contains("blockSpecs")) options.block_specs = array_field<BlockSpec>(j, "blockSpecs");
        if (j.contains("initialContent")) options.initial_content = partial_blocks_from_json(j["initialContent"]);
        options.read_locking = j.value("readLocking", true);
    } catch (const nlohmann::json::exception& e) {
        throw BlockTreeError{ErrorKind::invalid_config, std::string{"malformed editor options: "} + e.what()};
    } catch (const BlockTreeError& e) {
        throw BlockTreeError{ErrorKind::invalid_config, e.error().message};
    }
    return options;
}

}  // namespace blocktree_cpp
