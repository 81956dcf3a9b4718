/// @file value.hpp
/// @brief Attribute and prop values: PropValue, Attrs, and visitor helpers.

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace blocktree_cpp {

/// A closed set of scalar values a block prop or node attribute can hold.
///
/// Alternatives: string, int64_t, double, bool.
using PropValue = std::variant<
    std::string,
    std::int64_t,
    double,
    bool
>;

/// Attributes of a flat node, and props of a block, keyed by name.
using Attrs = std::map<std::string, PropValue, std::less<>>;

/// Props of a block. Same shape as node attributes.
using PropMap = Attrs;

/// The kind of a PropValue alternative.
enum class PropKind : std::uint8_t {
    string,
    integer,
    number,
    boolean,
};

/// Convert a PropKind to its string representation.
constexpr auto to_string_view(PropKind kind) noexcept -> std::string_view {
    switch (kind) {
        case PropKind::string:  return "string";
        case PropKind::integer: return "integer";
        case PropKind::number:  return "number";
        case PropKind::boolean: return "boolean";
    }
    return "unknown";
}

/// Get the kind of a PropValue.
constexpr auto kind_of(const PropValue& v) noexcept -> PropKind {
    switch (v.index()) {
        case 0: return PropKind::string;
        case 1: return PropKind::integer;
        case 2: return PropKind::number;
        default: return PropKind::boolean;
    }
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { std::printf("%s\n", s.c_str()); },
///     [](std::int64_t i) { std::printf("%lld\n", static_cast<long long>(i)); },
///     [](auto&&) { std::printf("other\n"); },
/// }, some_variant);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed value extraction helpers -------------------------------------------

/// Extract a typed value from a PropValue, or nullopt on type mismatch.
/// @code
/// auto level = get_prop<std::int64_t>(block.props, "level");
/// @endcode
template <typename T>
auto get_prop(const PropValue& v) -> std::optional<T> {
    if (const auto* t = std::get_if<T>(&v)) {
        return *t;
    }
    return std::nullopt;
}

/// Extract a typed value from a named entry of an attribute map.
template <typename T>
auto get_prop(const Attrs& attrs, std::string_view name) -> std::optional<T> {
    auto it = attrs.find(name);
    if (it == attrs.end()) return std::nullopt;
    return get_prop<T>(it->second);
}

/// Render a PropValue as text (used by codecs and error messages).
auto to_string(const PropValue& v) -> std::string;

}  // namespace blocktree_cpp
