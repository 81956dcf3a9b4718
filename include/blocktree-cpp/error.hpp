/// @file error.hpp
/// @brief Error types for the blocktree-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace blocktree_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    block_not_found,     ///< A block identifier does not resolve to a live block.
    unknown_block_type,  ///< A type name has no entry in the block schema.
    invalid_placement,   ///< A nested insertion targets a block that forbids children.
    invalid_prop,        ///< A prop value does not match its declared kind or values.
    invalid_content,     ///< Inline content was supplied for a content-less block, or is malformed.
    invalid_position,    ///< A position lies outside the document or the edited parent.
    invalid_document,    ///< An edit would break the structural shape of the document.
    invalid_config,      ///< Editor options or a schema description could not be parsed.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::block_not_found:    return "block_not_found";
        case ErrorKind::unknown_block_type: return "unknown_block_type";
        case ErrorKind::invalid_placement:  return "invalid_placement";
        case ErrorKind::invalid_prop:       return "invalid_prop";
        case ErrorKind::invalid_content:    return "invalid_content";
        case ErrorKind::invalid_position:   return "invalid_position";
        case ErrorKind::invalid_document:   return "invalid_document";
        case ErrorKind::invalid_config:     return "invalid_config";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// The exception thrown by every failing library operation.
///
/// Mutations validate all of their inputs before touching the document,
/// so catching a BlockTreeError always means the document is unchanged.
class BlockTreeError : public std::runtime_error {
public:
    explicit BlockTreeError(Error error)
        : std::runtime_error{std::string{to_string_view(error.kind)} + ": " + error.message},
          error_{std::move(error)} {}

    BlockTreeError(ErrorKind kind, std::string message)
        : BlockTreeError{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace blocktree_cpp
