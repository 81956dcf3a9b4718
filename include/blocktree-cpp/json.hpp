/// @file json.hpp
/// @brief nlohmann/json interoperability for blocktree-cpp.
///
/// Provides ADL serialization (to_json/from_json) for the block value types,
/// bulk block import/export and editor configuration from JSON. The JSON
/// shape of a block mirrors its public shape:
///
/// @code
/// {"id": "a1", "type": "heading", "props": {"level": 2},
///  "content": [{"type": "text", "text": "Hi", "styles": {"bold": true}},
///              {"type": "link", "href": "https://x", "content": [...]}],
///  "children": []}
/// @endcode

#pragma once

#include <blocktree-cpp/block.hpp>
#include <blocktree-cpp/editor.hpp>
#include <blocktree-cpp/schema.hpp>
#include <blocktree-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <vector>

namespace blocktree_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- PropValue ----------------------------------------------------------------
//
// PropValue is a variant of standard types only, so these are not found by
// ADL from inside nlohmann; call them directly.

void to_json(nlohmann::json& j, const PropValue& v);
void from_json(const nlohmann::json& j, PropValue& v);

// -- Inline content -------------------------------------------------------------

void to_json(nlohmann::json& j, const Styles& s);
void from_json(const nlohmann::json& j, Styles& s);

void to_json(nlohmann::json& j, const StyledText& t);
void from_json(const nlohmann::json& j, StyledText& t);

void to_json(nlohmann::json& j, const Link& l);
void from_json(const nlohmann::json& j, Link& l);

void to_json(nlohmann::json& j, const InlineContent& c);
void from_json(const nlohmann::json& j, InlineContent& c);

// -- Blocks -------------------------------------------------------------------

void to_json(nlohmann::json& j, const Block& b);
void from_json(const nlohmann::json& j, Block& b);

/// Unset fields are omitted. "content" may also be a plain string.
void to_json(nlohmann::json& j, const PartialBlock& b);
void from_json(const nlohmann::json& j, PartialBlock& b);

void to_json(nlohmann::json& j, const TextCursorPosition& p);
void from_json(const nlohmann::json& j, TextCursorPosition& p);

// -- Schema -------------------------------------------------------------------

/// {"type", "content": "inline"|"none", "allowsChildren",
///  "propSchema": {name: {"default": v, "values": [...]}}}
void to_json(nlohmann::json& j, const BlockSpec& s);
void from_json(const nlohmann::json& j, BlockSpec& s);

// =============================================================================
// Bulk import / export
// =============================================================================

/// Export blocks as a JSON array.
auto blocks_to_json(const std::vector<Block>& blocks) -> nlohmann::json;

/// Import a JSON array of complete blocks.
/// @throws BlockTreeError (invalid_content) on malformed input.
auto blocks_from_json(const nlohmann::json& j) -> std::vector<Block>;

/// Import a JSON array of partial blocks, e.g. mutation input.
/// @throws BlockTreeError (invalid_content) on malformed input.
auto partial_blocks_from_json(const nlohmann::json& j) -> std::vector<PartialBlock>;

/// Build editor options from `{"blockSpecs": [...], "initialContent": [...],
/// "readLocking": bool}`. Missing keys keep their defaults; callbacks and the
/// id generator are left at their defaults.
/// @throws BlockTreeError (invalid_config) on malformed input.
auto options_from_json(const nlohmann::json& j) -> EditorOptions;

}  // namespace blocktree_cpp
