/// @file blocktree.hpp
/// @brief Umbrella header for the blocktree-cpp library.
///
/// Include this single header for access to all public types:
/// Editor, Block, PartialBlock, BlockSchema, Document, Transaction,
/// BlockInfo, BlockCache, the format codecs and Error.
/// JSON support lives in <blocktree-cpp/json.hpp>.

#pragma once

#include <blocktree-cpp/block.hpp>
#include <blocktree-cpp/block_cache.hpp>
#include <blocktree-cpp/block_info.hpp>
#include <blocktree-cpp/block_manipulation.hpp>
#include <blocktree-cpp/document.hpp>
#include <blocktree-cpp/editor.hpp>
#include <blocktree-cpp/error.hpp>
#include <blocktree-cpp/format.hpp>
#include <blocktree-cpp/id_generator.hpp>
#include <blocktree-cpp/mark.hpp>
#include <blocktree-cpp/node.hpp>
#include <blocktree-cpp/node_conversions.hpp>
#include <blocktree-cpp/resolved_pos.hpp>
#include <blocktree-cpp/schema.hpp>
#include <blocktree-cpp/transaction.hpp>
#include <blocktree-cpp/traversal.hpp>
#include <blocktree-cpp/types.hpp>
#include <blocktree-cpp/value.hpp>
