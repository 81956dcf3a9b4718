/// @file editor.hpp
/// @brief Editor, the public block-tree API over a flat Document.

#pragma once

#include <blocktree-cpp/block.hpp>
#include <blocktree-cpp/block_cache.hpp>
#include <blocktree-cpp/block_info.hpp>
#include <blocktree-cpp/block_manipulation.hpp>
#include <blocktree-cpp/document.hpp>
#include <blocktree-cpp/id_generator.hpp>
#include <blocktree-cpp/node.hpp>
#include <blocktree-cpp/schema.hpp>
#include <blocktree-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace blocktree_cpp {

class Editor;

/// Construction options of an Editor.
struct EditorOptions {
    /// Registered block types.
    std::vector<BlockSpec> block_specs = default_block_specs();

    /// Blocks replacing the initial empty paragraph. Empty keeps it.
    std::vector<PartialBlock> initial_content;

    /// Source of ids for blocks inserted without one.
    IdGenerator id_generator = random_id_generator();

    /// Take a shared lock on every read (see Editor::set_read_locking).
    bool read_locking = true;

    /// Called after every committed change to the block tree.
    std::function<void(Editor&)> on_content_change;

    /// Called after every change of the selection.
    std::function<void(Editor&)> on_selection_change;
};

/// The block-tree editing surface over a flat Document.
///
/// Reads convert the live snapshot to Block values through an identity
/// cache; writes translate tree-level intents into one atomic transaction.
/// Every mutation holds an exclusive lock for its whole duration, so
/// overlapping mutations are serialized; reads hold a shared lock.
/// Callbacks run after the lock is released and may call back into the
/// editor.
///
/// @code
/// auto editor = Editor{};
/// auto first = editor.top_level_blocks().front();
/// editor.insert_blocks({PartialBlock{.type = "heading", .content = plain_content("Title")}},
///                      first, Placement::before);
/// @endcode
class Editor {
public:
    /// Construct an editor. Throws invalid_config for a bad schema and the
    /// mutation errors of replace_blocks() for bad initial content.
    explicit Editor(EditorOptions options = {});

    Editor(const Editor&) = delete;
    auto operator=(const Editor&) -> Editor& = delete;

    // -- Block queries --------------------------------------------------------

    /// Snapshot of all top-level blocks, in document order.
    auto top_level_blocks() const -> std::vector<Block>;

    /// Snapshot of the block with the given id, or nullopt.
    auto get_block(const BlockIdentifier& id) const -> std::optional<Block>;

    /// Visit all blocks depth-first (parents before children). Returning
    /// false from `fn` ends the walk. With `reverse`, siblings are visited
    /// last to first.
    void for_each_block(const std::function<bool(const Block&)>& fn, bool reverse = false) const;

    /// The block enclosing a position with its siblings, or nullopt when
    /// the position belongs to no block.
    auto cursor_context(std::size_t pos) const -> std::optional<TextCursorPosition>;

    /// Blocks whose content overlaps [from, to], outer blocks first.
    auto selection_blocks(std::size_t from, std::size_t to) const -> std::vector<Block>;

    // -- Cursor and selection -------------------------------------------------

    /// The block holding the text cursor, or nullopt when there is none.
    auto text_cursor_position() const -> std::optional<TextCursorPosition>;

    /// Put the cursor at the start or end of a block's content.
    /// Throws block_not_found.
    void set_text_cursor_position(const BlockIdentifier& target,
                                  CursorPlacement placement = CursorPlacement::start);

    /// The blocks covered by the selection.
    auto selection() const -> Selection;

    /// The selection in document positions.
    auto text_selection() const -> TextSelection;

    /// Set the selection in document positions. Throws invalid_position.
    void set_selection(std::size_t from, std::size_t to);

    // -- Block mutations ------------------------------------------------------

    /// See blocktree_cpp::insert_blocks(). Returns the new block ids.
    auto insert_blocks(const std::vector<PartialBlock>& blocks, const BlockIdentifier& reference,
                       Placement placement = Placement::before) -> std::vector<std::string>;

    /// See blocktree_cpp::update_block().
    void update_block(const BlockIdentifier& target, const PartialBlock& update);

    /// See blocktree_cpp::remove_blocks().
    void remove_blocks(const std::vector<BlockIdentifier>& targets);

    /// See blocktree_cpp::replace_blocks(). Returns the new block ids.
    auto replace_blocks(const std::vector<BlockIdentifier>& targets,
                        const std::vector<PartialBlock>& insertions) -> std::vector<std::string>;

    // -- Styles and links -----------------------------------------------------

    /// Styles active at the end of the selection.
    auto active_styles() const -> Styles;

    /// Apply styles to the selected text.
    void add_styles(const Styles& styles);

    /// Remove the given styles from the selected text (values are ignored,
    /// only which styles are set matters).
    void remove_styles(const Styles& styles);

    /// Toggle each given style: remove it when the whole selected text
    /// already has it, otherwise apply it.
    void toggle_styles(const Styles& styles);

    /// The link at the selection (empty url when none) and the selected text.
    auto active_link() const -> ActiveLink;

    /// Replace the selection with `text` (default: the selected text)
    /// linking to `url`. Does nothing for an empty url.
    void create_link(std::string_view url, std::optional<std::string> text = std::nullopt);

    // -- Nesting --------------------------------------------------------------

    auto can_nest_block() const -> bool;
    void nest_block();
    auto can_unnest_block() const -> bool;
    void unnest_block();

    // -- Format codecs --------------------------------------------------------

    /// Serialize blocks to HTML on the global executor.
    auto blocks_to_html(std::vector<Block> blocks) const -> std::future<std::string>;

    /// Serialize blocks to Markdown on the global executor.
    auto blocks_to_markdown(std::vector<Block> blocks) const -> std::future<std::string>;

    /// Parse Markdown into blocks (with fresh ids) on the global executor.
    auto markdown_to_blocks(std::string markdown) const -> std::future<std::vector<Block>>;

    /// Parse HTML into blocks (with fresh ids) on the global executor.
    auto html_to_blocks(std::string html) const -> std::future<std::vector<Block>>;

    // -- Flat document access -------------------------------------------------

    /// The current flat snapshot.
    auto doc() const -> NodePtr;

    /// Convert one block frame of any snapshot to a Block, through the cache.
    auto to_block(const NodePtr& frame) const -> Block;

    /// Insert flat nodes at a position as one transaction.
    void apply_fragment(std::size_t pos, Fragment nodes);

    /// The registered block types.
    auto schema() const noexcept -> const BlockSchema& { return schema_; }

    /// Number of committed transactions that changed the document.
    auto version() const -> std::uint64_t;

    auto cache_stats() const -> BlockCacheStats;
    auto cache_size() const -> std::size_t;

    /// Enable or disable read locking.
    ///
    /// When disabled, reads skip the shared lock entirely and the caller
    /// must guarantee that no mutation runs concurrently with a read.
    void set_read_locking(bool enabled);

    /// Check whether read locking is enabled.
    auto read_locking() const -> bool;

private:
    /// RAII guard that conditionally acquires a shared_lock.
    struct ReadGuard {
        std::shared_lock<std::shared_mutex> lock_;

        ReadGuard(std::shared_mutex& mtx, bool engage)
            : lock_{mtx, std::defer_lock} {
            if (engage) lock_.lock();
        }
    };

    auto read_guard() const -> ReadGuard;

    /// Run `fn` in one transaction under the exclusive lock, then prune the
    /// cache and fire callbacks.
    template <typename Fn>
    auto mutate(const char* operation, Fn&& fn) -> std::invoke_result_t<Fn, Transaction&>;

    void after_commit(const char* operation, bool content_changed, bool selection_changed);

    auto context() const -> MutationContext { return MutationContext{.schema = schema_, .ids = ids_}; }
    auto convert(const NodePtr& frame) const -> Block;
    auto cursor_context_unlocked(std::size_t pos) const -> std::optional<TextCursorPosition>;
    auto blocks_in_range(std::size_t from, std::size_t to) const -> std::vector<Block>;

    BlockSchema schema_;
    IdGenerator ids_;
    Document document_;
    mutable BlockCache cache_;
    std::function<void(Editor&)> on_content_change_;
    std::function<void(Editor&)> on_selection_change_;
    mutable std::shared_mutex mutex_;
    bool read_locking_ = true;
};

}  // namespace blocktree_cpp
