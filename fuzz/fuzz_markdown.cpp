// Fuzz target for markdown_to_blocks(): exercises the line reader and the
// inline parser. Parsed blocks are loaded into an editor and written back
// out, which must not crash.

#include <blocktree-cpp/blocktree.hpp>

#include <loguru.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    loguru::g_stderr_verbosity = loguru::Verbosity_OFF;
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    const auto schema = blocktree_cpp::BlockSchema{blocktree_cpp::default_block_specs()};
    auto blocks = blocktree_cpp::markdown_to_blocks(text, schema);
    if (blocks.empty()) return 0;

    try {
        auto editor = blocktree_cpp::Editor{blocktree_cpp::EditorOptions{
            .initial_content = std::move(blocks),
            .id_generator = blocktree_cpp::sequential_id_generator(),
        }};
        auto markdown = blocktree_cpp::blocks_to_markdown(editor.top_level_blocks());
        (void)markdown;
    } catch (const blocktree_cpp::BlockTreeError&) {
        // Rejected content is reported, not crashed on
    }
    return 0;
}
