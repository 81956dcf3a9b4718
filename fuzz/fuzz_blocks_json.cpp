// Fuzz target for the JSON block loader: any input that parses as JSON is
// read as partial blocks and, if valid, loaded into an editor.

#include <blocktree-cpp/blocktree.hpp>
#include <blocktree-cpp/json.hpp>

#include <loguru.hpp>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    loguru::g_stderr_verbosity = loguru::Verbosity_OFF;
    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded()) return 0;

    try {
        auto partials = blocktree_cpp::partial_blocks_from_json(j);
        auto editor = blocktree_cpp::Editor{blocktree_cpp::EditorOptions{
            .initial_content = std::move(partials),
            .id_generator = blocktree_cpp::sequential_id_generator(),
        }};
        // Round-trip: what the editor holds must serialize and parse again
        auto written = blocktree_cpp::blocks_to_json(editor.top_level_blocks());
        auto reread = blocktree_cpp::blocks_from_json(written);
        (void)reread;
    } catch (const blocktree_cpp::BlockTreeError&) {
        // Malformed blocks are reported, not crashed on
    }
    return 0;
}
