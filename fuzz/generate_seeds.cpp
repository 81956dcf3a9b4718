// Helper to generate seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <blocktree-cpp/blocktree.hpp>
#include <blocktree-cpp/json.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

static void write_seed(const std::string& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    const auto md_dir = std::string{"fuzz/corpus/markdown"};
    const auto json_dir = std::string{"fuzz/corpus/json"};
    const auto html_dir = std::string{"fuzz/corpus/html"};
    fs::create_directories(md_dir);
    fs::create_directories(html_dir);
    fs::create_directories(json_dir);

    // Seed 1: headings and paragraphs
    write_seed(md_dir + "/seed_headings.md", "# Title\n\nSome *styled* **text**.\n\n## Section\nline\nbreak\n");

    // Seed 2: nested lists with continuation text
    write_seed(md_dir + "/seed_lists.md", "- one\n  - two\n    more\n- three\n1. first\n2. second\n");

    // Seed 3: links, code, images and breaks
    write_seed(md_dir + "/seed_inline.md",
               "see [the `docs`](https://example.com) ~~now~~\n\n![cap](img.png)\n\n---\n");

    // Seeds 4-5: the same documents as block JSON, with ids
    auto editor = blocktree_cpp::Editor{blocktree_cpp::EditorOptions{
        .id_generator = blocktree_cpp::sequential_id_generator("seed-"),
    }};
    for (const auto* name : {"lists", "inline"}) {
        auto md = std::ifstream{md_dir + "/seed_" + name + ".md"};
        auto text = std::string{std::istreambuf_iterator<char>{md}, std::istreambuf_iterator<char>{}};
        auto blocks = editor.markdown_to_blocks(text).get();
        write_seed(json_dir + "/seed_" + name + ".json", blocktree_cpp::blocks_to_json(blocks).dump(2));
        write_seed(html_dir + "/seed_" + name + ".html", blocktree_cpp::blocks_to_html(blocks));
    }

    // Seed 6: loose markup the HTML reader has to recover from
    write_seed(html_dir + "/seed_loose.html",
               "<!DOCTYPE html><section>Loose <b>text &amp; &#x41;</b><li>stray<p>para</section>"
               "<pre>  keep\n  lines</pre><script>x<y</script>");

    return 0;
}
