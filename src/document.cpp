#include <blocktree-cpp/document.hpp>
#include <blocktree-cpp/error.hpp>

namespace blocktree_cpp {

Document::Document(NodeSchema schema)
    : schema_{std::move(schema)},
      doc_{Node::doc(Node::block_group({}))} {}

Document::Document(NodeSchema schema, NodePtr doc)
    : schema_{std::move(schema)}, doc_{std::move(doc)} {
    if (!doc_) throw BlockTreeError{ErrorKind::invalid_document, "null document"};
    check_node(*doc_, schema_);
    auto tx = Transaction{doc_, selection_, schema_};
    selection_ = tx.settled_selection();
}

auto Document::resolve(std::size_t pos) const -> ResolvedPos {
    return ResolvedPos::resolve(doc_, pos);
}

void Document::commit(Transaction& tx) {
    auto selection = tx.settled_selection();
    if (tx.doc_changed()) {
        doc_ = tx.doc_;
        ++version_;
    }
    selection_ = selection;
}

}  // namespace blocktree_cpp
