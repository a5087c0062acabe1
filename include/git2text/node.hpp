#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace git2text {

enum class NodeKind {
    Directory,
    File,
};

// One entry of the filtered tree. Children are owned by value and kept in
// byte-wise name order. rel_path is '/'-separated and empty for the root.
struct Node {
    NodeKind kind{NodeKind::Directory};
    std::string name;
    std::string rel_path;
    std::vector<Node> children;
    std::string content;
    std::string language;

    bool is_dir() const { return kind == NodeKind::Directory; }
    size_t file_count() const;
};

} // namespace git2text
