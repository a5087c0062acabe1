#pragma once
#include <git2text/node.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace git2text {

extern const char* const kNoFilesMessage;

// ASCII diagram of the root's descendants, directories with a trailing '/'.
std::string render_tree(const Node& root);

// "# File:" blocks for every file in diagram order.
std::string render_contents(const Node& root);

// Diagram, blank line, file blocks.
std::string render(const Node& root);

// Backtick fence longer than any backtick run inside content, at least 3.
std::string choose_fence(std::string_view content);

void collect_files(const Node& root, std::vector<const Node*>& out);

} // namespace git2text
