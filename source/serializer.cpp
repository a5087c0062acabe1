#include <git2text/serializer.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace git2text {

const char* const kNoFilesMessage = "No files matched the specified criteria.";

static const char* const kTee = "\xe2\x94\x9c\xe2\x94\x80\xe2\x94\x80 ";    // "├── "
static const char* const kElbow = "\xe2\x94\x94\xe2\x94\x80\xe2\x94\x80 ";  // "└── "
static const char* const kPipe = "\xe2\x94\x82   ";                          // "│   "
static const char* const kBlank = "    ";

static void render_level(const Node& dir, const std::string& padding, std::string& out) {
    for (size_t i = 0; i < dir.children.size(); ++i) {
        const Node& child = dir.children[i];
        bool last = (i + 1 == dir.children.size());
        out += padding;
        out += last ? kElbow : kTee;
        out += child.name;
        if (child.is_dir()) {
            out += "/\n";
            render_level(child, padding + (last ? kBlank : kPipe), out);
        } else {
            out += '\n';
        }
    }
}

std::string render_tree(const Node& root) {
    std::string out;
    render_level(root, "", out);
    return out;
}

void collect_files(const Node& root, std::vector<const Node*>& out) {
    for (const auto& child : root.children) {
        if (child.is_dir()) collect_files(child, out);
        else out.push_back(&child);
    }
}

std::string choose_fence(std::string_view content) {
    size_t longest = 0, run = 0;
    for (char c : content) {
        run = (c == '`') ? run + 1 : 0;
        longest = std::max(longest, run);
    }
    return std::string(std::max<size_t>(3, longest + 1), '`');
}

std::string render_contents(const Node& root) {
    std::vector<const Node*> files;
    collect_files(root, files);

    std::string out;
    for (const Node* f : files) {
        auto fence = choose_fence(f->content);
        out += fmt::format("# File: {}\n{}{}\n", f->rel_path, fence, f->language);
        out += f->content;
        if (!f->content.empty() && f->content.back() != '\n') out += '\n';
        out += fmt::format("{}\n# End of file: {}\n\n", fence, f->rel_path);
    }
    return out;
}

std::string render(const Node& root) {
    if (root.file_count() == 0) {
        return fmt::format("{}\n\n", kNoFilesMessage);
    }
    return render_tree(root) + "\n" + render_contents(root);
}

} // namespace git2text
