#include <git2text/tree_builder.hpp>
#include <git2text/language.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace git2text {

static constexpr size_t kBinarySniffBytes = 8000;

size_t Node::file_count() const {
    if (!is_dir()) return 1;
    size_t n = 0;
    for (const auto& c : children) n += c.file_count();
    return n;
}

static std::string join_rel(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

std::optional<std::string> read_file_bytes(const fs::path& p, std::string& why) {
    errno = 0;
    std::ifstream in(p, std::ios::in | std::ios::binary);
    if (!in) {
        why = errno ? std::strerror(errno) : "cannot open";
        return std::nullopt;
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        why = "I/O error while reading";
        return std::nullopt;
    }
    return data;
}

bool looks_binary(const std::string& content) {
    size_t n = std::min(content.size(), kBinarySniffBytes);
    return std::memchr(content.data(), '\0', n) != nullptr;
}

TreeBuilder::TreeBuilder(const FilterConfig& config) : config_(config), matcher_(config) {}

void TreeBuilder::issue(const std::string& rel, std::string reason) {
    spdlog::warn("skipping {}: {}", rel, reason);
    report_.issues.push_back(ReadIssue{rel, std::move(reason)});
}

std::vector<TreeBuilder::Entry> TreeBuilder::list_dir(const fs::path& abs, const std::string& rel) {
    std::vector<Entry> out;
    std::error_code ec;
    fs::directory_iterator it(abs, ec);
    if (ec) {
        issue(rel.empty() ? "." : rel, "cannot list directory: " + ec.message());
        return out;
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        const auto& de = *it;
        Entry e;
        e.name = de.path().filename().string();
        e.abs = de.path();

        std::error_code sec;
        auto st = de.symlink_status(sec);
        if (sec) {
            e.type = EntryType::BrokenLink;
        } else if (fs::is_symlink(st)) {
            auto target = fs::status(de.path(), sec);
            if (sec || !fs::exists(target)) e.type = EntryType::BrokenLink;
            else if (fs::is_directory(target)) e.type = EntryType::DirLink;
            else if (fs::is_regular_file(target)) e.type = EntryType::File;
            else e.type = EntryType::Other;
        } else if (fs::is_directory(st)) {
            e.type = EntryType::Directory;
        } else if (fs::is_regular_file(st)) {
            e.type = EntryType::File;
        }
        out.push_back(std::move(e));
    }
    if (ec) {
        issue(rel.empty() ? "." : rel, "directory listing interrupted: " + ec.message());
    }
    std::sort(out.begin(), out.end(), [](const Entry& a, const Entry& b) { return a.name < b.name; });
    return out;
}

TreeBuilder::Frame TreeBuilder::open_dir(Node* dir, const fs::path& abs) {
    Frame f;
    f.dir = dir;
    if (!config_.ignore_ignore_file) {
        auto rules = load_ignore_file(abs / config_.ignore_file_name, dir->rel_path, false);
        if (!rules.empty()) {
            matcher_.push_layer(std::move(rules));
            f.layered = true;
        }
    }
    f.entries = list_dir(abs, dir->rel_path);
    return f;
}

void TreeBuilder::add_file(Node& parent, const Entry& e, const std::string& rel) {
    if (e.type == EntryType::BrokenLink) {
        issue(rel, "broken symlink");
        return;
    }

    std::string why;
    auto content = read_file_bytes(e.abs, why);
    if (!content) {
        issue(rel, why);
        return;
    }
    if (content->empty() && config_.skip_empty_files) {
        spdlog::debug("skipping empty file {}", rel);
        report_.skipped_empty++;
        return;
    }
    if (looks_binary(*content)) {
        issue(rel, "binary content");
        return;
    }

    Node file;
    file.kind = NodeKind::File;
    file.name = e.name;
    file.rel_path = rel;
    file.language = language_for(e.name);
    file.content = std::move(*content);
    parent.children.push_back(std::move(file));
    report_.files++;
}

Node TreeBuilder::build(const fs::path& root) {
    std::error_code ec;
    auto st = fs::status(root, ec);
    if (ec || !fs::exists(st)) {
        throw ConfigError(fmt::format("root path does not exist: {}", root.string()));
    }
    if (!fs::is_directory(st)) {
        throw ConfigError(fmt::format("root path is not a directory: {}", root.string()));
    }

    report_ = BuildReport{};
    Node top;
    top.kind = NodeKind::Directory;
    top.name = root.filename().empty() ? root.parent_path().filename().string() : root.filename().string();

    std::vector<Frame> stack;
    stack.push_back(open_dir(&top, root));

    while (!stack.empty()) {
        Frame& f = stack.back();
        if (f.next == f.entries.size()) {
            if (f.layered) matcher_.pop_layer();
            Node* done = f.dir;
            stack.pop_back();
            if (!stack.empty()) {
                if (done->children.empty() && config_.include_mode()) {
                    stack.back().dir->children.pop_back();
                } else {
                    report_.directories++;
                }
            }
            continue;
        }

        Entry e = f.entries[f.next++];
        Node* parent = f.dir;
        std::string rel = join_rel(parent->rel_path, e.name);

        switch (e.type) {
            case EntryType::Directory: {
                if (matcher_.decide_entry(rel, true) == Decision::Exclude) {
                    spdlog::debug("pruned {}/", rel);
                    report_.pruned++;
                    break;
                }
                Node dir;
                dir.kind = NodeKind::Directory;
                dir.name = e.name;
                dir.rel_path = rel;
                parent->children.push_back(std::move(dir));
                Node* child = &parent->children.back();
                // f is dangling after this push
                stack.push_back(open_dir(child, e.abs));
                break;
            }
            case EntryType::File:
            case EntryType::BrokenLink:
                if (matcher_.decide_entry(rel, false) == Decision::Exclude) {
                    spdlog::trace("excluded {}", rel);
                    break;
                }
                add_file(*parent, e, rel);
                break;
            case EntryType::DirLink:
                spdlog::debug("not following directory symlink {}", rel);
                break;
            case EntryType::Other:
                spdlog::debug("skipping special file {}", rel);
                break;
        }
    }

    spdlog::debug("tree built: files={} dirs={} pruned={} skipped_empty={} issues={}",
                  report_.files, report_.directories, report_.pruned, report_.skipped_empty,
                  report_.issues.size());
    return top;
}

Node build_tree(const fs::path& root, const FilterConfig& config, BuildReport* report) {
    TreeBuilder builder(config);
    Node tree = builder.build(root);
    if (report) *report = builder.report();
    return tree;
}

} // namespace git2text
