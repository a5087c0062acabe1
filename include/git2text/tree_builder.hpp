#pragma once
#include <git2text/errors.hpp>
#include <git2text/filter_config.hpp>
#include <git2text/matcher.hpp>
#include <git2text/node.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace git2text {

struct BuildReport {
    std::vector<ReadIssue> issues;
    size_t files{0};
    size_t directories{0};
    size_t pruned{0};
    size_t skipped_empty{0};
};

// Depth-first walk with an explicit stack. Excluded directories are never
// opened. Admitted directories are kept even when empty, except in
// include-only mode where only directories leading to a file are kept.
class TreeBuilder {
public:
    explicit TreeBuilder(const FilterConfig& config);

    // Throws ConfigError if root does not exist or is not a directory.
    Node build(const std::filesystem::path& root);

    const BuildReport& report() const { return report_; }

private:
    enum class EntryType { Directory, File, BrokenLink, DirLink, Other };

    struct Entry {
        std::string name;
        std::filesystem::path abs;
        EntryType type{EntryType::Other};
    };

    struct Frame {
        Node* dir{nullptr};
        std::vector<Entry> entries;
        size_t next{0};
        bool layered{false};
    };

    const FilterConfig& config_;
    PathMatcher matcher_;
    BuildReport report_;

    Frame open_dir(Node* dir, const std::filesystem::path& abs);
    std::vector<Entry> list_dir(const std::filesystem::path& abs, const std::string& rel);
    void add_file(Node& parent, const Entry& e, const std::string& rel);
    void issue(const std::string& rel, std::string reason);
};

Node build_tree(const std::filesystem::path& root, const FilterConfig& config, BuildReport* report = nullptr);

// Reads a whole file in binary mode. On failure returns nullopt and sets why.
std::optional<std::string> read_file_bytes(const std::filesystem::path& p, std::string& why);

bool looks_binary(const std::string& content);

} // namespace git2text
