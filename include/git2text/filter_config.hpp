#pragma once
#include <git2text/rules.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace git2text {

// Raw rule sources as the command line and environment supply them.
struct FilterInputs {
    std::vector<std::string> ignore_patterns;           // gitignore-style, from the command line
    std::vector<std::filesystem::path> ignore_files;    // explicitly named, must be readable
    std::optional<std::filesystem::path> global_ignore; // optional, skipped if missing
    std::vector<std::string> exclude_files;
    std::vector<std::string> exclude_dirs;
    std::vector<std::string> includes;
    std::vector<std::string> builtin_excludes;          // exact root-relative paths
    bool skip_empty_files{false};
    bool ignore_ignore_file{false};
    std::string ignore_file_name{".gitignore"};
};

// Resolved once per run, read-only afterwards.
struct FilterConfig {
    std::vector<Rule> ignore_rules; // global + explicit ignore files, in file order
    std::vector<Rule> cli_ignore_rules;
    std::vector<Rule> exclude_file_rules;
    std::vector<Rule> exclude_dir_rules;
    std::vector<Rule> include_rules;
    std::vector<std::string> builtin_excludes; // skipped in every mode, like .git
    bool skip_empty_files{false};
    bool ignore_ignore_file{false};
    std::string ignore_file_name{".gitignore"};

    bool include_mode() const { return !include_rules.empty(); }
};

// Compiles every pattern and loads the ignore files. Throws ConfigError.
FilterConfig make_filter_config(const FilterInputs& in);

} // namespace git2text
