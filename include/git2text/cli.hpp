#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace git2text {

struct Options {
    std::string source; // directory or git URL
    std::optional<std::filesystem::path> output; // "-" means stdout
    bool clipboard = false;

    std::vector<std::string> ignore_patterns;
    std::vector<std::string> exclude_files;
    std::vector<std::string> exclude_dirs;
    std::vector<std::string> includes;
    std::vector<std::filesystem::path> ignore_files;
    bool skip_empty_files = false;
    bool ignore_gitignore = false;

    std::optional<std::filesystem::path> log_file;
    size_t log_rotate_max = 10 * 1024 * 1024;
    size_t log_rotate_files = 3;
    bool verbose = false;

    bool help = false;
    bool version = false;
};

struct ParseResult {
    std::optional<Options> options;
    std::string error;
};

ParseResult parse_cli(int argc, char** argv);

std::string usage(const char* argv0);

} // namespace git2text
