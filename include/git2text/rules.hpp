#pragma once
#include <git2text/glob.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace git2text {

enum class Provenance {
    IgnoreFile,
    CliIgnore,
    CliExcludeFile,
    CliExcludeDir,
    CliInclude,
};

const char* to_string(Provenance p);

struct Rule {
    std::string pattern;
    Provenance provenance{Provenance::IgnoreFile};
    bool negate{false};
    bool dir_only{false};
    // gitignore rules: anchored ones match the origin-relative path, others the basename.
    // glob rules: anchored ones match the path only, others the path or the basename.
    bool anchored{false};
    std::string origin; // directory of the ignore file, relative to root, "" for root
    GlobPattern glob;
};

bool rule_matches(const Rule& r, const std::string& rel, bool is_dir);

// One line of gitignore syntax. Returns nullopt for blanks and comments,
// throws ConfigError for malformed patterns.
std::optional<Rule> parse_ignore_line(std::string line, const std::string& origin,
                                      Provenance provenance = Provenance::IgnoreFile);

std::vector<Rule> parse_ignore_lines(const std::vector<std::string>& lines,
                                     const std::string& origin,
                                     Provenance provenance = Provenance::IgnoreFile);

// required == true: an unreadable or missing file is a ConfigError.
// required == false: a missing file yields no rules, an unreadable one a warning.
std::vector<Rule> load_ignore_file(const std::filesystem::path& file,
                                   const std::string& origin,
                                   bool required,
                                   Provenance provenance = Provenance::IgnoreFile);

// Plain glob from the command line (exclude-file, exclude-dir, include).
Rule make_glob_rule(const std::string& pattern, Provenance provenance);

std::string basename_of(const std::string& rel);

} // namespace git2text
