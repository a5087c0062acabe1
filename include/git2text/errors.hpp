#pragma once
#include <stdexcept>
#include <string>

namespace git2text {

// Fatal for the run: bad root, malformed pattern, conflicting flags.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Recoverable, per-file. Collected by the tree builder, never thrown.
struct ReadIssue {
    std::string rel_path;
    std::string reason;
};

} // namespace git2text
