#pragma once
#include <regex>
#include <string>

namespace git2text {

// Shell glob compiled to a regex over '/'-separated paths.
//   *      any run of characters except '/'
//   ?      one character except '/'
//   [...]  bracket class, '!' or '^' negates, never matches '/'
//   **     as a whole segment: zero or more segments
//   \x     literal x
class GlobPattern {
public:
    GlobPattern() = default;

    // Throws ConfigError on a malformed pattern.
    static GlobPattern compile(const std::string& text);

    bool matches(const std::string& path) const;
    const std::string& text() const { return text_; }
    const std::string& regex_source() const { return regex_src_; }

private:
    std::string text_;
    std::string regex_src_;
    std::regex re_;
};

std::string glob_to_regex(const std::string& pat);
std::string glob_escape(const std::string& literal);

} // namespace git2text
