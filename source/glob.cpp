#include <git2text/glob.hpp>
#include <git2text/errors.hpp>

#include <fmt/format.h>

#include <cctype>
#include <cstring>

namespace git2text {

static bool is_regex_special(char c) {
    return c != '\0' && std::strchr(".+(){}^$|\\[]*?", c) != nullptr;
}

static void append_literal(std::string& rx, char c) {
    if (is_regex_special(c)) rx.push_back('\\');
    rx.push_back(c);
}

static bool is_posix_class(const std::string& name) {
    static const char* const kClasses[] = {
        "alnum", "alpha", "blank", "cntrl", "digit", "graph",
        "lower", "print", "punct", "space", "upper", "xdigit",
    };
    for (const char* c : kClasses) {
        if (name == c) return true;
    }
    return false;
}

// Parses "[...]" starting at pat[i] == '['. Returns index past the closing ']'.
static size_t translate_bracket(const std::string& pat, size_t i, std::string& rx) {
    size_t j = i + 1;
    bool negate = false;
    if (j < pat.size() && (pat[j] == '!' || pat[j] == '^')) { negate = true; ++j; }

    std::string cls;
    bool first = true;
    for (;;) {
        if (j >= pat.size()) {
            throw ConfigError(fmt::format("unterminated '[' in pattern '{}'", pat));
        }
        char c = pat[j];
        if (c == ']' && !first) break;
        if (c == '\\') {
            if (j + 1 >= pat.size()) {
                throw ConfigError(fmt::format("trailing backslash in pattern '{}'", pat));
            }
            c = pat[++j];
            if (!std::isalnum(static_cast<unsigned char>(c))) cls.push_back('\\');
            cls.push_back(c);
        } else if (c == '[' && j + 1 < pat.size() && pat[j + 1] == ':') {
            size_t close = pat.find(":]", j + 2);
            if (close == std::string::npos) {
                throw ConfigError(fmt::format("unterminated character class in pattern '{}'", pat));
            }
            std::string name = pat.substr(j + 2, close - j - 2);
            if (!is_posix_class(name)) {
                throw ConfigError(fmt::format("unknown character class '[:{}:]' in pattern '{}'", name, pat));
            }
            cls += "[:" + name + ":]";
            j = close + 1;
        } else if (c == '[' || c == ']' || c == '^') {
            cls.push_back('\\');
            cls.push_back(c);
        } else {
            cls.push_back(c);
        }
        first = false;
        ++j;
    }

    if (negate) {
        rx += "[^/";
        rx += cls;
        rx += ']';
    } else {
        // '/' never matches inside a class
        rx += "(?!/)[";
        rx += cls;
        rx += ']';
    }
    return j + 1;
}

std::string glob_to_regex(const std::string& pat) {
    std::string rx;
    size_t i = 0;
    while (i < pat.size()) {
        char c = pat[i];
        if (c == '*') {
            if (i + 1 < pat.size() && pat[i + 1] == '*') {
                bool seg_start = (i == 0 || pat[i - 1] == '/');
                size_t j = i + 2;
                while (j < pat.size() && pat[j] == '*') ++j;
                bool seg_end = (j == pat.size() || pat[j] == '/');
                if (seg_start && seg_end) {
                    if (j == pat.size()) {
                        rx += ".*";
                        i = j;
                    } else {
                        rx += "(?:[^/]*/)*";
                        i = j + 1;
                    }
                    continue;
                }
                rx += "[^/]*";
                i = j;
                continue;
            }
            rx += "[^/]*";
            ++i;
        } else if (c == '?') {
            rx += "[^/]";
            ++i;
        } else if (c == '[') {
            i = translate_bracket(pat, i, rx);
        } else if (c == '\\') {
            if (i + 1 >= pat.size()) {
                throw ConfigError(fmt::format("trailing backslash in pattern '{}'", pat));
            }
            append_literal(rx, pat[i + 1]);
            i += 2;
        } else {
            append_literal(rx, c);
            ++i;
        }
    }
    return rx;
}

GlobPattern GlobPattern::compile(const std::string& text) {
    if (text.empty()) throw ConfigError("empty pattern");
    GlobPattern g;
    g.text_ = text;
    g.regex_src_ = glob_to_regex(text);
    try {
        g.re_ = std::regex(g.regex_src_, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw ConfigError(fmt::format("cannot compile pattern '{}': {}", text, e.what()));
    }
    return g;
}

bool GlobPattern::matches(const std::string& path) const {
    if (text_.empty()) return false;
    return std::regex_match(path, re_);
}

std::string glob_escape(const std::string& literal) {
    std::string out;
    out.reserve(literal.size());
    for (char c : literal) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\' || c == '!' || c == '#') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

} // namespace git2text
