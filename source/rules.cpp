#include <git2text/rules.hpp>
#include <git2text/errors.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <fstream>

namespace fs = std::filesystem;

namespace git2text {

const char* to_string(Provenance p) {
    switch (p) {
        case Provenance::IgnoreFile:     return "ignore-file";
        case Provenance::CliIgnore:      return "cli-ignore";
        case Provenance::CliExcludeFile: return "cli-exclude-file";
        case Provenance::CliExcludeDir:  return "cli-exclude-dir";
        case Provenance::CliInclude:     return "cli-include";
    }
    return "?";
}

std::string basename_of(const std::string& rel) {
    auto pos = rel.find_last_of('/');
    return pos == std::string::npos ? rel : rel.substr(pos + 1);
}

static bool is_glob_rule(Provenance p) {
    return p == Provenance::CliExcludeFile || p == Provenance::CliExcludeDir ||
           p == Provenance::CliInclude;
}

bool rule_matches(const Rule& r, const std::string& rel, bool is_dir) {
    if (r.dir_only && !is_dir) return false;

    std::string sub;
    if (r.origin.empty()) {
        sub = rel;
    } else if (rel.size() > r.origin.size() && rel.compare(0, r.origin.size(), r.origin) == 0 &&
               rel[r.origin.size()] == '/') {
        sub = rel.substr(r.origin.size() + 1);
    } else {
        return false;
    }

    if (is_glob_rule(r.provenance)) {
        if (r.glob.matches(sub)) return true;
        return !r.anchored && r.glob.matches(basename_of(sub));
    }
    return r.anchored ? r.glob.matches(sub) : r.glob.matches(basename_of(sub));
}

// Trailing spaces are dropped unless escaped with a backslash.
static void strip_trailing(std::string& s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        size_t n = s.size();
        size_t bs = 0;
        while (bs + 1 < n && s[n - 2 - bs] == '\\') ++bs;
        if (bs % 2 == 1) break;
        s.pop_back();
    }
}

std::optional<Rule> parse_ignore_line(std::string s, const std::string& origin, Provenance provenance) {
    strip_trailing(s);
    if (s.empty() || s[0] == '#') return std::nullopt;

    Rule r;
    r.provenance = provenance;
    r.origin = origin;

    if (s[0] == '!') {
        r.negate = true;
        s.erase(0, 1);
    } else if (s.size() > 1 && s[0] == '\\' && (s[1] == '!' || s[1] == '#')) {
        s.erase(0, 1);
    }
    if (s.empty()) return std::nullopt;
    r.pattern = s;

    if (s.size() > 1 && s.back() == '/') {
        r.dir_only = true;
        s.pop_back();
    }
    if (s.find('/') != std::string::npos) {
        r.anchored = true;
        if (s[0] == '/') s.erase(0, 1);
    }
    if (s.empty()) return std::nullopt;

    r.glob = GlobPattern::compile(s);
    return r;
}

std::vector<Rule> parse_ignore_lines(const std::vector<std::string>& lines, const std::string& origin,
                                     Provenance provenance) {
    std::vector<Rule> out;
    for (const auto& line : lines) {
        if (auto r = parse_ignore_line(line, origin, provenance)) out.push_back(std::move(*r));
    }
    return out;
}

std::vector<Rule> load_ignore_file(const fs::path& file, const std::string& origin, bool required,
                                   Provenance provenance) {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        if (required) throw ConfigError(fmt::format("ignore file not found: {}", file.string()));
        return {};
    }
    std::ifstream in(file);
    if (!in.good()) {
        if (required) throw ConfigError(fmt::format("cannot read ignore file: {}", file.string()));
        spdlog::warn("cannot read ignore file {}, skipping", file.string());
        return {};
    }

    std::vector<Rule> out;
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        try {
            if (auto r = parse_ignore_line(line, origin, provenance)) out.push_back(std::move(*r));
        } catch (const ConfigError& e) {
            throw ConfigError(fmt::format("{}:{}: {}", file.string(), lineno, e.what()));
        }
    }
    spdlog::debug("loaded {} rules from {}", out.size(), file.string());
    return out;
}

Rule make_glob_rule(const std::string& pattern, Provenance provenance) {
    Rule r;
    r.pattern = pattern;
    r.provenance = provenance;

    std::string s = pattern;
    while (s.size() > 2 && s.compare(0, 2, "./") == 0) s.erase(0, 2);
    if (s.size() > 1 && s.back() == '/') {
        r.dir_only = true;
        s.pop_back();
    }
    if (!s.empty() && s[0] == '/') {
        r.anchored = true;
        s.erase(0, 1);
    }
    if (s.empty()) throw ConfigError(fmt::format("empty pattern '{}'", pattern));

    r.glob = GlobPattern::compile(s);
    return r;
}

} // namespace git2text
