#include <git2text/matcher.hpp>

#include <spdlog/spdlog.h>

namespace git2text {

const char* to_string(Decision d) {
    return d == Decision::Include ? "include" : "exclude";
}

PathMatcher::PathMatcher(const FilterConfig& config) : config_(config) {}

void PathMatcher::push_layer(std::vector<Rule> rules) {
    layers_.push_back(std::move(rules));
}

void PathMatcher::pop_layer() {
    if (!layers_.empty()) layers_.pop_back();
}

// An include pattern selects a file directly or through any of its parent directories.
bool PathMatcher::included_by_pattern(const std::string& rel) const {
    for (const auto& r : config_.include_rules) {
        if (rule_matches(r, rel, false)) return true;
        for (size_t pos = rel.find('/'); pos != std::string::npos; pos = rel.find('/', pos + 1)) {
            if (rule_matches(r, rel.substr(0, pos), true)) return true;
        }
    }
    return false;
}

bool PathMatcher::ignored(const std::string& rel, bool is_dir) const {
    bool excluded = false;
    auto apply = [&](const std::vector<Rule>& rules) {
        for (const auto& r : rules) {
            if (rule_matches(r, rel, is_dir)) {
                excluded = !r.negate;
                spdlog::trace("{}: '{}' ({}) -> {}", rel, r.pattern, to_string(r.provenance),
                              excluded ? "ignored" : "re-included");
            }
        }
    };
    if (!config_.ignore_ignore_file) {
        apply(config_.ignore_rules);
        for (const auto& layer : layers_) apply(layer);
    }
    apply(config_.cli_ignore_rules);
    return excluded;
}

Decision PathMatcher::decide_entry(const std::string& rel, bool is_dir) const {
    if (basename_of(rel) == ".git") return Decision::Exclude;
    for (const auto& p : config_.builtin_excludes) {
        if (rel == p) return Decision::Exclude;
    }

    if (config_.include_mode()) {
        if (is_dir) return Decision::Include;
        return included_by_pattern(rel) ? Decision::Include : Decision::Exclude;
    }

    const auto& excludes = is_dir ? config_.exclude_dir_rules : config_.exclude_file_rules;
    for (const auto& r : excludes) {
        if (rule_matches(r, rel, is_dir)) {
            spdlog::trace("{}: excluded by '{}' ({})", rel, r.pattern, to_string(r.provenance));
            return Decision::Exclude;
        }
    }

    return ignored(rel, is_dir) ? Decision::Exclude : Decision::Include;
}

Decision PathMatcher::decide(const std::string& rel, bool is_dir) const {
    for (size_t pos = rel.find('/'); pos != std::string::npos; pos = rel.find('/', pos + 1)) {
        if (decide_entry(rel.substr(0, pos), true) == Decision::Exclude) return Decision::Exclude;
    }
    return decide_entry(rel, is_dir);
}

} // namespace git2text
