#pragma once
#include <git2text/filter_config.hpp>

#include <string>
#include <vector>

namespace git2text {

enum class Decision {
    Include,
    Exclude,
};

const char* to_string(Decision d);

// Evaluates '/'-separated root-relative paths against a FilterConfig plus
// the ignore-file layers found during traversal.
//
// Precedence: built-in .git exclusion, include-only mode, command-line
// excludes, then one ordered last-match-wins pass over ignore rules
// (config ignore files, traversal layers from shallow to deep, command-line
// ignore patterns). Default is Include.
//
// In include-only mode directories are always Include: they are traversed
// and shown only when something below them is included.
class PathMatcher {
public:
    explicit PathMatcher(const FilterConfig& config);

    // Full decision: a path under an excluded directory is excluded too.
    Decision decide(const std::string& rel, bool is_dir) const;

    // Decision for an entry whose parent directory was already admitted.
    Decision decide_entry(const std::string& rel, bool is_dir) const;

    // Ignore-file rules from a directory met during traversal.
    void push_layer(std::vector<Rule> rules);
    void pop_layer();
    size_t layer_count() const { return layers_.size(); }

    const FilterConfig& config() const { return config_; }

private:
    const FilterConfig& config_;
    std::vector<std::vector<Rule>> layers_;

    bool included_by_pattern(const std::string& rel) const;
    bool ignored(const std::string& rel, bool is_dir) const;
};

} // namespace git2text
