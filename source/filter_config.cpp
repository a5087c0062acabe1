#include <git2text/filter_config.hpp>
#include <git2text/errors.hpp>

#include <spdlog/spdlog.h>

namespace git2text {

static void add_globs(std::vector<Rule>& dst, const std::vector<std::string>& patterns, Provenance p) {
    for (const auto& pat : patterns) {
        if (pat.empty()) continue;
        dst.push_back(make_glob_rule(pat, p));
    }
}

FilterConfig make_filter_config(const FilterInputs& in) {
    FilterConfig cfg;
    cfg.skip_empty_files = in.skip_empty_files;
    cfg.ignore_ignore_file = in.ignore_ignore_file;
    cfg.ignore_file_name = in.ignore_file_name;
    cfg.builtin_excludes = in.builtin_excludes;
    if (cfg.ignore_file_name.empty() || cfg.ignore_file_name.find('/') != std::string::npos) {
        throw ConfigError("ignore file name must be a plain file name: '" + cfg.ignore_file_name + "'");
    }

    if (!in.ignore_ignore_file) {
        if (in.global_ignore) {
            auto rules = load_ignore_file(*in.global_ignore, "", false);
            cfg.ignore_rules.insert(cfg.ignore_rules.end(), rules.begin(), rules.end());
        }
        for (const auto& f : in.ignore_files) {
            auto rules = load_ignore_file(f, "", true);
            cfg.ignore_rules.insert(cfg.ignore_rules.end(), rules.begin(), rules.end());
        }
    } else if (!in.ignore_files.empty()) {
        throw ConfigError("--ignore-file conflicts with --ignoregitignore");
    }

    cfg.cli_ignore_rules = parse_ignore_lines(in.ignore_patterns, "", Provenance::CliIgnore);
    add_globs(cfg.exclude_file_rules, in.exclude_files, Provenance::CliExcludeFile);
    add_globs(cfg.exclude_dir_rules, in.exclude_dirs, Provenance::CliExcludeDir);
    add_globs(cfg.include_rules, in.includes, Provenance::CliInclude);

    spdlog::debug("filter: ignore={} cli-ignore={} exclude-file={} exclude-dir={} include={} skip-empty={} no-ignore-file={}",
                  cfg.ignore_rules.size(), cfg.cli_ignore_rules.size(), cfg.exclude_file_rules.size(),
                  cfg.exclude_dir_rules.size(), cfg.include_rules.size(), cfg.skip_empty_files,
                  cfg.ignore_ignore_file);
    return cfg;
}

} // namespace git2text
