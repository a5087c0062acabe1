#include <git2text/app.hpp>
#include <git2text/serializer.hpp>
#include <git2text/util.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace fs = std::filesystem;

namespace git2text {

std::string generate(const fs::path& root, const FilterConfig& config, BuildReport* report) {
    TreeBuilder builder(config);
    Node tree = builder.build(root);
    if (report) *report = builder.report();
    return render(tree);
}

RunSummary run(const fs::path& root, const FilterConfig& config, OutputSink& sink) {
    BuildReport report;
    std::string text = generate(root, config, &report);

    RunSummary s;
    s.files = report.files;
    s.bytes = text.size();
    s.issues = std::move(report.issues);
    s.fingerprint = xxh3_hex(text);

    if (s.files == 0) spdlog::warn("no files matched the criteria under {}", root.string());
    sink.write(text);

    spdlog::info("{} files, {} bytes written to {} (xxh3={})", s.files, s.bytes, sink.describe(), s.fingerprint);
    if (!s.issues.empty()) {
        spdlog::warn("{} file(s) skipped because they could not be read", s.issues.size());
        for (const auto& i : s.issues) spdlog::debug("  {}: {}", i.rel_path, i.reason);
    }
    return s;
}

static std::optional<std::string> rel_inside(const fs::path& file, const fs::path& root) {
    std::error_code ec;
    auto f = fs::weakly_canonical(fs::absolute(file, ec), ec);
    if (ec) return std::nullopt;
    auto r = fs::weakly_canonical(fs::absolute(root, ec), ec);
    if (ec) return std::nullopt;
    auto rel = f.lexically_relative(r);
    if (rel.empty() || *rel.begin() == "..") return std::nullopt;
    return rel.generic_string();
}

FilterInputs filter_inputs_from(const Options& opts, const fs::path& root,
                                const std::optional<fs::path>& global_ignore) {
    FilterInputs in;
    in.ignore_patterns = opts.ignore_patterns;
    in.ignore_files = opts.ignore_files;
    in.exclude_files = opts.exclude_files;
    in.exclude_dirs = opts.exclude_dirs;
    in.includes = opts.includes;
    in.skip_empty_files = opts.skip_empty_files;
    in.ignore_ignore_file = opts.ignore_gitignore;
    if (!opts.ignore_gitignore) in.global_ignore = global_ignore;

    if (opts.output && opts.output->string() != "-") {
        if (auto rel = rel_inside(*opts.output, root)) {
            spdlog::debug("excluding output file {} from the listing", *rel);
            in.builtin_excludes.push_back(*rel);
        }
    }
    return in;
}

std::optional<fs::path> resolve_global_ignore(const char* argv0) {
    if (const char* e = std::getenv("GIT2TEXT_GLOBAL_IGNORE")) {
        if (*e) return fs::path(e);
    }
    if (!argv0 || !*argv0) return std::nullopt;

    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) exe = fs::absolute(argv0, ec);
    if (ec) return std::nullopt;
    auto cand = exe.parent_path() / ".globalignore";
    if (fs::exists(cand, ec)) return cand;
    return std::nullopt;
}

std::unique_ptr<OutputSink> make_sink(const Options& opts) {
    bool to_file = opts.output && opts.output->string() != "-";
    if (to_file && opts.clipboard) {
        std::vector<std::unique_ptr<OutputSink>> sinks;
        sinks.push_back(std::make_unique<FileSink>(*opts.output));
        sinks.push_back(std::make_unique<ClipboardSink>());
        return std::make_unique<TeeSink>(std::move(sinks));
    }
    if (to_file) return std::make_unique<FileSink>(*opts.output);
    if (opts.clipboard) return std::make_unique<ClipboardSink>();
    return std::make_unique<StdoutSink>();
}

} // namespace git2text
