#pragma once
#include <git2text/cli.hpp>
#include <git2text/errors.hpp>
#include <git2text/filter_config.hpp>
#include <git2text/sink.hpp>
#include <git2text/tree_builder.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace git2text {

struct RunSummary {
    size_t files{0};
    size_t bytes{0};
    std::vector<ReadIssue> issues;
    std::string fingerprint; // xxh3-64 of the rendered text
};

// Builds and renders the whole text in memory. Throws ConfigError.
std::string generate(const std::filesystem::path& root, const FilterConfig& config,
                     BuildReport* report = nullptr);

// generate() then hand the text to the sink. Errors propagate to the caller;
// the sink is untouched if building fails.
RunSummary run(const std::filesystem::path& root, const FilterConfig& config, OutputSink& sink);

// Command-line options to filter inputs. Excludes the output file when it
// lies under root; global_ignore is used unless ignore files are disabled.
FilterInputs filter_inputs_from(const Options& opts, const std::filesystem::path& root,
                                const std::optional<std::filesystem::path>& global_ignore);

// GIT2TEXT_GLOBAL_IGNORE, else ".globalignore" beside the executable if present.
std::optional<std::filesystem::path> resolve_global_ignore(const char* argv0);

std::unique_ptr<OutputSink> make_sink(const Options& opts);

} // namespace git2text
