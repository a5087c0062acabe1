#include <git2text/app.hpp>
#include <git2text/cli.hpp>
#include <git2text/errors.hpp>
#include <git2text/filter_config.hpp>
#include <git2text/remote.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/format.h>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#ifndef GIT2TEXT_VERSION
#define GIT2TEXT_VERSION "0.0.0"
#endif

using namespace git2text;
namespace fs = std::filesystem;

// The rendered text may go to stdout, so log lines always go to stderr.
static void setup_logging(const Options& opts) {
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("git2text", console);
    if (opts.log_file) {
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                opts.log_file->string(), opts.log_rotate_max, opts.log_rotate_files);
            logger->sinks().push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            logger->warn("failed to initialize rotating log sink ({}), logging to stderr only", e.what());
        }
    }
    spdlog::set_default_logger(logger);
    spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);
}

static int run_app(const Options& opts, const char* argv0) {
    std::optional<Checkout> checkout;
    fs::path root;

    std::error_code ec;
    if (fs::is_directory(opts.source, ec)) {
        root = opts.source;
    } else if (is_git_url(opts.source)) {
        spdlog::info("cloning {}", opts.source);
        checkout.emplace(Checkout::clone(opts.source));
        root = checkout->root();
    } else if (fs::exists(opts.source, ec)) {
        throw ConfigError(fmt::format("root path is not a directory: {}", opts.source));
    } else {
        throw ConfigError(fmt::format("root path does not exist: {}", opts.source));
    }
    spdlog::debug("root={}", root.string());

    auto inputs = filter_inputs_from(opts, root, resolve_global_ignore(argv0));
    auto config = make_filter_config(inputs);
    auto sink = make_sink(opts);

    run(root, config, *sink);
    return 0;
}

int main(int argc, char** argv) {
    auto parsed = parse_cli(argc, argv);
    if (!parsed.options) {
        std::fprintf(stderr, "error: %s\n\n%s", parsed.error.c_str(), usage(argv[0]).c_str());
        return 2;
    }
    const Options& opts = *parsed.options;
    if (opts.help) {
        fmt::print("{}", usage(argv[0]));
        return 0;
    }
    if (opts.version) {
        fmt::print("git2text {}\n", GIT2TEXT_VERSION);
        return 0;
    }

    setup_logging(opts);

    try {
        return run_app(opts, argv[0]);
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
    } catch (const std::exception& e) {
        spdlog::error("fatal: {}", e.what());
    }
    return 1;
}
