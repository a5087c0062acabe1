#include <git2text/cli.hpp>

#include <fmt/format.h>

#include <cctype>
#include <string_view>

namespace git2text {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static bool is_option(const char* a) {
    return a[0] == '-' && a[1] != '\0';
}

// Consumes the values following argv[i] up to the next option.
static void take_values(int& i, int argc, char** argv, std::vector<std::string>& dst) {
    while (i + 1 < argc && !is_option(argv[i + 1])) {
        dst.emplace_back(argv[++i]);
    }
}

static bool parse_size(const char* s, size_t& out) {
    if (!*s) return false;
    size_t v = 0;
    for (const char* p = s; *p; ++p) {
        if (!std::isdigit(static_cast<unsigned char>(*p))) return false;
        v = v * 10 + static_cast<size_t>(*p - '0');
    }
    out = v;
    return true;
}

std::string usage(const char* argv0) {
    return fmt::format(
        "Usage:\n"
        "  {} <PATH|GIT_URL>\n"
        "     [-o|--output FILE]             write to FILE (\"-\" for stdout)\n"
        "     [-cp|--clipboard]              copy the result to the clipboard\n"
        "     [-ig|--ignore PATTERN...]      gitignore-style patterns\n"
        "     [-if|--ignore-files GLOB...]   exclude files matching GLOB\n"
        "     [-id|--ignore-dirs GLOB...]    exclude directories matching GLOB\n"
        "     [-inc|--include GLOB...]       only include files matching GLOB\n"
        "     [-se|--skip-empty-files]\n"
        "     [-igi|--ignoregitignore]       do not read .gitignore/.globalignore\n"
        "     [--ignore-file PATH]           additional ignore file\n"
        "     [--log-file PATH] [--log-rotate-max BYTES] [--log-rotate-files N]\n"
        "     [-v|--verbose] [-h|--help] [--version]\n"
        "\n"
        "Without -o or -cp the result is written to stdout.\n", argv0);
}

ParseResult parse_cli(int argc, char** argv) {
    ParseResult r{};
    Options o;
    bool include_seen = false;

    for (int i = 1; i < argc; i++) {
        std::string_view a = argv[i];
        if (a == "-h" || a == "--help") {
            o.help = true;
        } else if (a == "--version") {
            o.version = true;
        } else if ((a == "-o" || a == "--output") && has_arg(i, argc)) {
            o.output = std::filesystem::path(argv[++i]);
        } else if (a == "-cp" || a == "--clipboard") {
            o.clipboard = true;
        } else if (a == "-ig" || a == "--ignore") {
            take_values(i, argc, argv, o.ignore_patterns);
        } else if (a == "-if" || a == "--ignore-files") {
            take_values(i, argc, argv, o.exclude_files);
        } else if (a == "-id" || a == "--ignore-dirs") {
            take_values(i, argc, argv, o.exclude_dirs);
        } else if (a == "-inc" || a == "--include" || a == "--include-files") {
            include_seen = true;
            take_values(i, argc, argv, o.includes);
        } else if (a == "-se" || a == "--skip-empty-files") {
            o.skip_empty_files = true;
        } else if (a == "-igi" || a == "--ignoregitignore") {
            o.ignore_gitignore = true;
        } else if (a == "--ignore-file" && has_arg(i, argc)) {
            o.ignore_files.emplace_back(argv[++i]);
        } else if (a == "--log-file" && has_arg(i, argc)) {
            o.log_file = std::filesystem::path(argv[++i]);
        } else if (a == "--log-rotate-max" && has_arg(i, argc)) {
            if (!parse_size(argv[++i], o.log_rotate_max)) {
                r.error = fmt::format("--log-rotate-max: not a number: {}", argv[i]);
                return r;
            }
        } else if (a == "--log-rotate-files" && has_arg(i, argc)) {
            if (!parse_size(argv[++i], o.log_rotate_files)) {
                r.error = fmt::format("--log-rotate-files: not a number: {}", argv[i]);
                return r;
            }
        } else if (a == "-v" || a == "--verbose") {
            o.verbose = true;
        } else if (!a.empty() && a[0] == '-' && a != "-") {
            r.error = fmt::format("unknown or incomplete argument: {}", a);
            return r;
        } else if (o.source.empty()) {
            o.source = std::string(a);
        } else {
            r.error = fmt::format("unexpected argument: {}", a);
            return r;
        }
    }

    if (o.help || o.version) {
        r.options = o;
        return r;
    }
    if (o.source.empty()) {
        r.error = "path or git URL is required";
        return r;
    }
    if (include_seen && o.includes.empty()) {
        r.error = "--include requires at least one pattern";
        return r;
    }
    r.options = o;
    return r;
}

} // namespace git2text
