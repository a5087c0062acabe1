#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <git2text/tree_builder.hpp>
#include <git2text/filter_config.hpp>
#include <git2text/matcher.hpp>
#include <git2text/serializer.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>
#include <cstdlib>
#include <unistd.h>

using namespace git2text;
namespace fs = std::filesystem;

static fs::path make_tmpdir(const std::string& prefix) {
    fs::path base = fs::temp_directory_path() / (prefix + "XXXXXX");
    std::string s = base.string();
    std::vector<char> buf(s.begin(), s.end());
    buf.push_back('\0');
    char* p = mkdtemp(buf.data());
    REQUIRE(p != nullptr);
    return fs::path(p);
}

static void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream o(p, std::ios::binary);
    o << content;
}

static size_t pick(std::mt19937& rng, size_t n) {
    return std::uniform_int_distribution<size_t>(0, n - 1)(rng);
}

static bool coin(std::mt19937& rng) {
    return pick(rng, 2) == 0;
}

static const std::vector<std::string> kDirNames = {
    "src", "lib", "docs", "build", "vendor", "d1", "d2",
};
static const std::vector<std::string> kFileNames = {
    "a.c", "b.txt", "c.md", "keep.log", "run.log", "x1.py", "notes", "f2.txt", "main.cpp",
};

// Directory names and file names come from disjoint pools, so a rule never
// has to tell a file from a directory of the same name.
static void grow(std::mt19937& rng, const fs::path& dir, int depth) {
    std::vector<std::string> files = kFileNames;
    std::shuffle(files.begin(), files.end(), rng);
    files.resize(pick(rng, 4));
    for (const auto& f : files) {
        write_file(dir / f, "line of " + f + "\n");
    }
    fs::create_directories(dir);
    if (depth >= 3) return;

    std::vector<std::string> dirs = kDirNames;
    std::shuffle(dirs.begin(), dirs.end(), rng);
    dirs.resize(pick(rng, 3));
    for (const auto& d : dirs) {
        grow(rng, dir / d, depth + 1);
    }
}

static FilterInputs random_rules(std::mt19937& rng) {
    static const std::vector<std::string> ignore_pool = {
        "*.log", "!keep.log", "build/", "/src", "docs/*.md", "d?/", "!d1/", "vendor/**", "**/lib/a.c", "*.py",
    };
    static const std::vector<std::string> file_pool = {"*.md", "f2.*", "/notes", "src/*.c"};
    static const std::vector<std::string> dir_pool = {"d2", "lib/", "/vendor", "src/docs"};
    static const std::vector<std::string> include_pool = {"**/*.c", "*.txt", "d1/", "docs", "/main.cpp"};

    auto sample = [&](const std::vector<std::string>& pool, size_t max) {
        std::vector<std::string> out;
        size_t n = pick(rng, max + 1);
        for (size_t i = 0; i < n; ++i) out.push_back(pool[pick(rng, pool.size())]);
        return out;
    };

    FilterInputs in;
    in.ignore_patterns = sample(ignore_pool, 4);
    in.exclude_files = sample(file_pool, 2);
    in.exclude_dirs = sample(dir_pool, 2);
    if (pick(rng, 3) == 0) {
        in.includes = sample(include_pool, 2);
    }
    return in;
}

static std::vector<std::string> files_on_disk(const fs::path& root) {
    std::vector<std::string> out;
    for (const auto& e : fs::recursive_directory_iterator(root)) {
        if (e.is_regular_file()) out.push_back(fs::relative(e.path(), root).generic_string());
    }
    return out;
}

static std::vector<std::string> file_paths(const Node& n) {
    std::vector<std::string> out;
    std::vector<const Node*> stack{&n};
    while (!stack.empty()) {
        const Node* cur = stack.back();
        stack.pop_back();
        if (!cur->is_dir()) { out.push_back(cur->rel_path); continue; }
        for (auto it = cur->children.rbegin(); it != cur->children.rend(); ++it) stack.push_back(&*it);
    }
    return out;
}

static void dir_paths(const Node& n, std::vector<std::string>& out) {
    for (const auto& c : n.children) {
        if (!c.is_dir()) continue;
        out.push_back(c.rel_path);
        dir_paths(c, out);
    }
}

// Rebuilds the leaf paths of a diagram from its indentation.
static std::vector<std::string> diagram_leaves(const std::string& diagram) {
    static const std::string pipe = "\xe2\x94\x82   ";
    static const std::string blank = "    ";
    static const size_t connector = std::string("\xe2\x94\x9c\xe2\x94\x80\xe2\x94\x80 ").size();

    std::vector<std::string> leaves;
    std::vector<std::string> dirs;
    size_t start = 0;
    while (start < diagram.size()) {
        size_t end = diagram.find('\n', start);
        if (end == std::string::npos) end = diagram.size();
        std::string line = diagram.substr(start, end - start);
        start = end + 1;
        if (line.empty()) continue;

        size_t pos = 0, depth = 0;
        for (;;) {
            if (line.compare(pos, pipe.size(), pipe) == 0) pos += pipe.size();
            else if (line.compare(pos, blank.size(), blank) == 0) pos += blank.size();
            else break;
            ++depth;
        }
        std::string name = line.substr(pos + connector);
        dirs.resize(depth);
        std::string prefix;
        for (const auto& d : dirs) prefix += d + "/";
        if (!name.empty() && name.back() == '/') {
            dirs.push_back(name.substr(0, name.size() - 1));
        } else {
            leaves.push_back(prefix + name);
        }
    }
    return leaves;
}

static std::vector<std::string> file_headers(const std::string& contents) {
    static const std::string tag = "# File: ";
    std::vector<std::string> out;
    size_t start = 0;
    while (start < contents.size()) {
        size_t end = contents.find('\n', start);
        if (end == std::string::npos) end = contents.size();
        if (contents.compare(start, tag.size(), tag) == 0) {
            out.push_back(contents.substr(start + tag.size(), end - start - tag.size()));
        }
        start = end + 1;
    }
    return out;
}

TEST_CASE("Random trees: builder keeps exactly what the matcher admits") {
    auto seed = GENERATE(range(1, 41));
    std::mt19937 rng(static_cast<std::mt19937::result_type>(seed));
    INFO("seed " << seed);

    auto root = make_tmpdir("g2t_prop_");
    grow(rng, root, 0);
    auto in = random_rules(rng);
    auto cfg = make_filter_config(in);

    Node tree = build_tree(root, cfg);
    auto kept = file_paths(tree);
    std::sort(kept.begin(), kept.end());

    PathMatcher matcher(cfg);
    std::vector<std::string> expected;
    for (const auto& rel : files_on_disk(root)) {
        if (matcher.decide(rel, false) == Decision::Include) expected.push_back(rel);
    }
    std::sort(expected.begin(), expected.end());
    REQUIRE(kept == expected);

    // nothing survives below a pruned directory
    for (const auto& rel : kept) {
        for (size_t pos = rel.find('/'); pos != std::string::npos; pos = rel.find('/', pos + 1)) {
            REQUIRE(matcher.decide(rel.substr(0, pos), true) == Decision::Include);
        }
    }
    std::vector<std::string> dirs;
    dir_paths(tree, dirs);
    for (const auto& d : dirs) {
        REQUIRE(matcher.decide(d, true) == Decision::Include);
    }

    fs::remove_all(root);
}

TEST_CASE("Random trees: diagram leaves match the file headers") {
    auto seed = GENERATE(range(1, 41));
    std::mt19937 rng(static_cast<std::mt19937::result_type>(seed));
    INFO("seed " << seed);

    auto root = make_tmpdir("g2t_prop_");
    grow(rng, root, 0);
    auto cfg = make_filter_config(random_rules(rng));
    Node tree = build_tree(root, cfg);

    auto text = render(tree);
    if (tree.file_count() == 0) {
        REQUIRE(text == std::string(kNoFilesMessage) + "\n\n");
        fs::remove_all(root);
        return;
    }

    auto diagram = render_tree(tree);
    REQUIRE(text.compare(0, diagram.size(), diagram) == 0);
    auto leaves = diagram_leaves(diagram);
    auto headers = file_headers(text.substr(diagram.size()));
    REQUIRE(leaves == headers);
    REQUIRE(headers == file_paths(tree));

    fs::remove_all(root);
}
