#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <git2text/remote.hpp>
#include <git2text/errors.hpp>
#include <git2text/util.hpp>

#include <filesystem>
#include <fstream>
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

static bool git_available() {
    return run_command({"git", "--version"}).exit_code == 0;
}

TEST_CASE("Git URL detection") {
    REQUIRE(is_git_url("https://github.com/user/repo"));
    REQUIRE(is_git_url("http://example.com/r.git"));
    REQUIRE(is_git_url("git@github.com:user/repo.git"));
    REQUIRE(is_git_url("ssh://git@host/repo"));
    REQUIRE(is_git_url("git://host/repo"));
    REQUIRE(is_git_url("file:///srv/repo"));
    REQUIRE(is_git_url("../mirror.git"));
    REQUIRE_FALSE(is_git_url("."));
    REQUIRE_FALSE(is_git_url("src/project"));
    REQUIRE_FALSE(is_git_url(".git"));
}

TEST_CASE("Work directory is derived from the URL") {
    auto a = work_dir_for("https://example.com/a.git");
    auto b = work_dir_for("https://example.com/b.git");
    REQUIRE(a == work_dir_for("https://example.com/a.git"));
    REQUIRE(a != b);
    REQUIRE(a.parent_path() == fs::temp_directory_path());
    REQUIRE(a.filename().string().rfind("git2text_" + xxh3_hex("https://example.com/a.git"), 0) == 0);
}

TEST_CASE("Clone failure is a configuration error") {
    if (!git_available()) return;
    auto dir = make_tmpdir("g2t_remote_");
    REQUIRE_THROWS_AS(Checkout::clone("file://" + (dir / "no-such-repo").string()), ConfigError);
    REQUIRE_FALSE(fs::exists(work_dir_for("file://" + (dir / "no-such-repo").string())));
    fs::remove_all(dir);
}

TEST_CASE("Local clone is checked out and removed afterwards") {
    if (!git_available()) return;
    auto dir = make_tmpdir("g2t_remote_");
    auto src = dir / "origin";
    fs::create_directories(src);
    {
        std::ofstream o(src / "hello.txt");
        o << "hello\n";
    }
    auto git = [&](std::vector<std::string> args) {
        args.insert(args.begin(), "git");
        auto r = run_command(args, src);
        REQUIRE(r.exit_code == 0);
    };
    git({"init", "-q"});
    git({"add", "hello.txt"});
    git({"-c", "user.name=t", "-c", "user.email=t@example.com", "commit", "-q", "-m", "init"});

    std::string url = "file://" + src.string();
    fs::path root;
    {
        auto co = Checkout::clone(url);
        root = co.root();
        REQUIRE(fs::exists(root / "hello.txt"));

        auto moved = std::move(co);
        REQUIRE(moved.root() == root);
        REQUIRE(co.root().empty());
    }
    REQUIRE_FALSE(fs::exists(root));
    fs::remove_all(dir);
}
