#include <git2text/remote.hpp>
#include <git2text/errors.hpp>
#include <git2text/util.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <unistd.h>

namespace fs = std::filesystem;

namespace git2text {

static bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool is_git_url(const std::string& s) {
    if (starts_with(s, "http://") || starts_with(s, "https://") || starts_with(s, "git@") ||
        starts_with(s, "ssh://") || starts_with(s, "git://") || starts_with(s, "file://")) {
        return true;
    }
    return s.size() > 4 && s.compare(s.size() - 4, 4, ".git") == 0;
}

fs::path work_dir_for(const std::string& url) {
    return fs::temp_directory_path() / fmt::format("git2text_{}_{}", xxh3_hex(url), static_cast<long>(::getpid()));
}

Checkout Checkout::clone(const std::string& url) {
    fs::path dest = work_dir_for(url);
    std::error_code ec;
    fs::remove_all(dest, ec);

    spdlog::info("cloning {} into {}", url, dest.string());
    auto r = run_command({"git", "clone", "--depth", "1", "--quiet", url, dest.string()});
    if (r.exit_code != 0) {
        fs::remove_all(dest, ec);
        if (r.exit_code == 127) throw ConfigError("git executable not found in PATH");
        throw ConfigError(fmt::format("git clone failed for {}: {}", url, trim(r.err)));
    }
    return Checkout(dest);
}

Checkout::Checkout(Checkout&& other) noexcept : root_(std::move(other.root_)) {
    other.root_.clear();
}

Checkout::~Checkout() {
    if (root_.empty()) return;
    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) spdlog::warn("failed to remove work directory {}: {}", root_.string(), ec.message());
}

} // namespace git2text
