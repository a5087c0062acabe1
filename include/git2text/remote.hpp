#pragma once
#include <filesystem>
#include <string>

namespace git2text {

bool is_git_url(const std::string& s);

// Shallow clone in a temporary work directory, removed on destruction.
class Checkout {
public:
    // Throws ConfigError if git fails.
    static Checkout clone(const std::string& url);

    Checkout(Checkout&& other) noexcept;
    Checkout(const Checkout&) = delete;
    Checkout& operator=(const Checkout&) = delete;
    Checkout& operator=(Checkout&&) = delete;
    ~Checkout();

    const std::filesystem::path& root() const { return root_; }

private:
    explicit Checkout(std::filesystem::path root) : root_(std::move(root)) {}

    std::filesystem::path root_;
};

// "git2text_<xxh3 of url>_<pid>" under the system temp directory.
std::filesystem::path work_dir_for(const std::string& url);

} // namespace git2text
