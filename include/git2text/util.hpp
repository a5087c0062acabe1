#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace git2text {

struct CmdResult {
    int exit_code{};
    std::string out;
    std::string err;
};

// Capture: stdout and stderr are read through pipes until EOF.
// Detach: stdout goes to /dev/null and stderr to an unlinked temp file read
// after exit, so a background child left holding them cannot block the call.
enum class CmdOutput {
    Capture,
    Detach,
};

// fork/exec argv[0] from PATH. input, when non-null, is written to the child's stdin.
// exit_code 127 means the program could not be executed.
CmdResult run_command(const std::vector<std::string>& argv,
                      const std::filesystem::path& cwd = {},
                      const std::string* input = nullptr,
                      CmdOutput output = CmdOutput::Capture);

std::string xxh3_hex(std::string_view data);

std::string trim(const std::string& s);

} // namespace git2text
