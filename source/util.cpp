#include <git2text/util.hpp>

#include <xxhash.h>
#include <fmt/format.h>

#include <array>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <vector>

#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>

namespace git2text {

static int safe_pipe(int fds[2]){
    return pipe2(fds, O_CLOEXEC);
}

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

static void write_all(int fd, const std::string& data) {
    struct sigaction ign{}, old{};
    ign.sa_handler = SIG_IGN;
    sigaction(SIGPIPE, &ign, &old);
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n > 0) { off += static_cast<size_t>(n); continue; }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    sigaction(SIGPIPE, &old, nullptr);
}

static std::string read_all(int fd) {
    std::string s;
    std::array<char, 4096> buf{};
    for (;;) {
        ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n > 0) { s.append(buf.data(), static_cast<size_t>(n)); }
        else if (n < 0 && errno == EINTR) continue;
        else break;
    }
    return s;
}

CmdResult run_command(const std::vector<std::string>& args,
                      const std::filesystem::path& cwd,
                      const std::string* input,
                      CmdOutput output)
{
    CmdResult res{};
    if (args.empty()) {
        res.exit_code = -1;
        res.err = "empty argv";
        return res;
    }
    const bool capture = output == CmdOutput::Capture;

    int in_pipe[2] = {-1, -1}, out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1};
    int null_fd = -1;
    std::FILE* err_file = nullptr;
    auto cleanup = [&] {
        close_pair(in_pipe); close_pair(out_pipe); close_pair(err_pipe);
        if (null_fd >= 0) close(null_fd);
        if (err_file) std::fclose(err_file);
    };

    bool ok = safe_pipe(in_pipe) == 0;
    if (ok && capture) {
        ok = safe_pipe(out_pipe) == 0 && safe_pipe(err_pipe) == 0;
    } else if (ok) {
        null_fd = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
        err_file = std::tmpfile();
        ok = null_fd >= 0 && err_file != nullptr;
    }
    if (!ok) {
        cleanup();
        res.exit_code = -1;
        res.err = capture ? "pipe failed" : "cannot redirect output";
        return res;
    }

    pid_t pid = fork();
    if (pid == -1) {
        cleanup();
        res.exit_code = -1;
        res.err = "fork failed";
        return res;
    }

    if (pid == 0) {
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        dup2(in_pipe[0], STDIN_FILENO);
        if (capture) {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
        } else {
            dup2(null_fd, STDOUT_FILENO);
            dup2(fileno(err_file), STDERR_FILENO);
        }

        std::vector<char*> argv_c;
        argv_c.reserve(args.size()+1);
        for (auto& s : args) argv_c.push_back(const_cast<char*>(s.c_str()));
        argv_c.push_back(nullptr);

        execvp(argv_c[0], argv_c.data());
        _exit(127);
    }

    close(in_pipe[0]);
    in_pipe[0] = -1;
    if (input) write_all(in_pipe[1], *input);
    close(in_pipe[1]);
    in_pipe[1] = -1;

    if (capture) {
        close(out_pipe[1]);
        close(err_pipe[1]);
        out_pipe[1] = err_pipe[1] = -1;
        res.out = read_all(out_pipe[0]);
        res.err = read_all(err_pipe[0]);
    }

    int status = 0;
    if (waitpid(pid, &status, 0) == -1) {
        cleanup();
        res.exit_code = -1;
        return res;
    }
    if (WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res.exit_code = 128 + WTERMSIG(status);
    else res.exit_code = -1;

    if (!capture) {
        int fd = fileno(err_file);
        if (::lseek(fd, 0, SEEK_SET) == 0) res.err = read_all(fd);
    }
    cleanup();
    return res;
}

std::string xxh3_hex(std::string_view data) {
    return fmt::format("{:016x}", static_cast<unsigned long long>(XXH3_64bits(data.data(), data.size())));
}

std::string trim(const std::string& s){
    size_t i=0, j=s.size();
    while (i<j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    while (j>i && std::isspace(static_cast<unsigned char>(s[j-1]))) --j;
    return s.substr(i, j-i);
}

} // namespace git2text
