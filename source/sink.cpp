#include <git2text/sink.hpp>
#include <git2text/util.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace git2text {

FileSink::FileSink(fs::path path) : path_(std::move(path)) {}

void FileSink::write(const std::string& text) {
    if (path_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw std::runtime_error(fmt::format("cannot create directory {}: {}",
                                                 path_.parent_path().string(), ec.message()));
        }
    }
    std::ofstream out(path_, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("open: " + path_.string());
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.close();
    if (!out) throw std::runtime_error("write: " + path_.string());
}

std::string FileSink::describe() const {
    return path_.string();
}

void StdoutSink::write(const std::string& text) {
    if (std::fwrite(text.data(), 1, text.size(), stdout) != text.size() || std::fflush(stdout) != 0) {
        throw std::runtime_error("write: stdout");
    }
}

ClipboardSink::ClipboardSink()
: tools_{{"wl-copy"},
         {"xclip", "-selection", "clipboard", "-in"},
         {"xsel", "--clipboard", "--input"},
         {"pbcopy"}} {}

ClipboardSink::ClipboardSink(std::vector<std::vector<std::string>> tools) : tools_(std::move(tools)) {}

void ClipboardSink::write(const std::string& text) {
    for (const auto& tool : tools_) {
        // clipboard tools may leave a child serving the selection
        auto r = run_command(tool, {}, &text, CmdOutput::Detach);
        if (r.exit_code == 127) continue;
        if (r.exit_code != 0) {
            throw std::runtime_error(fmt::format("{} failed rc={} err={}", tool.front(), r.exit_code, trim(r.err)));
        }
        spdlog::debug("copied {} bytes with {}", text.size(), tool.front());
        return;
    }
    throw std::runtime_error("clipboard requires one of wl-copy, xclip, xsel or pbcopy");
}

TeeSink::TeeSink(std::vector<std::unique_ptr<OutputSink>> sinks) : sinks_(std::move(sinks)) {}

void TeeSink::write(const std::string& text) {
    for (auto& s : sinks_) s->write(text);
}

std::string TeeSink::describe() const {
    std::string out;
    for (const auto& s : sinks_) {
        if (!out.empty()) out += " + ";
        out += s->describe();
    }
    return out;
}

} // namespace git2text
