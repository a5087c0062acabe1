#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace git2text {

// Destination of the rendered text. write() throws std::runtime_error on failure.
class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual void write(const std::string& text) = 0;
    virtual std::string describe() const = 0;
};

class FileSink : public OutputSink {
public:
    explicit FileSink(std::filesystem::path path);
    void write(const std::string& text) override;
    std::string describe() const override;
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

class StdoutSink : public OutputSink {
public:
    void write(const std::string& text) override;
    std::string describe() const override { return "stdout"; }
};

// Pipes the text into the first clipboard tool found.
class ClipboardSink : public OutputSink {
public:
    ClipboardSink();
    explicit ClipboardSink(std::vector<std::vector<std::string>> tools);
    void write(const std::string& text) override;
    std::string describe() const override { return "clipboard"; }

private:
    std::vector<std::vector<std::string>> tools_;
};

class StringSink : public OutputSink {
public:
    void write(const std::string& text) override { text_ += text; }
    std::string describe() const override { return "memory"; }
    const std::string& text() const { return text_; }

private:
    std::string text_;
};

class TeeSink : public OutputSink {
public:
    explicit TeeSink(std::vector<std::unique_ptr<OutputSink>> sinks);
    void write(const std::string& text) override;
    std::string describe() const override;

private:
    std::vector<std::unique_ptr<OutputSink>> sinks_;
};

} // namespace git2text
