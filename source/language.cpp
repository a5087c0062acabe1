#include <git2text/language.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <iterator>

namespace git2text {

namespace {

struct Tag {
    const char* key;
    const char* language;
};

constexpr Tag kFileNames[] = {
    {"CMakeLists.txt", "cmake"},
    {"Makefile", "makefile"},
    {"GNUmakefile", "makefile"},
    {"Dockerfile", "dockerfile"},
};

constexpr Tag kExtensions[] = {
    {"bash", "bash"},     {"c", "c"},           {"cc", "cpp"},      {"cmake", "cmake"},
    {"cpp", "cpp"},       {"cs", "csharp"},     {"css", "css"},     {"cxx", "cpp"},
    {"dart", "dart"},     {"go", "go"},         {"h", "c"},         {"hh", "cpp"},
    {"hpp", "cpp"},       {"html", "html"},     {"hxx", "cpp"},     {"ini", "ini"},
    {"java", "java"},     {"js", "javascript"}, {"json", "json"},   {"jsx", "jsx"},
    {"kt", "kotlin"},     {"lua", "lua"},       {"md", "markdown"}, {"php", "php"},
    {"pl", "perl"},       {"proto", "protobuf"},{"py", "python"},   {"r", "r"},
    {"rb", "ruby"},       {"rs", "rust"},       {"scala", "scala"}, {"scss", "scss"},
    {"sh", "bash"},       {"sql", "sql"},       {"swift", "swift"}, {"toml", "toml"},
    {"ts", "typescript"}, {"tsx", "tsx"},       {"vue", "vue"},     {"xml", "xml"},
    {"yaml", "yaml"},     {"yml", "yaml"},      {"zsh", "bash"},
};

} // namespace

std::string language_for(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);

    for (const auto& t : kFileNames) {
        if (name == t.key) return t.language;
    }

    auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) return "text";
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = std::lower_bound(std::begin(kExtensions), std::end(kExtensions), ext,
                               [](const Tag& t, const std::string& k) { return std::strcmp(t.key, k.c_str()) < 0; });
    if (it != std::end(kExtensions) && ext == it->key) return it->language;
    return "text";
}

} // namespace git2text
