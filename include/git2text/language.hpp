#pragma once
#include <string>

namespace git2text {

// Fence tag for a file, from its name or its lower-cased extension. "text" if unknown.
std::string language_for(const std::string& path);

} // namespace git2text
