#pragma once

#include <string>

namespace aao {

// Ensure a directory exists, creating parents as needed.
bool ensureDirectory(const std::string& path);
bool fileExists(const std::string& path);
// Remove a file or directory tree; missing paths are not an error.
bool removePath(const std::string& path, std::string& err);
// Write `bytes` to `path`, creating or truncating it.
bool writeFile(const std::string& path, const std::string& bytes, std::string& err);
bool readFile(const std::string& path, std::string& out, std::string& err);
// rename(2) wrapper that replaces an existing destination when `replace` is set.
bool movePath(const std::string& from, const std::string& to, bool replace, std::string& err);
std::string joinPath(const std::string& a, const std::string& b);

} // namespace aao
