#include "aao/filesystem.hpp"
#include "aao/logger.hpp"
#include "aao/raii.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>

namespace aao {

bool ensureDirectory(const std::string& path) {
    std::filesystem::path p(path);
    std::error_code ec;
    bool ok = std::filesystem::create_directories(p, ec) || std::filesystem::is_directory(p, ec);
    if (!ok) logWarn("Failed to ensure directory: " + path, "FS");
    return ok;
}

bool fileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::path(path), ec);
}

bool removePath(const std::string& path, std::string& err) {
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::path(path), ec);
    if (ec) {
        err = "Failed to remove " + path + ": " + ec.message();
        return false;
    }
    return true;
}

bool writeFile(const std::string& path, const std::string& bytes, std::string& err) {
    UniqueFile f(std::fopen(path.c_str(), "wb"));
    if (!f) {
        err = "Failed to open " + path + " for writing: " + std::strerror(errno);
        return false;
    }
    if (!bytes.empty() && std::fwrite(bytes.data(), 1, bytes.size(), f.f) != bytes.size()) {
        err = "Short write to " + path + ": " + std::strerror(errno);
        return false;
    }
    if (!f.close()) {
        err = "Failed to flush " + path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

bool readFile(const std::string& path, std::string& out, std::string& err) {
    UniqueFile f(std::fopen(path.c_str(), "rb"));
    if (!f) {
        err = "Failed to open " + path + ": " + std::strerror(errno);
        return false;
    }
    out.clear();
    char buf[8192];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f.f)) > 0) out.append(buf, n);
    if (std::ferror(f.f)) {
        err = "Failed to read " + path;
        return false;
    }
    return true;
}

bool movePath(const std::string& from, const std::string& to, bool replace, std::string& err) {
    std::error_code ec;
    std::filesystem::path dst(to);
    if (std::filesystem::exists(dst, ec)) {
        if (!replace) {
            err = "Output already exists: " + to;
            return false;
        }
        if (!removePath(to, err)) return false;
    }
    std::filesystem::rename(std::filesystem::path(from), dst, ec);
    if (ec) {
        err = "Failed to rename " + from + " -> " + to + ": " + ec.message();
        return false;
    }
    return true;
}

std::string joinPath(const std::string& a, const std::string& b) {
    return (std::filesystem::path(a) / b).string();
}

} // namespace aao
