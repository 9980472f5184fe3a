#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/fs.h — Small synchronous file helpers
// ═══════════════════════════════════════════════════════════════════

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace shorturl::fs {

inline std::string readFileSync(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("ENOENT: no such file or directory, open '" + path + "'");
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

inline void writeFileSync(const std::string& path, const std::string& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("EACCES: permission denied, open '" + path + "'");
    }
    file << data;
    file.flush();
    if (!file) {
        throw std::runtime_error("EIO: write failed, '" + path + "'");
    }
}

// Write to a sibling temp file, then rename over the target
inline void writeFileAtomicSync(const std::string& path, const std::string& data) {
    const std::string tmp = path + ".tmp";
    writeFileSync(tmp, data);
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("rename failed, '" + path + "'");
    }
}

inline bool existsSync(const std::string& path) {
    return std::filesystem::exists(path);
}

// Creates missing parent directories of a file path
inline void ensureParentDir(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
}

} // namespace shorturl::fs
