// storage.cpp - directory creation and whole-file IO (sdmc: on 3DS, working dir elsewhere)
#include <cerrno>
#include <cstdio>
#include <sys/stat.h>
#include "storage.hpp"
#include "hardware.hpp"

namespace storage {

std::string data_path(const char* name) {
    return std::string(DATA_DIR) + "/" + name;
}

bool ensure_parent_dir(const std::string &path) {
    size_t slash = path.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return true;
    std::string dir = path.substr(0, slash);
    // Walk each prefix; fopen won't create directories on 3DS
    for (size_t i = 1; i <= dir.size(); ++i) {
        if (i != dir.size() && dir[i] != '/') continue;
        std::string prefix = dir.substr(0, i);
        if (prefix.empty() || prefix.back() == ':') continue;
        if (mkdir(prefix.c_str(), 0777) != 0 && errno != EEXIST) {
            char buf[96];
            std::snprintf(buf, sizeof buf, "mkdir failed: %s\n", prefix.c_str());
            hw_log(buf);
            return false;
        }
    }
    return true;
}

bool read_file(const std::string &path, std::string &out) {
    out.clear();
    FILE* f = fopen(path.c_str(), "rb");
    if (!f) return false;
    char chunk[512];
    size_t got;
    while ((got = fread(chunk, 1, sizeof chunk, f)) > 0) out.append(chunk, got);
    fclose(f);
    return true;
}

bool write_file(const std::string &path, const std::string &content) {
    if (!ensure_parent_dir(path)) return false;
    FILE* f = fopen(path.c_str(), "wb");
    if (!f) {
        char buf[96];
        std::snprintf(buf, sizeof buf, "open for write failed: %s\n", path.c_str());
        hw_log(buf);
        return false;
    }
    size_t wrote = fwrite(content.data(), 1, content.size(), f);
    fclose(f);
    if (wrote != content.size()) {
        char buf[96];
        std::snprintf(buf, sizeof buf, "short write: %s\n", path.c_str());
        hw_log(buf);
        return false;
    }
    return true;
}

} // namespace storage
