// storage.hpp - data directory paths and small file helpers for the JSON stores
#pragma once
#include <string>

namespace storage {

#ifdef PLATFORM_3DS
static constexpr const char* DATA_DIR = "sdmc:/gridarcade";
#else
static constexpr const char* DATA_DIR = "data";
#endif

// DATA_DIR + "/" + name
std::string data_path(const char* name);

// Create every missing directory leading up to the file in path. Returns false if one could not be created.
bool ensure_parent_dir(const std::string &path);

// Whole-file read. Returns false if the file cannot be opened.
bool read_file(const std::string &path, std::string &out);

// Replace the file content. Creates parent directories first.
bool write_file(const std::string &path, const std::string &content);

} // namespace storage
