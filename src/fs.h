#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace lanmeet {

bool file_exists(const char* path);
bool directory_exists(const char* path);

/**
 * Write a whole buffer to a file, replacing any previous content
 * @return true if every byte was written
 */
bool create_file_binary(const char* path, const void* data, size_t size);

// Create a directory and any missing parents; succeeds if it already exists
bool create_directories(const char* path);

// Size in bytes, or -1 if the path cannot be stat'ed
int64_t get_file_size(const char* path);

bool delete_file(const char* path);

// Last path component ("a/b/c.txt" -> "c.txt"), accepting '/' and '\\'
std::string get_filename_from_path(const char* path);

std::string combine_paths(const std::string& base, const std::string& relative);

// C++ convenience wrappers
inline bool file_exists(const std::string& path) { return file_exists(path.c_str()); }
inline bool create_file_binary(const std::string& path, const void* data, size_t size) {
    return create_file_binary(path.c_str(), data, size);
}
inline bool create_directories(const std::string& path) { return create_directories(path.c_str()); }
inline int64_t get_file_size(const std::string& path) { return get_file_size(path.c_str()); }
inline bool delete_file(const std::string& path) { return delete_file(path.c_str()); }
inline std::string get_filename_from_path(const std::string& path) { return get_filename_from_path(path.c_str()); }

} // namespace lanmeet
