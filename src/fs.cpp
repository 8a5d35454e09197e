#include "fs.h"
#include "logger.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/stat.h>

#ifdef _WIN32
    #include <direct.h>
    #include <io.h>
    #define stat _stat
    #define mkdir(path, mode) _mkdir(path)
    #define access _access
    #define F_OK 0
#else
    #include <unistd.h>
#endif

#define LOG_FS_ERROR(message) LOG_ERROR("fs", message)

namespace lanmeet {

bool file_exists(const char* path) {
    if (!path) return false;
    return access(path, F_OK) == 0;
}

bool directory_exists(const char* path) {
    if (!path) return false;

    struct stat st;
    if (stat(path, &st) != 0) {
        return false;
    }
    return (st.st_mode & S_IFDIR) != 0;
}

bool create_file_binary(const char* path, const void* data, size_t size) {
    if (!path) return false;

    FILE* file = fopen(path, "wb");
    if (!file) {
        LOG_FS_ERROR("Failed to create file: " << path << " (" << strerror(errno) << ")");
        return false;
    }

    size_t written = 0;
    if (data && size > 0) {
        written = fwrite(data, 1, size, file);
    }
    bool closed = fclose(file) == 0;

    if (written != size || !closed) {
        LOG_FS_ERROR("Failed to write " << size << " bytes to " << path);
        return false;
    }
    return true;
}

bool create_directories(const char* path) {
    if (!path || !*path) return false;
    if (directory_exists(path)) return true;

    std::string current(path);
    for (size_t i = 1; i <= current.size(); ++i) {
        if (i != current.size() && current[i] != '/' && current[i] != '\\') {
            continue;
        }
        std::string prefix = current.substr(0, i);
        if (directory_exists(prefix.c_str())) {
            continue;
        }
        if (mkdir(prefix.c_str(), 0755) != 0 && errno != EEXIST) {
            LOG_FS_ERROR("Failed to create directory: " << prefix << " (" << strerror(errno) << ")");
            return false;
        }
    }
    return true;
}

int64_t get_file_size(const char* path) {
    if (!path) return -1;

    struct stat st;
    if (stat(path, &st) != 0) {
        return -1;
    }
    return static_cast<int64_t>(st.st_size);
}

bool delete_file(const char* path) {
    if (!path) return false;

    if (remove(path) != 0) {
        LOG_FS_ERROR("Failed to delete file: " << path);
        return false;
    }
    return true;
}

std::string get_filename_from_path(const char* path) {
    if (!path) return "";

    std::string p(path);
    size_t pos = p.find_last_of("/\\");
    if (pos == std::string::npos) {
        return p;
    }
    return p.substr(pos + 1);
}

std::string combine_paths(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty()) return base;

    char last = base[base.size() - 1];
    if (last == '/' || last == '\\') {
        return base + relative;
    }
    return base + "/" + relative;
}

} // namespace lanmeet
