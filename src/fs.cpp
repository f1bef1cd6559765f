#include "fs.h"
#include "logger.h"
#include <cstring>
#include <cstdlib>
#include <fcntl.h>
#include <sys/stat.h>

#ifdef _WIN32
    #include <windows.h>
    #include <direct.h>
    #include <io.h>
    #define stat _stat
    #define access _access
    #define F_OK 0
#else
    #include <unistd.h>
    #include <errno.h>
#endif

#define LOG_FS_DEBUG(message) LOG_DEBUG("fs", message)
#define LOG_FS_ERROR(message) LOG_ERROR("fs", message)

namespace peerdrop {

bool file_exists(const char* path) {
    if (!path) return false;
    return access(path, F_OK) == 0;
}

bool directory_exists(const char* path) {
    if (!path) return false;

    struct stat st;
    if (stat(path, &st) == 0) {
        return (st.st_mode & S_IFDIR) != 0;
    }
    return false;
}

bool create_file(const char* path, const char* content) {
    if (!path) return false;
    return create_file_binary(path, content, content ? strlen(content) : 0);
}

bool create_file_binary(const char* path, const void* data, size_t size) {
    if (!path) return false;

    FILE* file = fopen(path, "wb");
    if (!file) {
        LOG_FS_ERROR("Failed to create file: " << path);
        return false;
    }

    size_t written = 0;
    if (data && size > 0) {
        written = fwrite(data, 1, size, file);
    }
    bool closed = fclose(file) == 0;

    if (written != size || !closed) {
        LOG_FS_ERROR("Failed to write complete data to file: " << path);
        return false;
    }
    return true;
}

FILE* create_file_exclusive(const char* path) {
    if (!path) return nullptr;

#ifdef _WIN32
    int fd = _open(path, _O_CREAT | _O_EXCL | _O_WRONLY | _O_BINARY, _S_IREAD | _S_IWRITE);
    if (fd < 0) {
        return nullptr;
    }
    FILE* file = _fdopen(fd, "wb");
    if (!file) {
        _close(fd);
    }
    return file;
#else
    int fd = open(path, O_CREAT | O_EXCL | O_WRONLY, 0644);
    if (fd < 0) {
        if (errno != EEXIST) {
            LOG_FS_ERROR("Failed to create file " << path << ": " << strerror(errno));
        }
        return nullptr;
    }
    FILE* file = fdopen(fd, "wb");
    if (!file) {
        LOG_FS_ERROR("fdopen failed for " << path << ": " << strerror(errno));
        close(fd);
    }
    return file;
#endif
}

char* read_file_text(const char* path, size_t* size_out) {
    if (!path) return nullptr;

    FILE* file = fopen(path, "rb");
    if (!file) {
        LOG_FS_ERROR("Failed to open file for reading: " << path);
        return nullptr;
    }

    fseek(file, 0, SEEK_END);
    long file_size = ftell(file);
    fseek(file, 0, SEEK_SET);

    if (file_size < 0) {
        LOG_FS_ERROR("Failed to get file size: " << path);
        fclose(file);
        return nullptr;
    }

    // +1 for null terminator
    char* buffer = (char*)malloc(file_size + 1);
    if (!buffer) {
        LOG_FS_ERROR("Failed to allocate memory for file: " << path);
        fclose(file);
        return nullptr;
    }

    size_t bytes_read = fread(buffer, 1, file_size, file);
    fclose(file);

    buffer[bytes_read] = '\0';
    if (size_out) {
        *size_out = bytes_read;
    }
    return buffer;
}

int64_t read_file_chunk(const char* path, uint64_t offset, void* buffer, size_t size) {
    if (!path || (!buffer && size > 0)) return -1;

    FILE* file = fopen(path, "rb");
    if (!file) {
        LOG_FS_ERROR("Failed to open file for chunk read: " << path);
        return -1;
    }

#ifdef _WIN32
    int seek_result = _fseeki64(file, static_cast<__int64>(offset), SEEK_SET);
#else
    int seek_result = fseeko(file, static_cast<off_t>(offset), SEEK_SET);
#endif
    if (seek_result != 0) {
        LOG_FS_ERROR("Failed to seek to offset " << offset << " in " << path);
        fclose(file);
        return -1;
    }

    size_t bytes_read = fread(buffer, 1, size, file);
    bool failed = ferror(file) != 0;
    fclose(file);

    if (failed) {
        LOG_FS_ERROR("Read error at offset " << offset << " in " << path);
        return -1;
    }
    return static_cast<int64_t>(bytes_read);
}

bool create_directory(const char* path) {
    if (!path) return false;

    if (directory_exists(path)) {
        return true;
    }

#ifdef _WIN32
    return _mkdir(path) == 0;
#else
    return mkdir(path, 0755) == 0 || errno == EEXIST;
#endif
}

bool create_directories(const char* path) {
    if (!path || !*path) return false;

    if (directory_exists(path)) {
        return true;
    }

    std::string partial(path);
    for (size_t i = 1; i < partial.size(); i++) {
        if (partial[i] == '/' || partial[i] == '\\') {
            char saved = partial[i];
            partial[i] = '\0';
            if (!create_directory(partial.c_str())) {
                LOG_FS_ERROR("Failed to create directory: " << partial.c_str());
                return false;
            }
            partial[i] = saved;
        }
    }

    if (!create_directory(partial.c_str())) {
        LOG_FS_ERROR("Failed to create directory: " << path);
        return false;
    }
    return true;
}

int64_t get_file_size(const char* path) {
    if (!path) return -1;

    struct stat st;
    if (stat(path, &st) == 0) {
        return st.st_size;
    }
    return -1;
}

bool is_file(const char* path) {
    if (!path) return false;

    struct stat st;
    if (stat(path, &st) == 0) {
        return (st.st_mode & S_IFREG) != 0;
    }
    return false;
}

bool delete_file(const char* path) {
    if (!path) return false;
    return remove(path) == 0;
}

bool delete_directory(const char* path) {
    if (!path) return false;

#ifdef _WIN32
    return RemoveDirectoryA(path) != 0;
#else
    return rmdir(path) == 0;
#endif
}

bool rename_file(const char* old_path, const char* new_path) {
    if (!old_path || !new_path) return false;

    if (rename(old_path, new_path) != 0) {
        LOG_FS_ERROR("Failed to rename " << old_path << " to " << new_path);
        return false;
    }
    return true;
}

bool sync_file(FILE* file) {
    if (!file) return false;

    if (fflush(file) != 0) {
        return false;
    }
#ifdef _WIN32
    return _commit(_fileno(file)) == 0;
#else
    return fsync(fileno(file)) == 0;
#endif
}

std::string get_filename_from_path(const char* path) {
    if (!path) return "";

    std::string p(path);
    while (!p.empty() && (p.back() == '/' || p.back() == '\\')) {
        p.pop_back();
    }
    size_t pos = p.find_last_of("/\\");
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string get_file_extension(const char* path) {
    std::string name = get_filename_from_path(path);

    // Leading dots belong to the stem (".bashrc", "..x")
    size_t first = name.find_first_not_of('.');
    if (first == std::string::npos) {
        return "";
    }
    size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot < first) {
        return "";
    }
    return name.substr(dot);
}

std::string combine_paths(const std::string& base, const std::string& relative) {
    if (base.empty()) return relative;
    if (relative.empty()) return base;

    char last = base.back();
    if (last == '/' || last == '\\') {
        return base + relative;
    }
#ifdef _WIN32
    return base + "\\" + relative;
#else
    return base + "/" + relative;
#endif
}

std::string sanitize_file_name(const std::string& name) {
    std::string base = get_filename_from_path(name);
    if (base.empty() || base == "." || base == "..") {
        LOG_FS_DEBUG("Replacing unusable file name '" << name << "'");
        return "received_file";
    }
    return base;
}

std::string make_numbered_file_name(const std::string& file_name, int counter) {
    std::string ext = get_file_extension(file_name);
    std::string stem = file_name.substr(0, file_name.size() - ext.size());
    return stem + " (" + std::to_string(counter) + ")" + ext;
}

void free_file_buffer(void* buffer) {
    if (buffer) {
        free(buffer);
    }
}

} // namespace peerdrop
