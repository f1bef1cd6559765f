#pragma once

#include <string>
#include <cstdint>
#include <cstdio>

namespace peerdrop {

// File/Directory existence check
bool file_exists(const char* path);
bool directory_exists(const char* path);

// File creation and writing
bool create_file(const char* path, const char* content);
bool create_file_binary(const char* path, const void* data, size_t size);

/**
 * Create a file only if nothing exists at the path yet (O_EXCL semantics)
 * @param path File to create
 * @return Open binary write handle, or nullptr if the file exists or cannot be created
 */
FILE* create_file_exclusive(const char* path);

// File reading
char* read_file_text(const char* path, size_t* size_out = nullptr);

/**
 * Read up to `size` bytes starting at `offset`
 * @return Number of bytes read, or -1 on error
 */
int64_t read_file_chunk(const char* path, uint64_t offset, void* buffer, size_t size);

// Directory operations
bool create_directory(const char* path);
bool create_directories(const char* path); // Create parent directories if needed

// File information
int64_t get_file_size(const char* path);
bool is_file(const char* path);

// File operations
bool delete_file(const char* path);
bool delete_directory(const char* path);
bool rename_file(const char* old_path, const char* new_path);

// Flush stdio buffers and push the file contents to stable storage
bool sync_file(FILE* file);

// Path utilities
std::string get_filename_from_path(const char* path);
std::string get_file_extension(const char* path);   // ".png" for "photo.png", "" for ".bashrc"
std::string combine_paths(const std::string& base, const std::string& relative);

/**
 * Reduce a peer-supplied name to a bare file name
 * Directory components are dropped; empty, "." and ".." become "received_file".
 */
std::string sanitize_file_name(const std::string& name);

/**
 * "<stem> (<n>)<ext>" for the n-th collision of `file_name`
 */
std::string make_numbered_file_name(const std::string& file_name, int counter);

// Utility functions
void free_file_buffer(void* buffer); // Free memory allocated by read functions

// C++ convenience wrappers
inline bool file_exists(const std::string& path) { return file_exists(path.c_str()); }
inline bool directory_exists(const std::string& path) { return directory_exists(path.c_str()); }
inline bool create_file(const std::string& path, const std::string& content) {
    return create_file(path.c_str(), content.c_str());
}
inline bool create_directories(const std::string& path) { return create_directories(path.c_str()); }
inline std::string read_file_text_cpp(const std::string& path) {
    size_t size;
    char* content = read_file_text(path.c_str(), &size);
    if (!content) return "";
    std::string result(content, size);
    free_file_buffer(content);
    return result;
}
inline int64_t get_file_size(const std::string& path) { return get_file_size(path.c_str()); }
inline bool is_file(const std::string& path) { return is_file(path.c_str()); }
inline bool delete_file(const std::string& path) { return delete_file(path.c_str()); }
inline std::string get_filename_from_path(const std::string& path) { return get_filename_from_path(path.c_str()); }
inline std::string get_file_extension(const std::string& path) { return get_file_extension(path.c_str()); }
inline int64_t read_file_chunk(const std::string& path, uint64_t offset, void* buffer, size_t size) {
    return read_file_chunk(path.c_str(), offset, buffer, size);
}
inline bool rename_file(const std::string& old_path, const std::string& new_path) {
    return rename_file(old_path.c_str(), new_path.c_str());
}
inline FILE* create_file_exclusive(const std::string& path) { return create_file_exclusive(path.c_str()); }

} // namespace peerdrop
