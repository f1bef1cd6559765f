#pragma once

#include <cstdint>
#include <cstdio>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace peerdrop {

/**
 * Name and size of a file that is about to be sent
 */
struct FileInfo {
    std::string name;
    uint64_t size;

    FileInfo() : size(0) {}
    FileInfo(const std::string& n, uint64_t s) : name(n), size(s) {}
};

/**
 * Result of reserving a destination for an incoming file
 */
struct WriteStreamHandle {
    std::string stream_id;
    std::string final_path;     // Path the file will have once finalized
};

/**
 * Scoped output file
 *
 * Bytes go to "<final_path>.part", which is created exclusively. finalize()
 * flushes, syncs and renames the partial file into place; discard() removes it.
 * A stream that is destroyed while still open is discarded.
 * Each stream is closed exactly once: writing to or closing a closed stream
 * throws TransferError(IO_ERROR).
 */
class OutputFileStream {
public:
    /**
     * Create the partial file for `final_path`
     * @return nullptr if the partial file already exists or cannot be created
     */
    static std::unique_ptr<OutputFileStream> create(const std::string& final_path);

    ~OutputFileStream();

    OutputFileStream(const OutputFileStream&) = delete;
    OutputFileStream& operator=(const OutputFileStream&) = delete;

    void write(const uint8_t* data, size_t size);
    void finalize();
    void discard();

    bool is_open() const { return file_ != nullptr; }
    uint64_t bytes_written() const { return bytes_written_; }
    const std::string& final_path() const { return final_path_; }
    const std::string& part_path() const { return part_path_; }

    static std::string part_path_for(const std::string& final_path);

private:
    OutputFileStream(FILE* file, const std::string& final_path, const std::string& part_path);

    void close_handle();

    FILE* file_;
    std::string final_path_;
    std::string part_path_;
    uint64_t bytes_written_;
};

/**
 * File access used by the transfer protocol
 *
 * The sender reads bounded windows of a file; the receiver streams chunks into
 * a write stream identified by an opaque id. Failures throw TransferError(IO_ERROR).
 */
class ChunkIO {
public:
    virtual ~ChunkIO() = default;

    virtual FileInfo get_file_info(const std::string& path) = 0;

    /**
     * Read at most `length` bytes at `offset`
     * Returns fewer bytes at the end of the file and none past it.
     */
    virtual std::vector<uint8_t> read_file_chunk(const std::string& path, uint64_t offset, size_t length) = 0;

    /**
     * Reserve a destination for `file_name`, renaming on collision
     */
    virtual WriteStreamHandle init_write_stream(const std::string& file_name) = 0;

    virtual void write_chunk(const std::string& stream_id, const uint8_t* data, size_t size) = 0;

    /**
     * Commit the stream to its final path
     * @return Final path of the saved file
     */
    virtual std::string finalize_write_stream(const std::string& stream_id) = 0;

    virtual void cancel_write_stream(const std::string& stream_id) = 0;
};

/**
 * ChunkIO over the local filesystem
 * Received files land in `download_directory`, which is created on first use.
 */
class DiskChunkIO : public ChunkIO {
public:
    explicit DiskChunkIO(const std::string& download_directory);
    ~DiskChunkIO() override;

    FileInfo get_file_info(const std::string& path) override;
    std::vector<uint8_t> read_file_chunk(const std::string& path, uint64_t offset, size_t length) override;
    WriteStreamHandle init_write_stream(const std::string& file_name) override;
    void write_chunk(const std::string& stream_id, const uint8_t* data, size_t size) override;
    std::string finalize_write_stream(const std::string& stream_id) override;
    void cancel_write_stream(const std::string& stream_id) override;

    const std::string& get_download_directory() const { return download_directory_; }
    size_t get_open_stream_count() const;

private:
    std::unique_ptr<OutputFileStream> take_stream(const std::string& stream_id);

    std::string download_directory_;
    mutable std::mutex streams_mutex_;
    std::map<std::string, std::unique_ptr<OutputFileStream>> streams_;
    uint64_t next_stream_id_;
};

} // namespace peerdrop
