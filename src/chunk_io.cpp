#include "chunk_io.h"
#include "errors.h"
#include "fs.h"
#include "logger.h"

#define LOG_CHUNKIO_DEBUG(message) LOG_DEBUG("chunkio", message)
#define LOG_CHUNKIO_INFO(message)  LOG_INFO("chunkio", message)
#define LOG_CHUNKIO_WARN(message)  LOG_WARN("chunkio", message)
#define LOG_CHUNKIO_ERROR(message) LOG_ERROR("chunkio", message)

namespace peerdrop {

namespace {

// Give up looking for a free name after this many collisions
constexpr int MAX_NAME_ATTEMPTS = 10000;

[[noreturn]] void throw_io_error(const std::string& message) {
    LOG_CHUNKIO_ERROR(message);
    throw TransferError(TransferErrorCode::IO_ERROR, message);
}

} // namespace

//=============================================================================
// OutputFileStream
//=============================================================================

std::string OutputFileStream::part_path_for(const std::string& final_path) {
    return final_path + ".part";
}

std::unique_ptr<OutputFileStream> OutputFileStream::create(const std::string& final_path) {
    std::string part_path = part_path_for(final_path);
    FILE* file = create_file_exclusive(part_path);
    if (!file) {
        return nullptr;
    }
    return std::unique_ptr<OutputFileStream>(new OutputFileStream(file, final_path, part_path));
}

OutputFileStream::OutputFileStream(FILE* file, const std::string& final_path, const std::string& part_path)
    : file_(file), final_path_(final_path), part_path_(part_path), bytes_written_(0) {}

OutputFileStream::~OutputFileStream() {
    if (file_) {
        LOG_CHUNKIO_DEBUG("Discarding unfinished output " << part_path_);
        close_handle();
        delete_file(part_path_);
    }
}

void OutputFileStream::write(const uint8_t* data, size_t size) {
    if (!file_) {
        throw_io_error("Write to closed output stream: " + final_path_);
    }
    if (size == 0) {
        return;
    }
    if (fwrite(data, 1, size, file_) != size) {
        throw_io_error("Failed to write " + std::to_string(size) + " bytes to " + part_path_);
    }
    bytes_written_ += size;
}

void OutputFileStream::finalize() {
    if (!file_) {
        throw_io_error("Output stream already closed: " + final_path_);
    }

    bool synced = sync_file(file_);
    bool closed = fclose(file_) == 0;
    file_ = nullptr;

    if (!synced || !closed) {
        delete_file(part_path_);
        throw_io_error("Failed to flush output file " + part_path_);
    }
    if (!rename_file(part_path_, final_path_)) {
        delete_file(part_path_);
        throw_io_error("Failed to move " + part_path_ + " into place");
    }
    LOG_CHUNKIO_DEBUG("Finalized " << final_path_ << " (" << bytes_written_ << " bytes)");
}

void OutputFileStream::discard() {
    if (!file_) {
        throw_io_error("Output stream already closed: " + final_path_);
    }
    close_handle();
    if (!delete_file(part_path_)) {
        LOG_CHUNKIO_WARN("Failed to delete partial file " << part_path_);
    }
}

void OutputFileStream::close_handle() {
    if (fclose(file_) != 0) {
        LOG_CHUNKIO_WARN("Error closing " << part_path_);
    }
    file_ = nullptr;
}

//=============================================================================
// DiskChunkIO
//=============================================================================

DiskChunkIO::DiskChunkIO(const std::string& download_directory)
    : download_directory_(download_directory), next_stream_id_(1) {}

DiskChunkIO::~DiskChunkIO() {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    if (!streams_.empty()) {
        LOG_CHUNKIO_WARN("Discarding " << streams_.size() << " unfinished write stream(s)");
    }
    streams_.clear();
}

FileInfo DiskChunkIO::get_file_info(const std::string& path) {
    if (!is_file(path)) {
        throw_io_error("Not a readable file: " + path);
    }
    int64_t size = get_file_size(path);
    if (size < 0) {
        throw_io_error("Failed to stat " + path);
    }
    return FileInfo(get_filename_from_path(path), static_cast<uint64_t>(size));
}

std::vector<uint8_t> DiskChunkIO::read_file_chunk(const std::string& path, uint64_t offset, size_t length) {
    std::vector<uint8_t> buffer(length);
    int64_t bytes_read = peerdrop::read_file_chunk(path, offset, buffer.data(), length);
    if (bytes_read < 0) {
        throw_io_error("Failed to read " + std::to_string(length) + " bytes at offset " +
                       std::to_string(offset) + " from " + path);
    }
    buffer.resize(static_cast<size_t>(bytes_read));
    return buffer;
}

WriteStreamHandle DiskChunkIO::init_write_stream(const std::string& file_name) {
    if (!create_directories(download_directory_)) {
        throw_io_error("Cannot create download directory " + download_directory_);
    }

    std::string base_name = sanitize_file_name(file_name);
    std::unique_ptr<OutputFileStream> stream;

    for (int counter = 0; counter < MAX_NAME_ATTEMPTS && !stream; ++counter) {
        std::string candidate_name = counter == 0 ? base_name : make_numbered_file_name(base_name, counter);
        std::string candidate_path = combine_paths(download_directory_, candidate_name);
        if (file_exists(candidate_path)) {
            continue;
        }
        // The partial file is the reservation; losing the race moves on to the next name
        stream = OutputFileStream::create(candidate_path);
        // Only a name taken by someone else is worth another attempt
        std::string part_path = OutputFileStream::part_path_for(candidate_path);
        if (!stream && !file_exists(part_path)) {
            throw_io_error("Cannot create " + part_path);
        }
    }

    if (!stream) {
        throw_io_error("No free destination name for " + base_name + " in " + download_directory_);
    }

    WriteStreamHandle handle;
    handle.final_path = stream->final_path();

    std::lock_guard<std::mutex> lock(streams_mutex_);
    handle.stream_id = "ws-" + std::to_string(next_stream_id_++);
    streams_[handle.stream_id] = std::move(stream);

    LOG_CHUNKIO_INFO("Opened write stream " << handle.stream_id << " -> " << handle.final_path);
    return handle;
}

void DiskChunkIO::write_chunk(const std::string& stream_id, const uint8_t* data, size_t size) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        throw_io_error("Unknown write stream " + stream_id);
    }
    it->second->write(data, size);
}

std::string DiskChunkIO::finalize_write_stream(const std::string& stream_id) {
    std::unique_ptr<OutputFileStream> stream = take_stream(stream_id);
    stream->finalize();
    LOG_CHUNKIO_INFO("Saved " << stream->final_path());
    return stream->final_path();
}

void DiskChunkIO::cancel_write_stream(const std::string& stream_id) {
    std::unique_ptr<OutputFileStream> stream = take_stream(stream_id);
    stream->discard();
    LOG_CHUNKIO_INFO("Discarded write stream " << stream_id);
}

size_t DiskChunkIO::get_open_stream_count() const {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    return streams_.size();
}

std::unique_ptr<OutputFileStream> DiskChunkIO::take_stream(const std::string& stream_id) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        throw_io_error("Unknown or already closed write stream " + stream_id);
    }
    std::unique_ptr<OutputFileStream> stream = std::move(it->second);
    streams_.erase(it);
    return stream;
}

} // namespace peerdrop
