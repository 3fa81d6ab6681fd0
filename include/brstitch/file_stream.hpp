#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace brstitch::filestream {

// Chunked reader over an already opened stream. The chunk size is chosen at
// run time so callers can vary read granularity independently of section size.
class FileReader {
public:
    FileReader(std::ifstream input, std::string label, std::size_t chunk_size)
        : label_(std::move(label)), input_(std::move(input)), chunk_(chunk_size) {
        if (chunk_size == 0) {
            throw std::invalid_argument("Read chunk size must be positive");
        }
        if (!input_.is_open()) {
            throw std::runtime_error("Failed to open file for reading: " + label_);
        }
    }

    FileReader(const std::filesystem::path& path, std::size_t chunk_size)
        : FileReader(std::ifstream(path, std::ios::binary), path.string(), chunk_size) {}

    // Reads up to max_size bytes, returns the number read; 0 means end of file.
    std::size_t Read(std::uint8_t* buffer, std::size_t max_size) {
        if (input_.eof()) {
            return 0;
        }
        input_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(max_size));
        if (input_.bad() || (input_.fail() && !input_.eof())) {
            throw std::runtime_error("Failed to read file: " + label_);
        }
        std::size_t bytes_read = static_cast<std::size_t>(input_.gcount());
        bytes_read_ += bytes_read;
        return bytes_read;
    }

    // Reads the next chunk into the internal buffer.
    std::pair<const std::uint8_t*, std::size_t> ReadChunk() {
        std::size_t n = Read(chunk_.data(), chunk_.size());
        return {chunk_.data(), n};
    }

    // Reads exactly size bytes unless the file ends first.
    std::size_t ReadExact(std::uint8_t* buffer, std::size_t size) {
        std::size_t total = 0;
        while (total < size) {
            std::size_t n = Read(buffer + total, size - total);
            if (n == 0) {
                break;
            }
            total += n;
        }
        return total;
    }

    std::uint64_t BytesRead() const noexcept { return bytes_read_; }
    const std::string& Label() const noexcept { return label_; }

private:
    std::string label_;
    std::ifstream input_;
    std::vector<std::uint8_t> chunk_;
    std::uint64_t bytes_read_ = 0;
};

// Buffered writer over an already opened stream. Close() must be called to
// commit; buffered bytes are discarded if the writer is destroyed first.
template<std::size_t ChunkSize = (64u << 10)>
class BufferedFileWriter {
public:
    BufferedFileWriter(std::ofstream output, std::string label)
        : label_(std::move(label)), output_(std::move(output)) {
        if (!output_.is_open()) {
            throw std::runtime_error("Failed to open file for writing: " + label_);
        }
    }

    BufferedFileWriter(const BufferedFileWriter&) = delete;
    BufferedFileWriter& operator=(const BufferedFileWriter&) = delete;

    void Write(const std::uint8_t* data, std::size_t size) {
        if (size >= chunk_.size()) {
            FlushBuffer();
            WriteThrough(data, size);
            bytes_written_ += size;
            return;
        }
        std::size_t offset = 0;
        while (offset < size) {
            std::size_t available = chunk_.size() - buffer_pos_;
            std::size_t to_copy = std::min(available, size - offset);
            std::memcpy(chunk_.data() + buffer_pos_, data + offset, to_copy);
            buffer_pos_ += to_copy;
            offset += to_copy;
            if (buffer_pos_ == chunk_.size()) {
                FlushBuffer();
            }
        }
        bytes_written_ += size;
    }

    void Write(const std::vector<std::uint8_t>& data) {
        Write(data.data(), data.size());
    }

    void Flush() {
        FlushBuffer();
        output_.flush();
        if (!output_) {
            throw std::runtime_error("Failed to write to file: " + label_);
        }
    }

    void Close() {
        Flush();
        output_.close();
        if (!output_) {
            throw std::runtime_error("Failed to close file: " + label_);
        }
    }

    std::uint64_t BytesWritten() const noexcept { return bytes_written_; }

private:
    void WriteThrough(const std::uint8_t* data, std::size_t size) {
        output_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!output_) {
            throw std::runtime_error("Failed to write to file: " + label_);
        }
    }

    void FlushBuffer() {
        if (buffer_pos_ > 0) {
            WriteThrough(chunk_.data(), buffer_pos_);
            buffer_pos_ = 0;
        }
    }

    std::string label_;
    std::ofstream output_;
    std::array<std::uint8_t, ChunkSize> chunk_{};
    std::size_t buffer_pos_ = 0;
    std::uint64_t bytes_written_ = 0;
};

}  // namespace brstitch::filestream
