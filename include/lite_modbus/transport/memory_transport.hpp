#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "byte_reader.hpp"
#include "byte_writer.hpp"

namespace litemb {

/**
 * @brief Memory-based transport implementation for testing
 *
 * Reads are served from a preloaded buffer, writes are captured. A read limit
 * can cap how many bytes each Read() hands out to exercise partial reads, and
 * errors can be injected for reads and writes.
 */
class MemoryTransport : public ByteTransport {
 public:
  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override {
    if (read_error_.has_value()) {
      last_error_ = read_error_;
      return -1;
    }
    if (read_pos_ >= read_buffer_.size()) {
      return 0;  // Exhausted, behaves like a closed peer
    }

    size_t bytes_to_read = std::min(buffer.size(), read_buffer_.size() - read_pos_);
    if (max_read_chunk_ > 0) {
      bytes_to_read = std::min(bytes_to_read, max_read_chunk_);
    }
    std::copy_n(read_buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_), bytes_to_read, buffer.begin());
    read_pos_ += bytes_to_read;
    ++read_calls_;
    return static_cast<int>(bytes_to_read);
  }

  [[nodiscard]] std::optional<TransportError> GetLastError() const override { return last_error_; }

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<const uint8_t> data) override {
    if (write_error_.has_value()) {
      last_error_ = write_error_;
      return -1;
    }
    write_buffer_.insert(write_buffer_.end(), data.begin(), data.end());
    return static_cast<int>(data.size());
  }

  [[nodiscard]] bool Flush() override { return true; }

  // MemoryTransport-specific methods
  /**
   * @brief Set the data that will be read by Read()
   */
  void SetReadData(std::span<const uint8_t> data) {
    read_buffer_.assign(data.begin(), data.end());
    read_pos_ = 0;
  }

  /**
   * @brief Hand out at most chunk bytes per Read() call (0 = unlimited)
   */
  void SetMaxReadChunk(size_t chunk) { max_read_chunk_ = chunk; }

  void FailReads(TransportError error) { read_error_ = error; }
  void FailWrites(TransportError error) { write_error_ = error; }

  /**
   * @brief Get the data that was written via Write()
   */
  [[nodiscard]] std::span<const uint8_t> GetWrittenData() const { return {write_buffer_.data(), write_buffer_.size()}; }

  [[nodiscard]] size_t GetBytesRead() const { return read_pos_; }
  [[nodiscard]] size_t GetReadCalls() const { return read_calls_; }

  void ClearWriteBuffer() { write_buffer_.clear(); }

 private:
  std::vector<uint8_t> read_buffer_{};
  size_t read_pos_{0};
  size_t max_read_chunk_{0};
  size_t read_calls_{0};
  std::vector<uint8_t> write_buffer_{};
  std::optional<TransportError> read_error_{};
  std::optional<TransportError> write_error_{};
  std::optional<TransportError> last_error_{};
};

}  // namespace litemb
