#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include "../common/errors.hpp"

namespace litemb {

/**
 * @brief Abstract interface for reading bytes from a transport layer
 *
 * This interface allows the codec to work with any byte source
 * (TCP socket, memory buffer, etc.) without knowing the details.
 */
class ByteReader {
 public:
  virtual ~ByteReader() = default;

  /**
   * @brief Read bytes from the transport layer, blocking up to the transport's read timeout
   * @param buffer Buffer to store read bytes; at most buffer.size() bytes are read
   * @return Number of bytes actually read, 0 if the source is exhausted (peer closed), -1 on error
   */
  [[nodiscard]] virtual int Read(std::span<uint8_t> buffer) = 0;

  /**
   * @brief Reason for the last failed Read or Write
   * @return Empty if no error occurred
   */
  [[nodiscard]] virtual std::optional<TransportError> GetLastError() const = 0;
};

}  // namespace litemb
