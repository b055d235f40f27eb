/**
 * @file tcp_client_transport.hpp
 * @brief POSIX TCP socket transport for a Modbus TCP client
 *
 * Usage:
 *   auto connected = TcpClientTransport::Connect("192.168.0.10", 502, 1000);
 *   if (auto *transport = std::get_if<TcpClientTransport>(&connected)) {
 *     TcpClient client(*transport);
 *     ...
 *   }
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include "../common/errors.hpp"
#include "byte_reader.hpp"
#include "byte_writer.hpp"

namespace litemb {

/**
 * @brief ByteTransport over a connected TCP socket
 *
 * Owns the file descriptor; closes it in the destructor. Reads and writes block
 * for at most the timeout given to Connect().
 */
class TcpClientTransport : public ByteTransport {
 public:
  using ConnectResult = std::variant<TcpClientTransport, TransportError>;

  /**
   * @brief Resolve host and connect, bounded by timeout_ms
   * @param host IPv4 address or host name
   * @param port TCP port (502 for Modbus)
   * @param timeout_ms Connect timeout, also applied as read and write timeout
   * @return Connected transport, or kResolveFailed / kConnectFailed / kConnectTimeout
   */
  [[nodiscard]] static ConnectResult Connect(const std::string &host, uint16_t port, uint32_t timeout_ms);

  /**
   * @brief Wrap an already-connected socket fd (ownership taken)
   */
  explicit TcpClientTransport(int fd)
      : fd_(fd) {}

  ~TcpClientTransport() override { Close(); }

  TcpClientTransport(const TcpClientTransport &) = delete;
  TcpClientTransport &operator=(const TcpClientTransport &) = delete;

  TcpClientTransport(TcpClientTransport &&other) noexcept
      : fd_(other.fd_),
        last_error_(other.last_error_) {
    other.fd_ = -1;
  }

  TcpClientTransport &operator=(TcpClientTransport &&other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      last_error_ = other.last_error_;
      other.fd_ = -1;
    }
    return *this;
  }

  [[nodiscard]] bool IsOpen() const noexcept { return fd_ >= 0; }

  /**
   * @brief Apply a receive and send timeout to the socket
   * @return false if the socket is closed or setsockopt fails
   */
  bool SetTimeout(uint32_t timeout_ms);

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override;
  [[nodiscard]] std::optional<TransportError> GetLastError() const override { return last_error_; }

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<const uint8_t> data) override;
  [[nodiscard]] bool Flush() override;

  void Close() noexcept;

 private:
  int fd_;
  std::optional<TransportError> last_error_{};
};

}  // namespace litemb
