#pragma once

#include <cstdint>
#include <string_view>

namespace litemb {

/**
 * @brief Invalid request parameters, detected before any byte is emitted
 */
enum class ConstructionError : uint8_t {
  kUnsupportedFunction,
  kOutOfRange
};

/**
 * @brief Response bytes that do not belong to, or do not match, the request
 */
enum class ProtocolError : uint8_t {
  kTransactionMismatch,
  kUnrecognizedFunctionEcho,
  kMalformedResponse
};

/**
 * @brief Stream level failures reported by the transport
 */
enum class TransportError : uint8_t {
  kResolveFailed,
  kConnectFailed,
  kConnectTimeout,
  kNotConnected,
  kWriteFailed,
  kReadFailed,
  kReadTimeout,
  kConnectionClosed
};

[[nodiscard]] std::string_view ToString(ConstructionError error) noexcept;
[[nodiscard]] std::string_view ToString(ProtocolError error) noexcept;
[[nodiscard]] std::string_view ToString(TransportError error) noexcept;

}  // namespace litemb
