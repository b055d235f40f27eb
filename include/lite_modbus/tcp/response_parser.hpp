#pragma once

#include <cstdint>
#include <span>
#include <variant>
#include "../common/errors.hpp"
#include "../common/exception_code.hpp"
#include "tcp_request.hpp"
#include "tcp_response.hpp"

namespace litemb {

/**
 * @brief Outcome of one read exchange as seen by the codec
 *
 * Exactly one of: decoded registers, a server exception, or a protocol error.
 */
using ReadResult = std::variant<TcpResponse, ModbusException, ProtocolError>;

/**
 * @brief Validates a response frame against the request that produced it
 *
 * Parsing is a single pass over one complete frame; there is no partial-frame
 * handling and no retry. A frame whose transaction id does not match the
 * request yields kTransactionMismatch rather than an empty result.
 */
class ResponseParser {
 public:
  /**
   * @brief Parse a response frame
   * @param request The request the response answers
   * @param frame Complete response frame including MBAP header
   * @return Decoded response, server exception, or protocol error
   */
  [[nodiscard]] static ReadResult Parse(const TcpRequest &request, std::span<const uint8_t> frame);

  /**
   * @brief Decode LSB-first packed bits
   * @note payload must hold at least ceil(count / 8) bytes
   */
  [[nodiscard]] static TcpResponse::BitRegisters DecodeBits(std::span<const uint8_t> payload, uint16_t count);

  /**
   * @brief Decode consecutive big-endian 16-bit registers
   * @note payload must hold at least 2 * count bytes
   */
  [[nodiscard]] static TcpResponse::WordRegisters DecodeWords(std::span<const uint8_t> payload, uint16_t count);
};

}  // namespace litemb
