#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "tcp_request.hpp"

namespace litemb {

/**
 * @brief TCP frame encoder for read requests
 *
 * Modbus TCP uses MBAP (Modbus Application Protocol) header:
 * - Transaction ID (2 bytes)
 * - Protocol ID (2 bytes, always 0x0000)
 * - Length (2 bytes) - number of bytes following (Unit ID + PDU)
 * - Unit ID (1 byte)
 * - PDU (Protocol Data Unit) - function code + data
 */
class TcpFrame {
 public:
  static constexpr size_t kMbapHeaderSize = 7;  // Transaction ID(2) + Protocol ID(2) + Length(2) + Unit ID(1)
  static constexpr size_t kResponseHeaderSize = kMbapHeaderSize + 1;  // MBAP + function_code
  static constexpr size_t kRequestDataSize = 4;                       // address(2) + count(2)
  static constexpr size_t kRequestFrameSize = kMbapHeaderSize + 1 + kRequestDataSize;
  static constexpr size_t kExceptionFrameSize = kResponseHeaderSize + 1;  // + exception_code
  static constexpr uint16_t kProtocolId = 0x0000;

  static constexpr size_t kTransactionIdOffset = 0;
  static constexpr size_t kProtocolIdOffset = 2;
  static constexpr size_t kLengthOffset = 4;
  static constexpr size_t kUnitIdOffset = 6;
  static constexpr size_t kFunctionCodeOffset = 7;
  static constexpr size_t kByteCountOffset = 8;
  static constexpr size_t kExceptionCodeOffset = 8;
  static constexpr size_t kResponseDataOffset = 9;

  /**
   * @brief Encode a request into a TCP frame with MBAP header
   * @param request The validated read request
   * @return The complete frame (MBAP header + PDU), always kRequestFrameSize bytes
   */
  [[nodiscard]] static std::vector<uint8_t> EncodeRequest(const TcpRequest &request);

  /**
   * @brief Size of a successful response to this request
   *
   * MBAP header + function code (8) + byte count (1) + data, where data is one bit
   * per coil/discrete input rounded up to whole bytes, or two bytes per register.
   * Used to size the receive buffer before reading.
   */
  [[nodiscard]] static size_t ExpectedResponseLength(const TcpRequest &request) noexcept;

  /**
   * @brief Decode a read request frame
   * @param frame Complete TCP frame including MBAP header
   * @return Parsed request if the frame is a valid read request, empty optional otherwise
   */
  [[nodiscard]] static std::optional<TcpRequest> DecodeRequest(std::span<const uint8_t> frame);

  /**
   * @brief Check if a frame holds as many bytes as its MBAP length field announces
   */
  [[nodiscard]] static bool IsFrameComplete(std::span<const uint8_t> frame);

  /**
   * @brief Total frame size the MBAP length field announces (6 + length)
   * @return 0 if the frame does not yet hold the length field
   */
  [[nodiscard]] static size_t GetAnnouncedFrameSize(std::span<const uint8_t> frame);

  [[nodiscard]] static uint16_t ExtractTransactionId(std::span<const uint8_t> frame);
  [[nodiscard]] static uint16_t ExtractProtocolId(std::span<const uint8_t> frame);
  [[nodiscard]] static uint16_t ExtractLength(std::span<const uint8_t> frame);

 private:
  static void WriteTransactionId(std::vector<uint8_t> &frame, uint16_t transaction_id);
  static void WriteProtocolId(std::vector<uint8_t> &frame);
  static void WriteUnitId(std::vector<uint8_t> &frame, uint8_t unit_id);
};

}  // namespace litemb
