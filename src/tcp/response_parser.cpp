#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <variant>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/errors.hpp"
#include "common/exception_code.hpp"
#include "common/function_code.hpp"
#include "tcp/response_parser.hpp"
#include "tcp/tcp_frame.hpp"
#include "tcp/tcp_request.hpp"
#include "tcp/tcp_response.hpp"

namespace litemb {

// Unit ID(1) + Function Code(1) + Byte Count(1)
static constexpr uint16_t kLengthFieldOverhead{3};

TcpResponse::BitRegisters ResponseParser::DecodeBits(std::span<const uint8_t> payload, uint16_t count) {
  TcpResponse::BitRegisters bits;
  bits.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    bits.push_back(((payload[i / kBitsPerByte] >> (i % kBitsPerByte)) & 0x01) != 0);
  }
  return bits;
}

TcpResponse::WordRegisters ResponseParser::DecodeWords(std::span<const uint8_t> payload, uint16_t count) {
  TcpResponse::WordRegisters words;
  words.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    words.push_back(ReadU16(payload, i * 2));
  }
  return words;
}

ReadResult ResponseParser::Parse(const TcpRequest &request, std::span<const uint8_t> frame) {
  // Smallest meaningful frame is an exception response: MBAP + function_code + exception_code
  if (frame.size() < TcpFrame::kExceptionFrameSize) {
    return ProtocolError::kMalformedResponse;
  }

  if (TcpFrame::ExtractTransactionId(frame) != request.GetTransactionId()) {
    return ProtocolError::kTransactionMismatch;
  }

  if (TcpFrame::ExtractProtocolId(frame) != TcpFrame::kProtocolId) {
    return ProtocolError::kMalformedResponse;
  }

  const auto request_function = static_cast<uint8_t>(request.GetFunctionCode());
  const uint8_t function_echo = frame[TcpFrame::kFunctionCodeOffset];

  if (function_echo == (request_function | kExceptionFunctionCodeMask)) {
    return ModbusException(frame[TcpFrame::kExceptionCodeOffset]);
  }
  if (function_echo != request_function) {
    return ProtocolError::kUnrecognizedFunctionEcho;
  }

  const uint16_t length = TcpFrame::ExtractLength(frame);
  const uint8_t byte_count = frame[TcpFrame::kByteCountOffset];

  if (byte_count != request.GetExpectedByteCount()) {
    return ProtocolError::kMalformedResponse;
  }
  if (length != byte_count + kLengthFieldOverhead) {
    return ProtocolError::kMalformedResponse;
  }
  if (frame.size() < TcpFrame::kResponseDataOffset + byte_count) {
    return ProtocolError::kMalformedResponse;
  }

  auto payload = frame.subspan(TcpFrame::kResponseDataOffset, byte_count);
  const uint16_t count = request.GetRegisterCount();

  TcpResponse::Registers registers;
  if (IsBitFunction(request.GetFunctionCode())) {
    registers = DecodeBits(payload, count);
  } else {
    registers = DecodeWords(payload, count);
  }

  TcpResponse::Header header{TcpFrame::ExtractTransactionId(frame), length, frame[TcpFrame::kUnitIdOffset],
                             request.GetFunctionCode()};
  return TcpResponse(header, std::vector<uint8_t>(payload.begin(), payload.end()), std::move(registers));
}

}  // namespace litemb
