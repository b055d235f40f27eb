#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/function_code.hpp"
#include "tcp/tcp_frame.hpp"
#include "tcp/tcp_request.hpp"

namespace litemb {

uint16_t TcpFrame::ExtractTransactionId(std::span<const uint8_t> frame) {
  if (frame.size() < kTransactionIdOffset + 2) {
    return 0;
  }
  return ReadU16(frame, kTransactionIdOffset);
}

uint16_t TcpFrame::ExtractProtocolId(std::span<const uint8_t> frame) {
  if (frame.size() < kProtocolIdOffset + 2) {
    return 0;
  }
  return ReadU16(frame, kProtocolIdOffset);
}

uint16_t TcpFrame::ExtractLength(std::span<const uint8_t> frame) {
  if (frame.size() < kLengthOffset + 2) {
    return 0;
  }
  return ReadU16(frame, kLengthOffset);
}

void TcpFrame::WriteTransactionId(std::vector<uint8_t> &frame, uint16_t transaction_id) {
  frame.push_back(GetHighByte(transaction_id));
  frame.push_back(GetLowByte(transaction_id));
}

void TcpFrame::WriteProtocolId(std::vector<uint8_t> &frame) {
  frame.push_back(GetHighByte(kProtocolId));
  frame.push_back(GetLowByte(kProtocolId));
}

void TcpFrame::WriteUnitId(std::vector<uint8_t> &frame, uint8_t unit_id) {
  frame.push_back(unit_id);
}

std::vector<uint8_t> TcpFrame::EncodeRequest(const TcpRequest &request) {
  std::vector<uint8_t> frame;
  frame.reserve(kRequestFrameSize);

  // MBAP Header
  WriteTransactionId(frame, request.GetTransactionId());
  WriteProtocolId(frame);

  // Length: Unit ID(1) + Function Code(1) + Data
  uint16_t length = static_cast<uint16_t>(2 + kRequestDataSize);
  frame.push_back(GetHighByte(length));
  frame.push_back(GetLowByte(length));

  WriteUnitId(frame, request.GetUnitId());

  // PDU
  frame.push_back(static_cast<uint8_t>(request.GetFunctionCode()));
  frame.push_back(GetHighByte(request.GetStartAddress()));
  frame.push_back(GetLowByte(request.GetStartAddress()));
  frame.push_back(GetHighByte(request.GetRegisterCount()));
  frame.push_back(GetLowByte(request.GetRegisterCount()));

  return frame;
}

size_t TcpFrame::ExpectedResponseLength(const TcpRequest &request) noexcept {
  // byte_count field + data
  return kResponseHeaderSize + 1 + request.GetExpectedByteCount();
}

std::optional<TcpRequest> TcpFrame::DecodeRequest(std::span<const uint8_t> frame) {
  if (frame.size() < kRequestFrameSize) {
    return {};
  }

  if (ExtractProtocolId(frame) != kProtocolId) {
    return {};
  }

  // A read request always announces Unit ID + Function Code + 4 data bytes
  if (ExtractLength(frame) != 2 + kRequestDataSize) {
    return {};
  }

  auto function_code = ToFunctionCode(frame[kFunctionCodeOffset]);
  if (!function_code.has_value()) {
    return {};
  }

  TcpRequest::Header header{ExtractTransactionId(frame), frame[kUnitIdOffset], *function_code};
  AddressSpan span{ReadU16(frame, kFunctionCodeOffset + 1), ReadU16(frame, kFunctionCodeOffset + 3)};

  auto result = TcpRequest::Create(header, span);
  if (auto *request = std::get_if<TcpRequest>(&result)) {
    return *request;
  }
  return {};
}

bool TcpFrame::IsFrameComplete(std::span<const uint8_t> frame) {
  if (frame.size() < kMbapHeaderSize) {
    return false;  // Need at least MBAP header
  }

  return frame.size() >= GetAnnouncedFrameSize(frame);
}

size_t TcpFrame::GetAnnouncedFrameSize(std::span<const uint8_t> frame) {
  if (frame.size() < kLengthOffset + 2) {
    return 0;
  }
  // Length field value = Unit ID(1) + PDU size
  // Total frame size = 7 + (length - 1) = 6 + length
  return kLengthOffset + 2 + ExtractLength(frame);
}

}  // namespace litemb
