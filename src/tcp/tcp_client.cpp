#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <variant>
#include <vector>
#include "common/errors.hpp"
#include "common/function_code.hpp"
#include "tcp/response_parser.hpp"
#include "tcp/tcp_client.hpp"
#include "tcp/tcp_frame.hpp"
#include "tcp/tcp_request.hpp"

namespace litemb {

namespace {

// Widen the codec result into the client result
ClientResult ToClientResult(ReadResult &&result) {
  return std::visit([](auto &&value) -> ClientResult { return std::move(value); }, std::move(result));
}

}  // namespace

ClientResult TcpClient::ReadCoils(uint8_t unit_id, uint16_t start_address, uint16_t count) {
  return ReadFunction(FunctionCode::kReadCoils, unit_id, start_address, count);
}

ClientResult TcpClient::ReadDiscreteInputs(uint8_t unit_id, uint16_t start_address, uint16_t count) {
  return ReadFunction(FunctionCode::kReadDI, unit_id, start_address, count);
}

ClientResult TcpClient::ReadHoldingRegisters(uint8_t unit_id, uint16_t start_address, uint16_t count) {
  return ReadFunction(FunctionCode::kReadHR, unit_id, start_address, count);
}

ClientResult TcpClient::ReadInputRegisters(uint8_t unit_id, uint16_t start_address, uint16_t count) {
  return ReadFunction(FunctionCode::kReadIR, unit_id, start_address, count);
}

ClientResult TcpClient::ReadFunction(FunctionCode function_code, uint8_t unit_id, uint16_t start_address,
                                     uint16_t count) {
  auto built = TcpRequest::Builder{}
                   .SetTransactionId(GetNextTransactionId())
                   .SetUnitId(unit_id)
                   .SetFunctionCode(function_code)
                   .SetStartAddress(start_address)
                   .SetRegisterCount(count)
                   .Build();
  if (auto *error = std::get_if<ConstructionError>(&built)) {
    return *error;
  }
  return Read(std::get<TcpRequest>(built));
}

ClientResult TcpClient::Read(const TcpRequest &request) {
  std::vector<uint8_t> frame = TcpFrame::EncodeRequest(request);

  int bytes_written = transport_.Write(std::span<const uint8_t>(frame.data(), frame.size()));
  if (bytes_written != static_cast<int>(frame.size())) {
    return transport_.GetLastError().value_or(TransportError::kWriteFailed);
  }

  if (!transport_.Flush()) {
    return transport_.GetLastError().value_or(TransportError::kWriteFailed);
  }

  // Buffer sized from the request; never an unbounded read
  const size_t expected_size = TcpFrame::ExpectedResponseLength(request);
  std::vector<uint8_t> response;
  response.reserve(expected_size);

  if (auto error = ReadExactly(response, TcpFrame::kExceptionFrameSize); error.has_value()) {
    return *error;
  }

  // Any exception echo is complete at this point. Otherwise read what the MBAP
  // length announces, never more than the predicted length.
  const bool exception_echo = (response[TcpFrame::kFunctionCodeOffset] & kExceptionFunctionCodeMask) != 0;
  if (!exception_echo && !TcpFrame::IsFrameComplete(response)) {
    const size_t frame_size = std::min(TcpFrame::GetAnnouncedFrameSize(response), expected_size);
    if (auto error = ReadExactly(response, frame_size); error.has_value()) {
      return *error;
    }
  }

  return ToClientResult(ResponseParser::Parse(request, response));
}

std::optional<TransportError> TcpClient::ReadExactly(std::vector<uint8_t> &frame, size_t size) {
  while (frame.size() < size) {
    size_t current_size = frame.size();
    size_t needed = size - current_size;
    frame.resize(size);
    int bytes_read = transport_.Read(std::span<uint8_t>(frame.data() + current_size, needed));
    if (bytes_read < 0) {
      frame.resize(current_size);  // Restore original size on error
      return transport_.GetLastError().value_or(TransportError::kReadFailed);
    }
    if (bytes_read == 0) {
      frame.resize(current_size);
      return TransportError::kConnectionClosed;
    }
    frame.resize(current_size + static_cast<size_t>(bytes_read));
  }
  return {};
}

}  // namespace litemb
