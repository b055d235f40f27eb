#include <gtest/gtest.h>
#include <cstdint>
#include <variant>
#include <vector>
#include "lite_modbus/common/address_span.hpp"
#include "lite_modbus/common/byte_helpers.hpp"
#include "lite_modbus/common/errors.hpp"
#include "lite_modbus/common/exception_code.hpp"
#include "lite_modbus/common/function_code.hpp"
#include "lite_modbus/tcp/response_parser.hpp"
#include "lite_modbus/tcp/tcp_request.hpp"
#include "lite_modbus/tcp/tcp_response.hpp"

using litemb::AddressSpan;
using litemb::ExceptionCode;
using litemb::FunctionCode;
using litemb::GetHighByte;
using litemb::GetLowByte;
using litemb::ModbusException;
using litemb::ProtocolError;
using litemb::ReadResult;
using litemb::ResponseParser;
using litemb::TcpRequest;
using litemb::TcpResponse;

namespace {

TcpRequest MakeRequest(uint16_t transaction_id, FunctionCode function_code, uint16_t count) {
  auto result = TcpRequest::Create({transaction_id, 1, function_code}, AddressSpan{0, count});
  EXPECT_TRUE(std::holds_alternative<TcpRequest>(result));
  return std::get<TcpRequest>(result);
}

// MBAP header + function code + byte count + data
std::vector<uint8_t> MakeResponseFrame(uint16_t transaction_id, uint8_t function_code,
                                       const std::vector<uint8_t> &data) {
  uint16_t length = static_cast<uint16_t>(3 + data.size());
  std::vector<uint8_t> frame{GetHighByte(transaction_id),
                             GetLowByte(transaction_id),
                             0x00,
                             0x00,
                             GetHighByte(length),
                             GetLowByte(length),
                             0x01,
                             function_code,
                             static_cast<uint8_t>(data.size())};
  frame.insert(frame.end(), data.begin(), data.end());
  return frame;
}

std::vector<uint8_t> MakeExceptionFrame(uint16_t transaction_id, uint8_t function_code, uint8_t exception_code) {
  return {GetHighByte(transaction_id), GetLowByte(transaction_id), 0x00, 0x00, 0x00, 0x03, 0x01,
          function_code,               exception_code};
}

ProtocolError ProtocolErrorOf(const ReadResult &result) {
  EXPECT_TRUE(std::holds_alternative<ProtocolError>(result));
  return std::get<ProtocolError>(result);
}

}  // namespace

TEST(ResponseParser, DecodeCoilsLsbFirst) {
  auto request = MakeRequest(7, FunctionCode::kReadCoils, 8);
  auto frame = MakeResponseFrame(7, 0x01, {0b10110010});

  auto result = ResponseParser::Parse(request, frame);
  ASSERT_TRUE(std::holds_alternative<TcpResponse>(result));
  const auto &response = std::get<TcpResponse>(result);
  ASSERT_TRUE(response.HasBitRegisters());
  EXPECT_FALSE(response.HasWordRegisters());
  EXPECT_EQ(response.GetWordRegisters(), nullptr);

  std::vector<bool> expected{false, true, false, false, true, true, false, true};
  EXPECT_EQ(*response.GetBitRegisters(), expected);
}

TEST(ResponseParser, DecodeHoldingRegisters) {
  auto request = MakeRequest(42, FunctionCode::kReadHR, 2);
  auto frame = MakeResponseFrame(42, 0x03, {0x00, 0x0A, 0x01, 0x2C});

  auto result = ResponseParser::Parse(request, frame);
  ASSERT_TRUE(std::holds_alternative<TcpResponse>(result));
  const auto &response = std::get<TcpResponse>(result);
  ASSERT_TRUE(response.HasWordRegisters());

  std::vector<uint16_t> expected{10, 300};
  EXPECT_EQ(*response.GetWordRegisters(), expected);
}

TEST(ResponseParser, DecodeInputRegistersFullWordRange) {
  auto request = MakeRequest(1, FunctionCode::kReadIR, 3);
  auto frame = MakeResponseFrame(1, 0x04, {0xFF, 0xFF, 0x80, 0x00, 0x00, 0x01});

  auto result = ResponseParser::Parse(request, frame);
  ASSERT_TRUE(std::holds_alternative<TcpResponse>(result));
  std::vector<uint16_t> expected{0xFFFF, 0x8000, 0x0001};
  EXPECT_EQ(*std::get<TcpResponse>(result).GetWordRegisters(), expected);
}

TEST(ResponseParser, DecodeDiscreteInputsAcrossBytes) {
  // 10 inputs: byte 0 holds inputs 0-7, bits 0-1 of byte 1 hold inputs 8-9; padding bits ignored
  auto request = MakeRequest(3, FunctionCode::kReadDI, 10);
  auto frame = MakeResponseFrame(3, 0x02, {0x01, 0xFE});

  auto result = ResponseParser::Parse(request, frame);
  ASSERT_TRUE(std::holds_alternative<TcpResponse>(result));
  const auto *bits = std::get<TcpResponse>(result).GetBitRegisters();
  ASSERT_NE(bits, nullptr);
  ASSERT_EQ(bits->size(), 10);
  EXPECT_TRUE((*bits)[0]);
  for (size_t i = 1; i < 8; ++i) {
    EXPECT_FALSE((*bits)[i]) << "input " << i;
  }
  EXPECT_FALSE((*bits)[8]);
  EXPECT_TRUE((*bits)[9]);
}

TEST(ResponseParser, ResponseFieldsAreEchoed) {
  auto request = MakeRequest(0xBEEF, FunctionCode::kReadHR, 1);
  auto frame = MakeResponseFrame(0xBEEF, 0x03, {0x12, 0x34});

  auto result = ResponseParser::Parse(request, frame);
  ASSERT_TRUE(std::holds_alternative<TcpResponse>(result));
  const auto &response = std::get<TcpResponse>(result);
  EXPECT_EQ(response.GetTransactionId(), 0xBEEF);
  EXPECT_EQ(response.GetUnitId(), 1);
  EXPECT_EQ(response.GetFunctionCode(), FunctionCode::kReadHR);
  EXPECT_EQ(response.GetLength(), 5);
  EXPECT_EQ(response.GetByteCount(), 2);
  ASSERT_EQ(response.GetPayload().size(), 2);
  EXPECT_EQ(response.GetPayload()[0], 0x12);
  EXPECT_EQ(response.GetRegisterCount(), 1);
}

TEST(ResponseParser, ExceptionResponse) {
  auto request = MakeRequest(9, FunctionCode::kReadHR, 4);
  auto frame = MakeExceptionFrame(9, 0x83, 0x02);

  auto result = ResponseParser::Parse(request, frame);
  ASSERT_TRUE(std::holds_alternative<ModbusException>(result));
  const auto &exception = std::get<ModbusException>(result);
  EXPECT_EQ(exception.GetCode(), ExceptionCode::kIllegalDataAddress);
  EXPECT_EQ(exception.GetName(), "IllegalDataAddress");
}

TEST(ResponseParser, ExceptionResponseInFullSizeBuffer) {
  // Buffer sized for a successful response, only the exception bytes filled in
  auto request = MakeRequest(9, FunctionCode::kReadCoils, 16);
  auto frame = MakeExceptionFrame(9, 0x81, 0x04);
  frame.resize(11, 0x00);

  auto result = ResponseParser::Parse(request, frame);
  ASSERT_TRUE(std::holds_alternative<ModbusException>(result));
  EXPECT_EQ(std::get<ModbusException>(result).GetCode(), ExceptionCode::kServerDeviceFailure);
}

TEST(ResponseParser, UnknownExceptionCodeIsPreserved) {
  auto request = MakeRequest(9, FunctionCode::kReadIR, 1);
  auto frame = MakeExceptionFrame(9, 0x84, 0x09);

  auto result = ResponseParser::Parse(request, frame);
  ASSERT_TRUE(std::holds_alternative<ModbusException>(result));
  const auto &exception = std::get<ModbusException>(result);
  EXPECT_EQ(exception.GetCode(), ExceptionCode::kUnknown);
  EXPECT_FALSE(exception.IsKnown());
  EXPECT_EQ(exception.GetRawCode(), 0x09);
}

TEST(ResponseParser, TransactionMismatch) {
  auto request = MakeRequest(100, FunctionCode::kReadCoils, 8);
  auto frame = MakeResponseFrame(101, 0x01, {0xFF});

  EXPECT_EQ(ProtocolErrorOf(ResponseParser::Parse(request, frame)), ProtocolError::kTransactionMismatch);
}

TEST(ResponseParser, TransactionMismatchOnExceptionResponse) {
  auto request = MakeRequest(100, FunctionCode::kReadCoils, 8);
  auto frame = MakeExceptionFrame(5, 0x81, 0x02);

  EXPECT_EQ(ProtocolErrorOf(ResponseParser::Parse(request, frame)), ProtocolError::kTransactionMismatch);
}

TEST(ResponseParser, UnrecognizedFunctionEcho) {
  auto request = MakeRequest(1, FunctionCode::kReadHR, 1);

  // Another read function
  EXPECT_EQ(ProtocolErrorOf(ResponseParser::Parse(request, MakeResponseFrame(1, 0x04, {0x00, 0x01}))),
            ProtocolError::kUnrecognizedFunctionEcho);
  // Exception echo for a different function
  EXPECT_EQ(ProtocolErrorOf(ResponseParser::Parse(request, MakeExceptionFrame(1, 0x84, 0x02))),
            ProtocolError::kUnrecognizedFunctionEcho);
}

TEST(ResponseParser, ByteCountMismatch) {
  auto request = MakeRequest(1, FunctionCode::kReadHR, 2);
  auto frame = MakeResponseFrame(1, 0x03, {0x00, 0x01});  // one register instead of two

  EXPECT_EQ(ProtocolErrorOf(ResponseParser::Parse(request, frame)), ProtocolError::kMalformedResponse);
}

TEST(ResponseParser, LengthFieldMismatch) {
  auto request = MakeRequest(1, FunctionCode::kReadHR, 1);
  auto frame = MakeResponseFrame(1, 0x03, {0x00, 0x01});
  frame[5] = 0x06;

  EXPECT_EQ(ProtocolErrorOf(ResponseParser::Parse(request, frame)), ProtocolError::kMalformedResponse);
}

TEST(ResponseParser, TruncatedPayload) {
  auto request = MakeRequest(1, FunctionCode::kReadHR, 2);
  auto frame = MakeResponseFrame(1, 0x03, {0x00, 0x01, 0x00, 0x02});
  frame.pop_back();

  EXPECT_EQ(ProtocolErrorOf(ResponseParser::Parse(request, frame)), ProtocolError::kMalformedResponse);
}

TEST(ResponseParser, FrameShorterThanHeader) {
  auto request = MakeRequest(1, FunctionCode::kReadCoils, 1);
  std::vector<uint8_t> frame{0x00, 0x01, 0x00, 0x00, 0x00, 0x03, 0x01, 0x01};

  EXPECT_EQ(ProtocolErrorOf(ResponseParser::Parse(request, frame)), ProtocolError::kMalformedResponse);
  EXPECT_EQ(ProtocolErrorOf(ResponseParser::Parse(request, {})), ProtocolError::kMalformedResponse);
}

TEST(ResponseParser, NonZeroProtocolId) {
  auto request = MakeRequest(1, FunctionCode::kReadCoils, 1);
  auto frame = MakeResponseFrame(1, 0x01, {0x01});
  frame[2] = 0x12;

  EXPECT_EQ(ProtocolErrorOf(ResponseParser::Parse(request, frame)), ProtocolError::kMalformedResponse);
}

TEST(ResponseParser, DecodeBitsLargestRequest) {
  std::vector<uint8_t> payload(250, 0xFF);
  payload.back() = 0x7F;
  auto bits = ResponseParser::DecodeBits(payload, 2000);
  ASSERT_EQ(bits.size(), 2000);
  EXPECT_TRUE(bits[1998]);
  EXPECT_FALSE(bits[1999]);
}
