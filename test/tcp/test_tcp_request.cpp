#include <gtest/gtest.h>
#include <variant>
#include "lite_modbus/common/address_span.hpp"
#include "lite_modbus/common/errors.hpp"
#include "lite_modbus/common/function_code.hpp"
#include "lite_modbus/tcp/tcp_request.hpp"

using litemb::AddressSpan;
using litemb::ConstructionError;
using litemb::FunctionCode;
using litemb::TcpRequest;

namespace {

ConstructionError ErrorOf(const TcpRequest::BuildResult &result) {
  EXPECT_TRUE(std::holds_alternative<ConstructionError>(result));
  return std::get<ConstructionError>(result);
}

TcpRequest::BuildResult BuildWith(uint8_t function_code, uint16_t count) {
  return TcpRequest::Builder{}.SetFunctionCode(function_code).SetRegisterCount(count).Build();
}

}  // namespace

TEST(TCPRequest, BuilderProducesRequest) {
  auto result = TcpRequest::Builder{}
                    .SetTransactionId(123)
                    .SetUnitId(7)
                    .SetFunctionCode(FunctionCode::kReadHR)
                    .SetStartAddress(0xFFFF)
                    .SetRegisterCount(125)
                    .Build();

  ASSERT_TRUE(std::holds_alternative<TcpRequest>(result));
  const auto &request = std::get<TcpRequest>(result);
  EXPECT_EQ(request.GetTransactionId(), 123);
  EXPECT_EQ(request.GetUnitId(), 7);
  EXPECT_EQ(request.GetFunctionCode(), FunctionCode::kReadHR);
  EXPECT_EQ(request.GetStartAddress(), 0xFFFF);
  EXPECT_EQ(request.GetRegisterCount(), 125);
}

TEST(TCPRequest, DefaultTransactionIdIsOne) {
  auto result = BuildWith(1, 1);
  ASSERT_TRUE(std::holds_alternative<TcpRequest>(result));
  EXPECT_EQ(std::get<TcpRequest>(result).GetTransactionId(), 1);
}

TEST(TCPRequest, UnsupportedFunctionCodes) {
  for (uint8_t code : {0, 5, 6, 15, 16, 0x81, 0xFF}) {
    EXPECT_EQ(ErrorOf(BuildWith(code, 1)), ConstructionError::kUnsupportedFunction) << "code " << int{code};
  }
}

TEST(TCPRequest, MissingFunctionCode) {
  auto result = TcpRequest::Builder{}.SetRegisterCount(10).Build();
  EXPECT_EQ(ErrorOf(result), ConstructionError::kUnsupportedFunction);
}

TEST(TCPRequest, MissingRegisterCount) {
  auto result = TcpRequest::Builder{}.SetFunctionCode(FunctionCode::kReadCoils).Build();
  EXPECT_EQ(ErrorOf(result), ConstructionError::kOutOfRange);
}

TEST(TCPRequest, BitFunctionCountLimits) {
  for (uint8_t code : {1, 2}) {
    EXPECT_TRUE(std::holds_alternative<TcpRequest>(BuildWith(code, 1)));
    EXPECT_TRUE(std::holds_alternative<TcpRequest>(BuildWith(code, 2000)));
    EXPECT_EQ(ErrorOf(BuildWith(code, 0)), ConstructionError::kOutOfRange);
    EXPECT_EQ(ErrorOf(BuildWith(code, 2001)), ConstructionError::kOutOfRange);
  }
}

TEST(TCPRequest, WordFunctionCountLimits) {
  for (uint8_t code : {3, 4}) {
    EXPECT_TRUE(std::holds_alternative<TcpRequest>(BuildWith(code, 1)));
    EXPECT_TRUE(std::holds_alternative<TcpRequest>(BuildWith(code, 125)));
    EXPECT_EQ(ErrorOf(BuildWith(code, 0)), ConstructionError::kOutOfRange);
    EXPECT_EQ(ErrorOf(BuildWith(code, 126)), ConstructionError::kOutOfRange);
  }
}

TEST(TCPRequest, CountValidatedAgainstFinalFunctionCode) {
  // 2000 is valid for coils but not for holding registers
  auto result = TcpRequest::Builder{}
                    .SetFunctionCode(FunctionCode::kReadCoils)
                    .SetRegisterCount(2000)
                    .SetFunctionCode(FunctionCode::kReadHR)
                    .Build();
  EXPECT_EQ(ErrorOf(result), ConstructionError::kOutOfRange);
}

TEST(TCPRequest, SetterOrderDoesNotMatter) {
  auto count_first = TcpRequest::Builder{}.SetRegisterCount(500).SetFunctionCode(FunctionCode::kReadDI).Build();
  auto function_first = TcpRequest::Builder{}.SetFunctionCode(FunctionCode::kReadDI).SetRegisterCount(500).Build();

  ASSERT_TRUE(std::holds_alternative<TcpRequest>(count_first));
  ASSERT_TRUE(std::holds_alternative<TcpRequest>(function_first));
  EXPECT_EQ(std::get<TcpRequest>(count_first).GetRegisterCount(), 500);
  EXPECT_EQ(std::get<TcpRequest>(function_first).GetRegisterCount(), 500);
}

TEST(TCPRequest, CountBecomesValidAfterFunctionChange) {
  auto result = TcpRequest::Builder{}
                    .SetFunctionCode(FunctionCode::kReadIR)
                    .SetRegisterCount(1000)
                    .SetFunctionCode(FunctionCode::kReadCoils)
                    .Build();
  ASSERT_TRUE(std::holds_alternative<TcpRequest>(result));
  EXPECT_EQ(std::get<TcpRequest>(result).GetFunctionCode(), FunctionCode::kReadCoils);
}

TEST(TCPRequest, CreateValidates) {
  auto ok = TcpRequest::Create({5, 1, FunctionCode::kReadIR}, AddressSpan{10, 3});
  ASSERT_TRUE(std::holds_alternative<TcpRequest>(ok));
  EXPECT_EQ(std::get<TcpRequest>(ok).GetAddressSpan().start_address, 10);

  auto bad_count = TcpRequest::Create({5, 1, FunctionCode::kReadIR}, AddressSpan{10, 126});
  EXPECT_EQ(ErrorOf(bad_count), ConstructionError::kOutOfRange);

  auto bad_function = TcpRequest::Create({5, 1, static_cast<FunctionCode>(6)}, AddressSpan{10, 1});
  EXPECT_EQ(ErrorOf(bad_function), ConstructionError::kUnsupportedFunction);
}

TEST(TCPRequest, ExpectedByteCount) {
  auto coils = TcpRequest::Create({1, 1, FunctionCode::kReadCoils}, AddressSpan{0, 9});
  auto holding = TcpRequest::Create({1, 1, FunctionCode::kReadHR}, AddressSpan{0, 9});
  ASSERT_TRUE(std::holds_alternative<TcpRequest>(coils));
  ASSERT_TRUE(std::holds_alternative<TcpRequest>(holding));
  EXPECT_EQ(std::get<TcpRequest>(coils).GetExpectedByteCount(), 2);
  EXPECT_EQ(std::get<TcpRequest>(holding).GetExpectedByteCount(), 18);
}

TEST(TCPRequest, ValidateRegisterCount) {
  EXPECT_FALSE(litemb::ValidateRegisterCount(FunctionCode::kReadDI, 2000).has_value());
  auto error = litemb::ValidateRegisterCount(FunctionCode::kReadHR, 126);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(*error, ConstructionError::kOutOfRange);
}
