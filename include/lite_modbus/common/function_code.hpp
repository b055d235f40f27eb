#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace litemb {

enum class FunctionCode : uint8_t {
  kReadCoils = 1,
  kReadDI = 2,
  kReadHR = 3,
  kReadIR = 4
};

static constexpr uint8_t kExceptionFunctionCodeMask = 0x80;

static constexpr uint16_t kMinRegisterCount = 1;
static constexpr uint16_t kMaxBitRegisterCount = 0x07D0;   // 2000
static constexpr uint16_t kMaxWordRegisterCount = 0x007D;  // 125

/**
 * @brief Map a raw function code byte to one of the supported read functions
 * @return The function code, or empty if the byte is not a supported read function
 */
[[nodiscard]] static inline constexpr std::optional<FunctionCode> ToFunctionCode(uint8_t raw) {
  switch (raw) {
    case static_cast<uint8_t>(FunctionCode::kReadCoils):
    case static_cast<uint8_t>(FunctionCode::kReadDI):
    case static_cast<uint8_t>(FunctionCode::kReadHR):
    case static_cast<uint8_t>(FunctionCode::kReadIR):
      return static_cast<FunctionCode>(raw);
    default:
      return {};
  }
}

/**
 * @brief Coils and discrete inputs are packed one bit per register
 */
[[nodiscard]] static inline constexpr bool IsBitFunction(FunctionCode function_code) {
  return function_code == FunctionCode::kReadCoils || function_code == FunctionCode::kReadDI;
}

[[nodiscard]] static inline constexpr uint16_t GetMaxRegisterCount(FunctionCode function_code) {
  return IsBitFunction(function_code) ? kMaxBitRegisterCount : kMaxWordRegisterCount;
}

[[nodiscard]] static inline constexpr bool IsValidRegisterCount(FunctionCode function_code, uint16_t reg_count) {
  return reg_count >= kMinRegisterCount && reg_count <= GetMaxRegisterCount(function_code);
}

[[nodiscard]] static inline constexpr std::string_view ToString(FunctionCode function_code) {
  switch (function_code) {
    case FunctionCode::kReadCoils:
      return "ReadCoils";
    case FunctionCode::kReadDI:
      return "ReadDiscreteInputs";
    case FunctionCode::kReadHR:
      return "ReadHoldingRegisters";
    case FunctionCode::kReadIR:
      return "ReadInputRegisters";
  }
  return "Unknown";
}

}  // namespace litemb
