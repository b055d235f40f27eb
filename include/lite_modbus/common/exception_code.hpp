#pragma once

#include <cstdint>
#include <string_view>

namespace litemb {

enum class ExceptionCode : uint8_t {
  kUnknown = 0x00,
  kIllegalFunction = 0x01,
  kIllegalDataAddress = 0x02,
  kIllegalDataValue = 0x03,
  kServerDeviceFailure = 0x04,
  kAcknowledge = 0x05,
  kServerDeviceBusy = 0x06,
  kNegativeAcknowledge = 0x07,
  kMemoryParityError = 0x08,
  kGatewayPathUnavailable = 0x0A,
  kGatewayTargetDeviceFailedToRespond = 0x0B
};

/**
 * @brief Server reported fault carried by an exception response
 *
 * Keeps the raw exception byte so that codes outside the standard table are
 * reported as kUnknown without losing the value the server sent.
 */
class ModbusException {
 public:
  explicit constexpr ModbusException(uint8_t raw_code)
      : raw_code_(raw_code) {}

  [[nodiscard]] ExceptionCode GetCode() const noexcept;
  [[nodiscard]] uint8_t GetRawCode() const noexcept { return raw_code_; }
  [[nodiscard]] bool IsKnown() const noexcept { return GetCode() != ExceptionCode::kUnknown; }

  /** Short name, e.g. "IllegalDataAddress" */
  [[nodiscard]] std::string_view GetName() const noexcept;

  /** One sentence explanation of the fault */
  [[nodiscard]] std::string_view GetDescription() const noexcept;

  friend constexpr bool operator==(const ModbusException &lhs, const ModbusException &rhs) noexcept {
    return lhs.raw_code_ == rhs.raw_code_;
  }

 private:
  uint8_t raw_code_;
};

[[nodiscard]] std::string_view ToString(ExceptionCode code) noexcept;

}  // namespace litemb
