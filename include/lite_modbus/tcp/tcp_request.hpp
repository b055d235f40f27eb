#pragma once

#include <cstdint>
#include <optional>
#include <variant>
#include "../common/address_span.hpp"
#include "../common/errors.hpp"
#include "../common/function_code.hpp"

namespace litemb {

/**
 * @brief Validated Modbus TCP read request
 *
 * Instances only exist in a valid state: the function code is one of the four
 * read functions and the register count lies in the range that function
 * allows. Use TcpRequest::Builder or TcpRequest::Create to obtain one.
 */
class TcpRequest {
 public:
  static constexpr uint16_t kDefaultTransactionId{1};

  struct Header {
    uint16_t transaction_id;
    uint8_t unit_id;
    FunctionCode function_code;
  };

  class Builder;
  using BuildResult = std::variant<TcpRequest, ConstructionError>;

  /**
   * @brief Validate and create a request in one step
   * @param header Transaction id, unit id and function code
   * @param address_span Start address and register count
   * @return The request, or kUnsupportedFunction / kOutOfRange
   */
  [[nodiscard]] static BuildResult Create(Header header, AddressSpan address_span);

  [[nodiscard]] uint16_t GetTransactionId() const noexcept { return header_.transaction_id; }
  [[nodiscard]] uint8_t GetUnitId() const noexcept { return header_.unit_id; }
  [[nodiscard]] FunctionCode GetFunctionCode() const noexcept { return header_.function_code; }
  [[nodiscard]] uint16_t GetStartAddress() const noexcept { return address_span_.start_address; }
  [[nodiscard]] uint16_t GetRegisterCount() const noexcept { return address_span_.reg_count; }
  [[nodiscard]] AddressSpan GetAddressSpan() const noexcept { return address_span_; }

  /** Number of data bytes a successful response carries after the byte count field */
  [[nodiscard]] uint16_t GetExpectedByteCount() const noexcept;

 private:
  TcpRequest(Header header, AddressSpan address_span)
      : header_(header),
        address_span_(address_span) {}

  Header header_;
  AddressSpan address_span_;
};

/**
 * @brief Collects request fields in any order and validates them together
 *
 * Nothing is checked until Build(), so the register count is always checked
 * against the function code that is finally bound, whichever was set last.
 */
class TcpRequest::Builder {
 public:
  Builder &SetTransactionId(uint16_t transaction_id) {
    transaction_id_ = transaction_id;
    return *this;
  }
  Builder &SetUnitId(uint8_t unit_id) {
    unit_id_ = unit_id;
    return *this;
  }
  Builder &SetFunctionCode(FunctionCode function_code) {
    function_code_ = static_cast<uint8_t>(function_code);
    return *this;
  }
  Builder &SetFunctionCode(uint8_t raw_function_code) {
    function_code_ = raw_function_code;
    return *this;
  }
  Builder &SetStartAddress(uint16_t start_address) {
    start_address_ = start_address;
    return *this;
  }
  Builder &SetRegisterCount(uint16_t reg_count) {
    reg_count_ = reg_count;
    return *this;
  }

  /**
   * @brief Validate all fields against each other
   * @return The request, kUnsupportedFunction if the function code is missing or
   * not a read function, kOutOfRange if the register count is missing or outside
   * the range of the bound function code
   */
  [[nodiscard]] BuildResult Build() const;

 private:
  uint16_t transaction_id_{kDefaultTransactionId};
  uint8_t unit_id_{0};
  std::optional<uint8_t> function_code_{};
  uint16_t start_address_{0};
  std::optional<uint16_t> reg_count_{};
};

/**
 * @brief Check a register count against the limits of a read function
 * @return Empty if valid, kOutOfRange otherwise
 */
[[nodiscard]] std::optional<ConstructionError> ValidateRegisterCount(FunctionCode function_code,
                                                                     uint16_t reg_count) noexcept;

}  // namespace litemb
