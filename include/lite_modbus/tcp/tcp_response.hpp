#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <variant>
#include <vector>
#include "../common/function_code.hpp"

namespace litemb {

/**
 * @brief Successfully parsed read response
 *
 * Holds the MBAP fields echoed by the server, the raw payload and the decoded
 * registers: booleans for coils/discrete inputs, 16-bit words for holding/input
 * registers. Built by ResponseParser only.
 */
class TcpResponse {
 public:
  using BitRegisters = std::vector<bool>;
  using WordRegisters = std::vector<uint16_t>;
  using Registers = std::variant<BitRegisters, WordRegisters>;

  struct Header {
    uint16_t transaction_id;
    uint16_t length;
    uint8_t unit_id;
    FunctionCode function_code;
  };

  TcpResponse(Header header, std::vector<uint8_t> payload, Registers registers)
      : header_(header),
        payload_(std::move(payload)),
        registers_(std::move(registers)) {}

  [[nodiscard]] uint16_t GetTransactionId() const noexcept { return header_.transaction_id; }
  [[nodiscard]] uint16_t GetLength() const noexcept { return header_.length; }
  [[nodiscard]] uint8_t GetUnitId() const noexcept { return header_.unit_id; }
  [[nodiscard]] FunctionCode GetFunctionCode() const noexcept { return header_.function_code; }
  [[nodiscard]] uint8_t GetByteCount() const noexcept { return static_cast<uint8_t>(payload_.size()); }
  [[nodiscard]] std::span<const uint8_t> GetPayload() const noexcept { return payload_; }

  [[nodiscard]] bool HasBitRegisters() const noexcept { return std::holds_alternative<BitRegisters>(registers_); }
  [[nodiscard]] bool HasWordRegisters() const noexcept { return std::holds_alternative<WordRegisters>(registers_); }

  /**
   * @brief Decoded coils/discrete inputs
   * @return Pointer to the values, nullptr for a word function response
   */
  [[nodiscard]] const BitRegisters *GetBitRegisters() const noexcept { return std::get_if<BitRegisters>(&registers_); }

  /**
   * @brief Decoded holding/input registers
   * @return Pointer to the values, nullptr for a bit function response
   */
  [[nodiscard]] const WordRegisters *GetWordRegisters() const noexcept {
    return std::get_if<WordRegisters>(&registers_);
  }

  [[nodiscard]] const Registers &GetRegisters() const noexcept { return registers_; }

  /** Number of decoded registers */
  [[nodiscard]] size_t GetRegisterCount() const noexcept;

 private:
  Header header_;
  std::vector<uint8_t> payload_;
  Registers registers_;
};

inline size_t TcpResponse::GetRegisterCount() const noexcept {
  return std::visit([](const auto &values) { return values.size(); }, registers_);
}

}  // namespace litemb
