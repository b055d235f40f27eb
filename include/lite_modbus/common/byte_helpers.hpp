#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace litemb {

static constexpr uint8_t kMaxByte = 0xFF;
static constexpr uint8_t kBitsPerByte = 8;

static inline constexpr uint8_t GetLowByte(uint16_t value) {
  return value & kMaxByte;
}

static inline constexpr uint8_t GetHighByte(uint16_t value) {
  return (value >> kBitsPerByte) & kMaxByte;
}

// Modbus is big-endian on the wire: high byte first
static inline constexpr uint16_t MakeU16(uint8_t high_byte, uint8_t low_byte) {
  return static_cast<uint16_t>(static_cast<uint16_t>(high_byte) << kBitsPerByte | static_cast<uint16_t>(low_byte));
}

/**
 * @brief Read a big-endian 16-bit value at offset
 * @note Caller guarantees offset + 1 < bytes.size()
 */
static inline constexpr uint16_t ReadU16(std::span<const uint8_t> bytes, size_t offset) {
  return MakeU16(bytes[offset], bytes[offset + 1]);
}

static inline constexpr void WriteU16(uint16_t value, uint8_t *out) {
  out[0] = GetHighByte(value);
  out[1] = GetLowByte(value);
}

}  // namespace litemb
