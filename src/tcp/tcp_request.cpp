#include <cstdint>
#include <optional>
#include <variant>
#include "common/address_span.hpp"
#include "common/byte_helpers.hpp"
#include "common/errors.hpp"
#include "common/function_code.hpp"
#include "tcp/tcp_request.hpp"

namespace litemb {

static constexpr uint16_t kCoilByteCountRoundingOffset{kBitsPerByte - 1};
static constexpr uint16_t kBytesPerWordRegister{2};

std::optional<ConstructionError> ValidateRegisterCount(FunctionCode function_code, uint16_t reg_count) noexcept {
  if (!IsValidRegisterCount(function_code, reg_count)) {
    return ConstructionError::kOutOfRange;
  }
  return {};
}

TcpRequest::BuildResult TcpRequest::Create(Header header, AddressSpan address_span) {
  // Header may carry a value cast from an arbitrary byte
  if (!ToFunctionCode(static_cast<uint8_t>(header.function_code)).has_value()) {
    return ConstructionError::kUnsupportedFunction;
  }
  if (auto error = ValidateRegisterCount(header.function_code, address_span.reg_count); error.has_value()) {
    return *error;
  }
  return TcpRequest(header, address_span);
}

uint16_t TcpRequest::GetExpectedByteCount() const noexcept {
  if (IsBitFunction(header_.function_code)) {
    return static_cast<uint16_t>((address_span_.reg_count + kCoilByteCountRoundingOffset) / kBitsPerByte);
  }
  return static_cast<uint16_t>(address_span_.reg_count * kBytesPerWordRegister);
}

TcpRequest::BuildResult TcpRequest::Builder::Build() const {
  if (!function_code_.has_value()) {
    return ConstructionError::kUnsupportedFunction;
  }
  auto function_code = ToFunctionCode(*function_code_);
  if (!function_code.has_value()) {
    return ConstructionError::kUnsupportedFunction;
  }
  if (!reg_count_.has_value()) {
    return ConstructionError::kOutOfRange;
  }

  return Create({transaction_id_, unit_id_, *function_code}, {start_address_, *reg_count_});
}

}  // namespace litemb
