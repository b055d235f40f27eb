#include <string_view>
#include "common/errors.hpp"

namespace litemb {

std::string_view ToString(ConstructionError error) noexcept {
  switch (error) {
    case ConstructionError::kUnsupportedFunction:
      return "UnsupportedFunction";
    case ConstructionError::kOutOfRange:
      return "OutOfRange";
  }
  return "ConstructionError";
}

std::string_view ToString(ProtocolError error) noexcept {
  switch (error) {
    case ProtocolError::kTransactionMismatch:
      return "TransactionMismatch";
    case ProtocolError::kUnrecognizedFunctionEcho:
      return "UnrecognizedFunctionEcho";
    case ProtocolError::kMalformedResponse:
      return "MalformedResponse";
  }
  return "ProtocolError";
}

std::string_view ToString(TransportError error) noexcept {
  switch (error) {
    case TransportError::kResolveFailed:
      return "ResolveFailed";
    case TransportError::kConnectFailed:
      return "ConnectFailed";
    case TransportError::kConnectTimeout:
      return "ConnectTimeout";
    case TransportError::kNotConnected:
      return "NotConnected";
    case TransportError::kWriteFailed:
      return "WriteFailed";
    case TransportError::kReadFailed:
      return "ReadFailed";
    case TransportError::kReadTimeout:
      return "ReadTimeout";
    case TransportError::kConnectionClosed:
      return "ConnectionClosed";
  }
  return "TransportError";
}

}  // namespace litemb
