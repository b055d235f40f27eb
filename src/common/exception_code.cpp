#include <cstdint>
#include <string_view>
#include "common/exception_code.hpp"

namespace litemb {

ExceptionCode ModbusException::GetCode() const noexcept {
  switch (raw_code_) {
    case 0x01:
    case 0x02:
    case 0x03:
    case 0x04:
    case 0x05:
    case 0x06:
    case 0x07:
    case 0x08:
    case 0x0A:
    case 0x0B:
      return static_cast<ExceptionCode>(raw_code_);
    default:
      return ExceptionCode::kUnknown;
  }
}

std::string_view ModbusException::GetName() const noexcept {
  return ToString(GetCode());
}

std::string_view ModbusException::GetDescription() const noexcept {
  switch (GetCode()) {
    case ExceptionCode::kIllegalFunction:
      return "The function code received in the query is not an allowable action for the server.";
    case ExceptionCode::kIllegalDataAddress:
      return "The data address received in the query is not an allowable address for the server.";
    case ExceptionCode::kIllegalDataValue:
      return "A value contained in the query data field is not an allowable value for the server.";
    case ExceptionCode::kServerDeviceFailure:
      return "An unrecoverable error occurred while the server was attempting to perform the requested action.";
    case ExceptionCode::kAcknowledge:
      return "The server has accepted the request and is processing it, but a long duration of time will be "
             "required to do so.";
    case ExceptionCode::kServerDeviceBusy:
      return "The server is engaged in processing a long-duration program command.";
    case ExceptionCode::kNegativeAcknowledge:
      return "The server cannot perform the program function received in the query.";
    case ExceptionCode::kMemoryParityError:
      return "The server attempted to read extended memory or record file, but detected a parity error in memory.";
    case ExceptionCode::kGatewayPathUnavailable:
      return "The gateway was unable to allocate an internal communication path from the input port to the output "
             "port for processing the request.";
    case ExceptionCode::kGatewayTargetDeviceFailedToRespond:
      return "No response was obtained from the target device.";
    case ExceptionCode::kUnknown:
      break;
  }
  return "The server returned an exception code outside the standard table.";
}

std::string_view ToString(ExceptionCode code) noexcept {
  switch (code) {
    case ExceptionCode::kIllegalFunction:
      return "IllegalFunction";
    case ExceptionCode::kIllegalDataAddress:
      return "IllegalDataAddress";
    case ExceptionCode::kIllegalDataValue:
      return "IllegalDataValue";
    case ExceptionCode::kServerDeviceFailure:
      return "ServerDeviceFailure";
    case ExceptionCode::kAcknowledge:
      return "Acknowledge";
    case ExceptionCode::kServerDeviceBusy:
      return "ServerDeviceBusy";
    case ExceptionCode::kNegativeAcknowledge:
      return "NegativeAcknowledge";
    case ExceptionCode::kMemoryParityError:
      return "MemoryParityError";
    case ExceptionCode::kGatewayPathUnavailable:
      return "GatewayPathUnavailable";
    case ExceptionCode::kGatewayTargetDeviceFailedToRespond:
      return "GatewayTargetDeviceFailedToRespond";
    case ExceptionCode::kUnknown:
      break;
  }
  return "UnknownException";
}

}  // namespace litemb
