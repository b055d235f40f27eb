#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "../common/errors.hpp"
#include "../common/exception_code.hpp"
#include "../common/function_code.hpp"
#include "../transport/byte_reader.hpp"
#include "../transport/byte_writer.hpp"
#include "response_parser.hpp"
#include "tcp_request.hpp"
#include "tcp_response.hpp"

namespace litemb {

/**
 * @brief Outcome of a read performed over a transport
 *
 * Adds construction and transport failures to the codec's ReadResult.
 */
using ClientResult = std::variant<TcpResponse, ModbusException, ProtocolError, TransportError, ConstructionError>;

/**
 * @brief Modbus TCP read client
 *
 * Performs one request/response exchange per call over a caller-owned
 * transport. The client never opens or closes the stream and never retries.
 */
class TcpClient {
 public:
  /**
   * @brief Construct a Modbus TCP client
   * @param transport Connected transport for byte I/O
   */
  explicit TcpClient(ByteTransport &transport)
      : transport_(transport) {}

  /**
   * @brief Send a request and parse its response
   *
   * Reads the minimum frame (an exception response) first. Unless the server
   * answered with an exception, reads on up to the size the MBAP length field
   * announces, capped at the predicted response length.
   * @return Decoded response, server exception, protocol error, or transport error
   */
  [[nodiscard]] ClientResult Read(const TcpRequest &request);

  /**
   * @brief Read coils from a unit
   * @param unit_id Target unit ID
   * @param start_address Starting coil address
   * @param count Number of coils to read (1..2000)
   */
  [[nodiscard]] ClientResult ReadCoils(uint8_t unit_id, uint16_t start_address, uint16_t count);

  /**
   * @brief Read discrete inputs from a unit
   * @param unit_id Target unit ID
   * @param start_address Starting discrete input address
   * @param count Number of discrete inputs to read (1..2000)
   */
  [[nodiscard]] ClientResult ReadDiscreteInputs(uint8_t unit_id, uint16_t start_address, uint16_t count);

  /**
   * @brief Read holding registers from a unit
   * @param unit_id Target unit ID
   * @param start_address Starting register address
   * @param count Number of registers to read (1..125)
   */
  [[nodiscard]] ClientResult ReadHoldingRegisters(uint8_t unit_id, uint16_t start_address, uint16_t count);

  /**
   * @brief Read input registers from a unit
   * @param unit_id Target unit ID
   * @param start_address Starting register address
   * @param count Number of registers to read (1..125)
   */
  [[nodiscard]] ClientResult ReadInputRegisters(uint8_t unit_id, uint16_t start_address, uint16_t count);

  /**
   * @brief Get the next transaction ID (auto-increments)
   */
  [[nodiscard]] uint16_t GetNextTransactionId() { return next_transaction_id_++; }

 private:
  [[nodiscard]] ClientResult ReadFunction(FunctionCode function_code, uint8_t unit_id, uint16_t start_address,
                                          uint16_t count);

  /**
   * @brief Read until buffer is full
   * @return Empty on success, otherwise the reason the stream ended early
   */
  [[nodiscard]] std::optional<TransportError> ReadExactly(std::vector<uint8_t> &frame, size_t size);

  ByteTransport &transport_;
  uint16_t next_transaction_id_{TcpRequest::kDefaultTransactionId};
};

}  // namespace litemb
