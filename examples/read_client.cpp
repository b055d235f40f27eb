/**
 * @file read_client.cpp
 * @brief Command line Modbus TCP read client
 *
 * Connects to a Modbus TCP server, performs one read and prints the registers.
 *
 * Usage:
 *   ./read_client [--host addr] [--port n] [--unit id] [--function 1-4] [--address n] [--count n]
 *
 * Example:
 *   ./read_client --host 127.0.0.1 --port 5502 --function 3 --address 0 --count 10
 */

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <span>
#include <variant>
#include "lite_modbus/client/client_config.hpp"
#include "lite_modbus/common/errors.hpp"
#include "lite_modbus/common/exception_code.hpp"
#include "lite_modbus/tcp/tcp_client.hpp"
#include "lite_modbus/tcp/tcp_frame.hpp"
#include "lite_modbus/tcp/tcp_request.hpp"
#include "lite_modbus/tcp/tcp_response.hpp"
#include "lite_modbus/transport/tcp_client_transport.hpp"

using litemb::ClientConfig;
using litemb::ClientResult;
using litemb::ConfigError;
using litemb::ConstructionError;
using litemb::ModbusException;
using litemb::ProtocolError;
using litemb::TcpClient;
using litemb::TcpClientTransport;
using litemb::TcpFrame;
using litemb::TcpRequest;
using litemb::TcpResponse;
using litemb::TransportError;

namespace {

void DumpFrame(const char *label, std::span<const uint8_t> frame) {
  std::cout << label;
  for (uint8_t byte : frame) {
    std::cout << ' ' << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  std::cout << std::dec << std::setfill(' ') << "\n";
}

int PrintResult(const ClientConfig &config, const ClientResult &result) {
  if (const auto *response = std::get_if<TcpResponse>(&result)) {
    if (config.verbose) {
      DumpFrame("payload:", response->GetPayload());
    }
    if (const auto *bits = response->GetBitRegisters()) {
      for (size_t i = 0; i < bits->size(); ++i) {
        std::cout << (config.start_address + i) << ": " << ((*bits)[i] ? "ON" : "OFF") << "\n";
      }
    } else if (const auto *words = response->GetWordRegisters()) {
      for (size_t i = 0; i < words->size(); ++i) {
        std::cout << (config.start_address + i) << ": " << (*words)[i] << "\n";
      }
    }
    return 0;
  }

  if (const auto *exception = std::get_if<ModbusException>(&result)) {
    std::cerr << "Server exception " << static_cast<int>(exception->GetRawCode()) << " (" << exception->GetName()
              << "): " << exception->GetDescription() << "\n";
    return 2;
  }
  if (const auto *error = std::get_if<ProtocolError>(&result)) {
    std::cerr << "Protocol error: " << litemb::ToString(*error) << "\n";
    return 3;
  }
  if (const auto *error = std::get_if<TransportError>(&result)) {
    std::cerr << "Transport error: " << litemb::ToString(*error) << "\n";
    return 4;
  }
  std::cerr << "Invalid request: " << litemb::ToString(std::get<ConstructionError>(result)) << "\n";
  return 1;
}

}  // namespace

int main(int argc, char *argv[]) {
  auto parsed = litemb::ParseClientConfig(argc, argv);
  if (const auto *error = std::get_if<ConfigError>(&parsed)) {
    std::cerr << error->message << "\n\n" << litemb::ClientUsage();
    return 1;
  }
  const auto &config = std::get<ClientConfig>(parsed);
  if (config.show_help) {
    std::cout << litemb::ClientUsage();
    return 0;
  }

  auto built = litemb::BuildRequest(config);
  if (const auto *error = std::get_if<ConstructionError>(&built)) {
    std::cerr << "Invalid request: " << litemb::ToString(*error) << "\n";
    return 1;
  }
  const auto &request = std::get<TcpRequest>(built);

  auto connected = TcpClientTransport::Connect(config.host, config.port, config.timeout_ms);
  if (const auto *error = std::get_if<TransportError>(&connected)) {
    std::cerr << "Failed to connect to " << config.host << ":" << config.port << ": " << litemb::ToString(*error)
              << "\n";
    return 4;
  }
  auto &transport = std::get<TcpClientTransport>(connected);

  if (config.verbose) {
    DumpFrame("request:", TcpFrame::EncodeRequest(request));
    std::cout << "expecting " << TcpFrame::ExpectedResponseLength(request) << " bytes\n";
  }

  TcpClient client(transport);
  const int status = PrintResult(config, client.Read(request));

  transport.Close();
  return status;
}
