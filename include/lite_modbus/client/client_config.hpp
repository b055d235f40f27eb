#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include "../common/errors.hpp"
#include "../tcp/tcp_request.hpp"

namespace litemb {

/**
 * @brief Settings for a single read performed by the command line client
 */
struct ClientConfig {
  static constexpr uint16_t kDefaultPort = 502;
  static constexpr uint32_t kDefaultTimeoutMs = 1000;
  static constexpr uint32_t kMaxTimeoutMs = static_cast<uint32_t>(std::numeric_limits<int32_t>::max());

  std::string host{"127.0.0.1"};
  uint16_t port{kDefaultPort};
  uint32_t timeout_ms{kDefaultTimeoutMs};
  uint8_t unit_id{1};
  uint16_t transaction_id{TcpRequest::kDefaultTransactionId};
  uint8_t function_code{static_cast<uint8_t>(FunctionCode::kReadCoils)};
  uint16_t start_address{0};
  uint16_t count{8};
  bool verbose{false};
  bool show_help{false};
};

struct ConfigError {
  /** Set when the value parsed but is not acceptable for a request */
  std::optional<ConstructionError> kind;
  std::string message;
};

using ConfigResult = std::variant<ClientConfig, ConfigError>;

/**
 * @brief Parse command line options (program name excluded)
 *
 * Options: --host, --port, --timeout, --unit, --transaction, --function,
 * --address, --count, --verbose, --help. Each option taking a value accepts
 * "--opt value" or "--opt=value"; numbers may be decimal or 0x-prefixed hex.
 */
[[nodiscard]] ConfigResult ParseClientConfig(std::span<const char *const> args);

/**
 * @brief Parse main()'s arguments, skipping the program name
 *
 * Tolerates argc == 0.
 */
[[nodiscard]] ConfigResult ParseClientConfig(int argc, char *argv[]);

/**
 * @brief Validate the request part of a configuration
 */
[[nodiscard]] TcpRequest::BuildResult BuildRequest(const ClientConfig &config);

[[nodiscard]] std::string_view ClientUsage() noexcept;

}  // namespace litemb
