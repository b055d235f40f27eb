#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>
#include "client/client_config.hpp"
#include "common/errors.hpp"
#include "common/function_code.hpp"
#include "tcp/tcp_request.hpp"

namespace litemb {

namespace {

constexpr std::string_view kUsage =
    "Usage: read_client [options]\n"
    "  --host <addr>          server address or host name (default 127.0.0.1)\n"
    "  --port <n>             server port (default 502)\n"
    "  --timeout <ms>         connect and read timeout, at most 2147483647 (default 1000)\n"
    "  --unit <id>            unit id 0..255 (default 1)\n"
    "  --transaction <id>     transaction id 0..65535 (default 1)\n"
    "  --function <code>      1 coils, 2 discrete inputs, 3 holding, 4 input registers (default 1)\n"
    "  --address <n>          starting address 0..65535 (default 0)\n"
    "  --count <n>            number of registers (default 8)\n"
    "  --verbose              dump request and response frames\n"
    "  --help                 show this text\n";

std::optional<uint64_t> ParseNumber(std::string_view text) {
  int base = 10;
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
    base = 16;
  }
  if (text.empty()) {
    return {};
  }
  uint64_t value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
  if (ec != std::errc{} || end != text.data() + text.size()) {
    return {};
  }
  return value;
}

template <typename T>
std::optional<ConfigError> AssignNumber(std::string_view option, std::string_view text, uint64_t min_value,
                                        T &out, uint64_t max_value = std::numeric_limits<T>::max()) {
  auto value = ParseNumber(text);
  if (!value.has_value()) {
    return ConfigError{{}, std::string(option) + ": not a number: " + std::string(text)};
  }
  if (*value < min_value || *value > max_value) {
    return ConfigError{ConstructionError::kOutOfRange, std::string(option) + ": value out of range: " +
                                                           std::string(text)};
  }
  out = static_cast<T>(*value);
  return {};
}

}  // namespace

ConfigResult ParseClientConfig(std::span<const char *const> args) {
  ClientConfig config;

  for (size_t i = 0; i < args.size(); ++i) {
    std::string_view arg{args[i]};

    if (arg == "--help" || arg == "-h") {
      config.show_help = true;
      continue;
    }
    if (arg == "--verbose" || arg == "-v") {
      config.verbose = true;
      continue;
    }

    std::string_view option = arg;
    std::optional<std::string_view> value{};
    if (auto eq = arg.find('='); eq != std::string_view::npos) {
      option = arg.substr(0, eq);
      value = arg.substr(eq + 1);
    } else if (i + 1 < args.size() && !std::string_view{args[i + 1]}.starts_with("--")) {
      value = std::string_view{args[++i]};
    }

    std::optional<ConfigError> error{};
    if (option == "--host") {
      if (!value.has_value() || value->empty()) {
        return ConfigError{{}, "--host: missing value"};
      }
      config.host = std::string(*value);
      continue;
    }
    if (!value.has_value()) {
      if (option.starts_with("--")) {
        return ConfigError{{}, std::string(option) + ": missing value"};
      }
      return ConfigError{{}, "unknown argument: " + std::string(arg)};
    }

    if (option == "--port") {
      error = AssignNumber(option, *value, 1, config.port);
    } else if (option == "--timeout") {
      error = AssignNumber(option, *value, 1, config.timeout_ms, ClientConfig::kMaxTimeoutMs);
    } else if (option == "--unit") {
      error = AssignNumber(option, *value, 0, config.unit_id);
    } else if (option == "--transaction") {
      error = AssignNumber(option, *value, 0, config.transaction_id);
    } else if (option == "--function") {
      error = AssignNumber(option, *value, 0, config.function_code);
      if (error.has_value() && error->kind.has_value()) {
        error->kind = ConstructionError::kUnsupportedFunction;
      } else if (!error.has_value() && !ToFunctionCode(config.function_code).has_value()) {
        error = ConfigError{ConstructionError::kUnsupportedFunction,
                            "--function: unsupported function code: " + std::string(*value)};
      }
    } else if (option == "--address") {
      error = AssignNumber(option, *value, 0, config.start_address);
    } else if (option == "--count") {
      error = AssignNumber(option, *value, 0, config.count);
    } else {
      return ConfigError{{}, "unknown option: " + std::string(option)};
    }

    if (error.has_value()) {
      return *error;
    }
  }

  return config;
}

ConfigResult ParseClientConfig(int argc, char *argv[]) {
  std::vector<const char *> args;
  if (argc > 1 && argv != nullptr) {
    args.assign(argv + 1, argv + argc);
  }
  return ParseClientConfig(args);
}

TcpRequest::BuildResult BuildRequest(const ClientConfig &config) {
  return TcpRequest::Builder{}
      .SetTransactionId(config.transaction_id)
      .SetUnitId(config.unit_id)
      .SetFunctionCode(config.function_code)
      .SetStartAddress(config.start_address)
      .SetRegisterCount(config.count)
      .Build();
}

std::string_view ClientUsage() noexcept {
  return kUsage;
}

}  // namespace litemb
