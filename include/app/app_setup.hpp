#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

namespace app {

struct CommandLineOptions {
  std::string pipe_name;
  std::optional<std::string> config_path;
  std::optional<std::string> log_file;
};

/// Parse --pipe=<name> (required), --config=<path> and --log-file=<path>
/// Returns nullopt when the pipe is missing or an argument is unknown
auto ParseCommandLine(const std::vector<std::string>& args)
    -> std::optional<CommandLineOptions>;

/// Setup named loggers for transport, jsonrpc and maills
/// Logs go to stderr, and also to log_file when given
auto SetupLoggers(const std::optional<std::string>& log_file = std::nullopt)
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

}  // namespace app
