#include "app/app_setup.hpp"

#include <array>
#include <cstdlib>
#include <string_view>
#include <unordered_map>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace app {

namespace {

constexpr std::string_view kDefaultLogLevel = "debug";
constexpr std::string_view kLogPattern = "[%n][%L] %v";

constexpr std::string_view kPipePrefix = "--pipe=";
constexpr std::string_view kConfigPrefix = "--config=";
constexpr std::string_view kLogFilePrefix = "--log-file=";

struct LoggerConfig {
  std::string_view name;
  spdlog::level::level_enum level;
};

auto ParseLogLevel(std::string_view level_str) -> spdlog::level::level_enum {
  static const std::unordered_map<std::string_view, spdlog::level::level_enum>
      kLevelMap = {
          {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
          {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
          {"error", spdlog::level::err},   {"off", spdlog::level::off},
      };

  if (auto it = kLevelMap.find(level_str); it != kLevelMap.end()) {
    return it->second;
  }
  return spdlog::level::debug;
}

auto GetLogLevelFromEnv() -> spdlog::level::level_enum {
  const char* env_level = std::getenv("SPDLOG_LEVEL");
  return ParseLogLevel(env_level != nullptr ? env_level : kDefaultLogLevel);
}

}  // namespace

auto ParseCommandLine(const std::vector<std::string>& args)
    -> std::optional<CommandLineOptions> {
  CommandLineOptions options;
  for (std::size_t i = 1; i < args.size(); ++i) {
    const std::string_view arg = args[i];
    if (arg.starts_with(kPipePrefix)) {
      options.pipe_name = arg.substr(kPipePrefix.length());
    } else if (arg.starts_with(kConfigPrefix)) {
      options.config_path = std::string(arg.substr(kConfigPrefix.length()));
    } else if (arg.starts_with(kLogFilePrefix)) {
      options.log_file = std::string(arg.substr(kLogFilePrefix.length()));
    } else {
      return std::nullopt;
    }
  }

  if (options.pipe_name.empty()) {
    return std::nullopt;
  }
  return options;
}

auto SetupLoggers(const std::optional<std::string>& log_file)
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> {
  const auto user_log_level = GetLogLevelFromEnv();
  spdlog::set_level(user_log_level);

  // One set of sinks shared by every logger
  std::vector<spdlog::sink_ptr> sinks{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (log_file) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(*log_file));
  }

  constexpr std::array kLoggerConfigs = {
      LoggerConfig{.name = "transport", .level = spdlog::level::info},
      LoggerConfig{.name = "jsonrpc", .level = spdlog::level::info},
      LoggerConfig{.name = "maills", .level = spdlog::level::trace},
  };

  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;

  for (const auto& config : kLoggerConfigs) {
    auto logger = std::make_shared<spdlog::logger>(
        std::string(config.name), sinks.begin(), sinks.end());
    logger->set_pattern(std::string(kLogPattern));
    logger->set_level(
        config.name == "maills" ? user_log_level : config.level);
    logger->flush_on(spdlog::level::debug);
    spdlog::register_logger(logger);
    loggers[std::string(config.name)] = std::move(logger);
  }

  spdlog::set_default_logger(loggers["maills"]);
  return loggers;
}

}  // namespace app
