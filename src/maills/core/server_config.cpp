#include "maills/core/server_config.hpp"

#include <cstdlib>
#include <string>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "maills/utils/path_utils.hpp"

namespace maills {

namespace {

auto GetEnv(const char* name) -> std::optional<std::string> {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

// "~/" expands against $HOME; other relative paths resolve against base
auto ResolveConfiguredPath(
    const std::string& raw, const std::filesystem::path& base)
    -> std::filesystem::path {
  auto path = ExpandHomePath(raw);
  if (path.is_relative() && !base.empty()) {
    return base / path;
  }
  return path;
}

void ReadToggle(
    const YAML::Node& features, const char* key, std::optional<bool>& out) {
  if (features[key]) {
    out = features[key].as<bool>();
  }
}

auto ReadPathOption(
    const nlohmann::json& options, const char* key,
    std::optional<std::filesystem::path>& out)
    -> std::expected<void, MaillsError> {
  auto it = options.find(key);
  if (it == options.end() || it->is_null()) {
    return {};
  }
  if (!it->is_string()) {
    return MaillsError::Unexpected(
        MaillsErrorCode::kInvalidConfig,
        fmt::format("{} must be a string, got {}", key, it->type_name()));
  }
  auto raw = it->get<std::string>();
  if (raw.empty()) {
    out.reset();
  } else {
    out = ExpandHomePath(raw);
  }
  return {};
}

auto ReadBoolOption(const nlohmann::json& options, const char* key, bool& out)
    -> std::expected<void, MaillsError> {
  auto it = options.find(key);
  if (it == options.end() || it->is_null()) {
    return {};
  }
  if (!it->is_boolean()) {
    return MaillsError::Unexpected(
        MaillsErrorCode::kInvalidConfig,
        fmt::format("{} must be a boolean, got {}", key, it->type_name()));
  }
  out = it->get<bool>();
  return {};
}

}  // namespace

MaillsConfigFile::MaillsConfigFile(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto MaillsConfigFile::Locate() -> std::optional<CanonicalPath> {
  if (auto explicit_path = GetEnv("MAILLS_CONFIG")) {
    return CanonicalPath(ExpandHomePath(*explicit_path));
  }

  std::filesystem::path config_home;
  if (auto xdg = GetEnv("XDG_CONFIG_HOME")) {
    config_home = *xdg;
  } else if (auto home = GetEnv("HOME")) {
    config_home = std::filesystem::path(*home) / ".config";
  } else {
    return std::nullopt;
  }

  auto candidate = config_home / "maills" / "config.yaml";
  std::error_code ec;
  if (!std::filesystem::exists(candidate, ec)) {
    return std::nullopt;
  }
  return CanonicalPath(candidate);
}

auto MaillsConfigFile::LoadFromFile(
    const CanonicalPath& config_path, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<MaillsConfigFile> {
  MaillsConfigFile config(logger);

  if (!std::filesystem::exists(config_path.Path())) {
    config.logger_->debug("No configuration file found at {}", config_path);
    return std::nullopt;
  }

  const auto base = config_path.Path().parent_path();
  try {
    YAML::Node yaml = YAML::LoadFile(config_path.String());

    if (yaml["VcardDir"]) {
      config.vcard_dir_ =
          ResolveConfiguredPath(yaml["VcardDir"].as<std::string>(), base);
    }

    if (yaml["ContactListFile"]) {
      config.contact_list_file_ = ResolveConfiguredPath(
          yaml["ContactListFile"].as<std::string>(), base);
    }

    if (const auto& features = yaml["Features"]) {
      ReadToggle(features, "Completion", config.completion_);
      ReadToggle(features, "Hover", config.hover_);
      ReadToggle(features, "CodeActions", config.code_actions_);
      ReadToggle(features, "GotoDefinition", config.goto_definition_);
      ReadToggle(features, "Diagnostics", config.diagnostics_);
    }

    config.logger_->debug("Loaded configuration from {}", config_path);
    return config;

  } catch (const YAML::Exception& e) {
    config.logger_->error(
        "Error parsing configuration file {}: {}", config_path, e.what());
    return std::nullopt;
  }
}

void MaillsConfigFile::ApplyTo(ServerConfig& config) const {
  if (vcard_dir_) {
    config.vcard_dir = vcard_dir_;
  }
  if (contact_list_file_) {
    config.contact_list_file = contact_list_file_;
  }
  auto& features = config.features;
  features.completion = completion_.value_or(features.completion);
  features.hover = hover_.value_or(features.hover);
  features.code_actions = code_actions_.value_or(features.code_actions);
  features.goto_definition =
      goto_definition_.value_or(features.goto_definition);
  features.diagnostics = diagnostics_.value_or(features.diagnostics);
}

auto ApplyInitializationOptions(
    const nlohmann::json& options, ServerConfig& config)
    -> std::expected<void, MaillsError> {
  if (options.is_null()) {
    return {};
  }
  if (!options.is_object()) {
    return MaillsError::Unexpected(
        MaillsErrorCode::kInvalidConfig,
        fmt::format(
            "initializationOptions must be an object, got {}",
            options.type_name()));
  }

  auto updated = config;
  auto& features = updated.features;
  for (auto result :
       {ReadPathOption(options, "vcard_dir", updated.vcard_dir),
        ReadPathOption(
            options, "contact_list_file", updated.contact_list_file),
        ReadBoolOption(options, "enable_completion", features.completion),
        ReadBoolOption(options, "enable_hover", features.hover),
        ReadBoolOption(options, "enable_code_actions", features.code_actions),
        ReadBoolOption(
            options, "enable_goto_definition", features.goto_definition),
        ReadBoolOption(options, "enable_diagnostics", features.diagnostics)}) {
    if (!result) {
      return std::unexpected(result.error());
    }
  }

  config = std::move(updated);
  return {};
}

auto LoadServerConfig(
    const std::optional<nlohmann::json>& initialization_options,
    std::shared_ptr<spdlog::logger> logger)
    -> std::expected<ServerConfig, MaillsError> {
  logger = logger ? logger : spdlog::default_logger();

  ServerConfig config;
  if (auto path = MaillsConfigFile::Locate()) {
    if (auto file = MaillsConfigFile::LoadFromFile(*path, logger)) {
      file->ApplyTo(config);
    }
  }

  if (initialization_options) {
    auto applied = ApplyInitializationOptions(*initialization_options, config);
    if (!applied) {
      return std::unexpected(applied.error());
    }
  }

  logger->debug(
      "Configuration: vcard_dir={}, contact_list_file={}",
      config.vcard_dir ? config.vcard_dir->string() : "<none>",
      config.contact_list_file ? config.contact_list_file->string()
                               : "<none>");
  return config;
}

}  // namespace maills
