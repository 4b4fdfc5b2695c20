#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <optional>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "maills/contacts/contact_source_loader.hpp"
#include "maills/error/error.hpp"
#include "maills/utils/canonical_path.hpp"

namespace maills {

struct FeatureToggles {
  bool completion = true;
  bool hover = true;
  bool code_actions = true;
  bool goto_definition = true;
  bool diagnostics = true;
};

// Effective settings: built-in defaults, then the YAML config file, then
// the client's initializationOptions
struct ServerConfig {
  std::optional<std::filesystem::path> vcard_dir;
  std::optional<std::filesystem::path> contact_list_file;
  FeatureToggles features;

  [[nodiscard]] auto ContactSources() const -> contacts::ContactSourceOptions {
    return {.vcard_dir = vcard_dir, .contact_list_file = contact_list_file};
  }
};

// Contents of the user's config.yaml:
//
//   VcardDir: ~/.contacts
//   ContactListFile: ~/.contacts/list.txt
//   Features:
//     Completion: true
//     Hover: true
//     CodeActions: true
//     GotoDefinition: true
//     Diagnostics: false
class MaillsConfigFile {
 public:
  explicit MaillsConfigFile(std::shared_ptr<spdlog::logger> logger = nullptr);

  // $MAILLS_CONFIG, else $XDG_CONFIG_HOME/maills/config.yaml, else
  // ~/.config/maills/config.yaml
  static auto Locate() -> std::optional<CanonicalPath>;

  // Returns std::nullopt if the file doesn't exist or cannot be parsed
  static auto LoadFromFile(
      const CanonicalPath& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<MaillsConfigFile>;

  [[nodiscard]] auto GetVcardDir() const
      -> const std::optional<std::filesystem::path>& {
    return vcard_dir_;
  }

  [[nodiscard]] auto GetContactListFile() const
      -> const std::optional<std::filesystem::path>& {
    return contact_list_file_;
  }

  // Overrides only the settings present in the file
  void ApplyTo(ServerConfig& config) const;

 private:
  std::shared_ptr<spdlog::logger> logger_;

  std::optional<std::filesystem::path> vcard_dir_;
  std::optional<std::filesystem::path> contact_list_file_;

  std::optional<bool> completion_;
  std::optional<bool> hover_;
  std::optional<bool> code_actions_;
  std::optional<bool> goto_definition_;
  std::optional<bool> diagnostics_;
};

// Applies vcard_dir, contact_list_file and the enable_* keys. A value of the
// wrong type fails with kInvalidConfig and leaves config untouched.
auto ApplyInitializationOptions(
    const nlohmann::json& options, ServerConfig& config)
    -> std::expected<void, MaillsError>;

// Defaults, then the located config file, then initialization_options
auto LoadServerConfig(
    const std::optional<nlohmann::json>& initialization_options,
    std::shared_ptr<spdlog::logger> logger = nullptr)
    -> std::expected<ServerConfig, MaillsError>;

}  // namespace maills
