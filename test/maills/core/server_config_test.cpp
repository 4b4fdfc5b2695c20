#include "maills/core/server_config.hpp"

#include <cstdlib>
#include <string>

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "test/maills/common/file_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using maills::ApplyInitializationOptions;
using maills::CanonicalPath;
using maills::LoadServerConfig;
using maills::MaillsConfigFile;
using maills::MaillsErrorCode;
using maills::ServerConfig;
using maills::test::FileTestFixture;

TEST_CASE("ServerConfig defaults enable every feature", "[config]") {
  ServerConfig config;
  CHECK_FALSE(config.vcard_dir.has_value());
  CHECK_FALSE(config.contact_list_file.has_value());
  CHECK(config.features.completion);
  CHECK(config.features.hover);
  CHECK(config.features.code_actions);
  CHECK(config.features.goto_definition);
  CHECK(config.features.diagnostics);
}

TEST_CASE("MaillsConfigFile reads paths and toggles", "[config]") {
  FileTestFixture fixture("maills_config_test");
  auto path = fixture.CreateFile(
      "config.yaml",
      "VcardDir: cards\n"
      "ContactListFile: /srv/contacts/list.txt\n"
      "Features:\n"
      "  Hover: false\n"
      "  Diagnostics: false\n");

  auto file = MaillsConfigFile::LoadFromFile(path);
  REQUIRE(file.has_value());
  // Relative paths resolve against the config file's directory
  CHECK(file->GetVcardDir() == fixture.GetTempDir().Path() / "cards");
  CHECK(file->GetContactListFile() == "/srv/contacts/list.txt");

  ServerConfig config;
  file->ApplyTo(config);
  CHECK_FALSE(config.features.hover);
  CHECK_FALSE(config.features.diagnostics);
  // Keys absent from the file keep their defaults
  CHECK(config.features.completion);
  CHECK(config.features.code_actions);
  CHECK(config.ContactSources().vcard_dir == config.vcard_dir);
}

TEST_CASE("MaillsConfigFile rejects unusable files", "[config]") {
  FileTestFixture fixture("maills_config_test");

  SECTION("Missing file") {
    CHECK_FALSE(MaillsConfigFile::LoadFromFile(
                    CanonicalPath(fixture.GetTempDir().Path() / "none.yaml"))
                    .has_value());
  }

  SECTION("Broken YAML") {
    auto path = fixture.CreateFile("config.yaml", "VcardDir: [unterminated\n");
    CHECK_FALSE(MaillsConfigFile::LoadFromFile(path).has_value());
  }

  SECTION("Toggle of the wrong type") {
    auto path = fixture.CreateFile(
        "config.yaml", "Features:\n  Completion: sometimes\n");
    CHECK_FALSE(MaillsConfigFile::LoadFromFile(path).has_value());
  }
}

TEST_CASE("ApplyInitializationOptions overrides settings", "[config]") {
  ServerConfig config;
  config.vcard_dir = "/from/file";

  auto result = ApplyInitializationOptions(
      nlohmann::json{
          {"contact_list_file", "/from/client/list.txt"},
          {"enable_completion", false},
          {"enable_goto_definition", false},
          {"unrelated", 42}},
      config);

  REQUIRE(result.has_value());
  CHECK(config.vcard_dir == "/from/file");
  CHECK(config.contact_list_file == "/from/client/list.txt");
  CHECK_FALSE(config.features.completion);
  CHECK_FALSE(config.features.goto_definition);
  CHECK(config.features.hover);

  SECTION("Empty string clears a path") {
    auto cleared = ApplyInitializationOptions({{"vcard_dir", ""}}, config);
    REQUIRE(cleared.has_value());
    CHECK_FALSE(config.vcard_dir.has_value());
  }

  SECTION("Null leaves everything alone") {
    auto unchanged = ApplyInitializationOptions(nlohmann::json(), config);
    REQUIRE(unchanged.has_value());
    CHECK(config.vcard_dir == "/from/file");
  }
}

TEST_CASE("ApplyInitializationOptions rejects bad values", "[config]") {
  ServerConfig config;
  config.vcard_dir = "/kept";

  SECTION("Wrong value type") {
    auto result = ApplyInitializationOptions(
        {{"vcard_dir", "/changed"}, {"enable_hover", "no"}}, config);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == MaillsErrorCode::kInvalidConfig);
    CHECK_THAT(
        result.error().message(),
        Catch::Matchers::ContainsSubstring("enable_hover"));
  }

  SECTION("Not an object") {
    auto result = ApplyInitializationOptions(nlohmann::json::array(), config);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == MaillsErrorCode::kInvalidConfig);
  }

  // Nothing is applied from a rejected set of options
  CHECK(config.vcard_dir == "/kept");
  CHECK(config.features.hover);
}

TEST_CASE("LoadServerConfig layers file and client options", "[config]") {
  FileTestFixture fixture("maills_config_test");
  auto path = fixture.CreateFile(
      "config.yaml",
      "VcardDir: /file/cards\n"
      "Features:\n"
      "  Hover: false\n");
  ::setenv("MAILLS_CONFIG", path.String().c_str(), 1);

  auto config = LoadServerConfig(
      nlohmann::json{{"vcard_dir", "/client/cards"}, {"enable_hover", true}});
  REQUIRE(config.has_value());
  CHECK(config->vcard_dir == "/client/cards");
  CHECK(config->features.hover);

  auto file_only = LoadServerConfig(std::nullopt);
  REQUIRE(file_only.has_value());
  CHECK(file_only->vcard_dir == "/file/cards");
  CHECK_FALSE(file_only->features.hover);

  auto rejected = LoadServerConfig(nlohmann::json{{"enable_hover", 1}});
  CHECK_FALSE(rejected.has_value());

  ::unsetenv("MAILLS_CONFIG");
}
