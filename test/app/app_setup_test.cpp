#include "app/app_setup.hpp"

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using app::ParseCommandLine;

TEST_CASE("ParseCommandLine reads every option", "[app]") {
  auto options = ParseCommandLine(
      {"maills", "--pipe=/tmp/maills.sock", "--config=/etc/maills.yaml",
       "--log-file=/tmp/maills.log"});

  REQUIRE(options.has_value());
  CHECK(options->pipe_name == "/tmp/maills.sock");
  CHECK(options->config_path == "/etc/maills.yaml");
  CHECK(options->log_file == "/tmp/maills.log");
}

TEST_CASE("ParseCommandLine leaves optional settings unset", "[app]") {
  auto options = ParseCommandLine({"maills", "--pipe=lsp"});

  REQUIRE(options.has_value());
  CHECK(options->pipe_name == "lsp");
  CHECK_FALSE(options->config_path.has_value());
  CHECK_FALSE(options->log_file.has_value());
}

TEST_CASE("ParseCommandLine rejects bad command lines", "[app]") {
  CHECK_FALSE(ParseCommandLine({"maills"}).has_value());
  CHECK_FALSE(ParseCommandLine({"maills", "--pipe="}).has_value());
  CHECK_FALSE(
      ParseCommandLine({"maills", "--pipe=lsp", "--verbose"}).has_value());
}
