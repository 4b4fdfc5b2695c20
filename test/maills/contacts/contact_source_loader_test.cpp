#include "maills/contacts/contact_source_loader.hpp"

#include <algorithm>
#include <string>

#include <catch2/catch_all.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "maills/contacts/vcard_writer.hpp"
#include "test/maills/common/file_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using maills::contacts::ContactSourceOptions;
using maills::contacts::LoadContacts;
using maills::contacts::LoadResult;
using maills::contacts::LoadWarningKind;
using maills::test::FileTestFixture;

namespace {

auto Card(std::string_view name, std::string_view email) -> std::string {
  return fmt::format(
      "BEGIN:VCARD\r\nVERSION:4.0\r\nFN:{}\r\nEMAIL:{}\r\nEND:VCARD\r\n", name,
      email);
}

auto CountWarnings(const LoadResult& result, LoadWarningKind kind)
    -> std::size_t {
  return static_cast<std::size_t>(
      std::ranges::count_if(result.warnings, [kind](const auto& warning) {
        return warning.kind == kind;
      }));
}

}  // namespace

TEST_CASE("LoadContacts without sources is empty", "[contact_loader]") {
  auto result = LoadContacts(ContactSourceOptions{});
  CHECK(result.index.Empty());
  CHECK(result.warnings.empty());
}

TEST_CASE(
    "LoadContacts scans a vCard directory recursively",
    "[contact_loader]") {
  FileTestFixture fixture("maills_loader_test");
  fixture.CreateFile("jane.vcf", Card("Jane Doe", "jane@example.com"));
  fixture.CreateFile("work/bob.vcard", Card("Bob Smith", "bob@work.example"));
  fixture.CreateFile("notes.txt", "not a card");

  auto result = LoadContacts(
      {.vcard_dir = fixture.GetTempDir().Path(), .contact_list_file = {}});

  CHECK(result.warnings.empty());
  CHECK(result.index.AddressCount() == 2);
  const auto* jane = result.index.Find("jane@example.com");
  REQUIRE(jane != nullptr);
  CHECK(jane->display_name == "Jane Doe");
  CHECK(jane->source.path.Path().filename() == "jane.vcf");
  CHECK(jane->source.line == 0);
  CHECK(jane->addresses.front().line == 3);
  CHECK(result.index.Find("bob@work.example") != nullptr);
}

TEST_CASE(
    "LoadContacts resolves duplicates by path order",
    "[contact_loader]") {
  FileTestFixture fixture("maills_loader_test");
  fixture.CreateFile("a.vcf", Card("From A", "shared@example.com"));
  fixture.CreateFile("b.vcf", Card("From B", "Shared@Example.com"));

  auto result = LoadContacts(
      {.vcard_dir = fixture.GetTempDir().Path(), .contact_list_file = {}});

  REQUIRE(result.warnings.size() == 1);
  CHECK(result.warnings[0].kind == LoadWarningKind::kDuplicateAddress);
  CHECK(result.warnings[0].path.Path().filename() == "a.vcf");

  const auto* winner = result.index.Find("shared@example.com");
  REQUIRE(winner != nullptr);
  CHECK(winner->display_name == "From B");
  CHECK(result.index.Contacts().size() == 1);
}

TEST_CASE(
    "LoadContacts lets a later card in the same file win quietly",
    "[contact_loader]") {
  FileTestFixture fixture("maills_loader_test");
  fixture.CreateFile(
      "a.vcf",
      Card("First Jane", "jane@example.com") +
          Card("Second Jane", "jane@example.com"));
  auto list = fixture.CreateFile(
      "list.txt",
      "Old Bob bob@example.org\n"
      "New Bob bob@example.org\n");

  auto result = LoadContacts(
      {.vcard_dir = fixture.GetTempDir().Path(),
       .contact_list_file = list.Path()});

  CHECK(result.warnings.empty());
  const auto* jane = result.index.Find("jane@example.com");
  REQUIRE(jane != nullptr);
  CHECK(jane->display_name == "Second Jane");
  const auto* bob = result.index.Find("bob@example.org");
  REQUIRE(bob != nullptr);
  CHECK(bob->display_name == "New Bob");
  CHECK(result.index.Contacts().size() == 2);
}

TEST_CASE("LoadContacts keeps going past broken files", "[contact_loader]") {
  FileTestFixture fixture("maills_loader_test");
  fixture.CreateFile("broken.vcf", "BEGIN:VCARD\nFN:Broken\n");
  fixture.CreateFile("good.vcf", Card("Good", "good@example.com"));

  auto result = LoadContacts(
      {.vcard_dir = fixture.GetTempDir().Path(), .contact_list_file = {}});

  CHECK(CountWarnings(result, LoadWarningKind::kParseFailed) == 1);
  CHECK(result.index.Find("good@example.com") != nullptr);
}

TEST_CASE("LoadContacts reports a missing directory", "[contact_loader]") {
  FileTestFixture fixture("maills_loader_test");

  auto result = LoadContacts(
      {.vcard_dir = fixture.GetTempDir().Path() / "missing",
       .contact_list_file = {}});

  REQUIRE(result.warnings.size() == 1);
  CHECK(result.warnings[0].kind == LoadWarningKind::kMissingSource);
  CHECK(result.index.Empty());
}

TEST_CASE("LoadContacts reads a contact list file", "[contact_loader]") {
  FileTestFixture fixture("maills_loader_test");
  fixture.CreateFile("cards/friend.vcf", Card("Friend", "friend@example.com"));
  auto list = fixture.CreateFile(
      "list.txt",
      "# my contacts\n"
      "cards/friend.vcf\n"
      "Jane Doe jane@example.com\n"
      "\"Roe, Rick\" <rick@example.org>\n"
      "missing.vcf\n"
      "Nobody nobody@localhost\n");

  auto result =
      LoadContacts({.vcard_dir = {}, .contact_list_file = list.Path()});

  CHECK(result.index.Find("friend@example.com") != nullptr);

  const auto* jane = result.index.Find("jane@example.com");
  REQUIRE(jane != nullptr);
  CHECK(jane->display_name == "Jane Doe");
  CHECK(jane->source.path == list);
  CHECK(jane->source.line == 2);

  const auto* rick = result.index.Find("rick@example.org");
  REQUIRE(rick != nullptr);
  CHECK(rick->display_name == "Roe, Rick");

  CHECK(CountWarnings(result, LoadWarningKind::kMissingSource) == 1);
  REQUIRE(CountWarnings(result, LoadWarningKind::kInvalidEntry) == 1);
  auto invalid = std::ranges::find_if(result.warnings, [](const auto& w) {
    return w.kind == LoadWarningKind::kInvalidEntry;
  });
  CHECK_THAT(invalid->message, Catch::Matchers::StartsWith("line 6:"));
}

TEST_CASE("LoadContacts reports a missing list file", "[contact_loader]") {
  FileTestFixture fixture("maills_loader_test");

  auto result = LoadContacts(
      {.vcard_dir = {},
       .contact_list_file = fixture.GetTempDir().Path() / "absent.txt"});

  REQUIRE(result.warnings.size() == 1);
  CHECK(result.warnings[0].kind == LoadWarningKind::kMissingSource);
}

TEST_CASE(
    "LoadContacts reads a file once when listed and scanned",
    "[contact_loader]") {
  FileTestFixture fixture("maills_loader_test");
  fixture.CreateFile("jane.vcf", Card("Jane", "jane@example.com"));
  auto list = fixture.CreateFile("list.txt", "jane.vcf\n");

  auto result = LoadContacts(
      {.vcard_dir = fixture.GetTempDir().Path(),
       .contact_list_file = list.Path()});

  CHECK(result.warnings.empty());
  CHECK(result.index.Contacts().size() == 1);
}

TEST_CASE("LoadContacts keeps auxiliary fields", "[contact_loader]") {
  FileTestFixture fixture("maills_loader_test");
  fixture.CreateFile(
      "jane.vcf",
      "BEGIN:VCARD\n"
      "FN:Jane Doe\n"
      "NICKNAME:JD\n"
      "EMAIL;TYPE=work:jane@example.com\n"
      "TEL;TYPE=cell:+1 555 0100\n"
      "ORG:Example Corp\n"
      "END:VCARD\n");

  auto result = LoadContacts(
      {.vcard_dir = fixture.GetTempDir().Path(), .contact_list_file = {}});

  const auto* jane = result.index.Find("jane@example.com");
  REQUIRE(jane != nullptr);
  CHECK(jane->nickname == "JD");
  CHECK(jane->addresses.front().type == "work");
  REQUIRE(jane->FindField("TEL") != nullptr);
  CHECK(jane->FindField("TEL")->value == "+1 555 0100");
  CHECK(jane->FindField("TEL")->type == "cell");
  REQUIRE(jane->FindField("ORG") != nullptr);
  CHECK(jane->FindField("ORG")->value == "Example Corp");
}

TEST_CASE("WriteNewContact output loads back", "[contact_loader]") {
  FileTestFixture fixture("maills_loader_test");
  auto dir = fixture.GetTempDir().Path() / "new";

  auto written = maills::contacts::WriteNewContact(
      dir, {.name = "Doe, Jane", .address = "jane@example.com"});
  REQUIRE(written.has_value());
  CHECK(written->Path().extension() == ".vcf");

  auto result = LoadContacts({.vcard_dir = dir, .contact_list_file = {}});
  CHECK(result.warnings.empty());
  const auto* jane = result.index.Find("jane@example.com");
  REQUIRE(jane != nullptr);
  CHECK(jane->display_name == "Doe, Jane");
  CHECK(jane->source.path == *written);
}
