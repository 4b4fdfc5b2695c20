#include "maills/contacts/vcard_parser.hpp"

#include <cstdlib>
#include <string>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using maills::contacts::EscapeVCardValue;
using maills::contacts::ParseVCards;

TEST_CASE("ParseVCards reads a minimal card", "[vcard_parser]") {
  auto result = ParseVCards(
      "BEGIN:VCARD\r\n"
      "VERSION:4.0\r\n"
      "FN:Jane Doe\r\n"
      "EMAIL;TYPE=work:jane@example.com\r\n"
      "END:VCARD\r\n");

  REQUIRE(result.has_value());
  REQUIRE(result->size() == 1);
  const auto& card = result->front();
  CHECK(card.begin_line == 0);
  CHECK(card.formatted_name == "Jane Doe");
  REQUIRE(card.emails.size() == 1);
  CHECK(card.emails[0].address == "jane@example.com");
  CHECK(card.emails[0].types == std::vector<std::string>{"work"});
  CHECK(card.emails[0].line == 3);
  // VERSION is bookkeeping and never shows up as a property
  CHECK(card.properties.empty());
}

TEST_CASE(
    "ParseVCards handles several cards and blank lines",
    "[vcard_parser]") {
  auto result = ParseVCards(
      "BEGIN:VCARD\n"
      "FN:First\n"
      "EMAIL:first@example.com\n"
      "END:VCARD\n"
      "\n"
      "BEGIN:VCARD\n"
      "FN:Second\n"
      "EMAIL:second@example.com\n"
      "EMAIL;TYPE=home,pref:second@home.example.org\n"
      "END:VCARD\n");

  REQUIRE(result.has_value());
  REQUIRE(result->size() == 2);
  CHECK((*result)[1].begin_line == 5);
  REQUIRE((*result)[1].emails.size() == 2);
  CHECK(
      (*result)[1].emails[1].types ==
      std::vector<std::string>{"home", "pref"});
}

TEST_CASE("ParseVCards unfolds continuation lines", "[vcard_parser]") {
  auto result = ParseVCards(
      "BEGIN:VCARD\n"
      "FN:Jonathan\n"
      " Appleseed\n"
      "EMAIL:john@exam\n"
      "\tple.com\n"
      "END:VCARD\n");

  REQUIRE(result.has_value());
  const auto& card = result->front();
  CHECK(card.formatted_name == "JonathanAppleseed");
  REQUIRE(card.emails.size() == 1);
  CHECK(card.emails[0].address == "john@example.com");
}

TEST_CASE("ParseVCards falls back to N when FN is missing", "[vcard_parser]") {
  auto result = ParseVCards(
      "BEGIN:VCARD\n"
      "N:Doe;Jane;Q.;Dr.;PhD\n"
      "EMAIL:jane@example.com\n"
      "END:VCARD\n");

  REQUIRE(result.has_value());
  CHECK(result->front().formatted_name == "Dr. Jane Q. Doe PhD");
}

TEST_CASE("ParseVCards prefers FN over N", "[vcard_parser]") {
  auto result = ParseVCards(
      "BEGIN:VCARD\n"
      "N:Doe;Jane;;;\n"
      "FN:Janie\n"
      "END:VCARD\n");

  REQUIRE(result.has_value());
  CHECK(result->front().formatted_name == "Janie");
}

TEST_CASE("ParseVCards unescapes values", "[vcard_parser]") {
  auto result = ParseVCards(
      "BEGIN:VCARD\n"
      "FN:Doe\\, Jane\n"
      "NOTE:line one\\nline two\\; still two\n"
      "ORG:Example Corp;Research\\; Development\n"
      "END:VCARD\n");

  REQUIRE(result.has_value());
  const auto& card = result->front();
  CHECK(card.formatted_name == "Doe, Jane");
  REQUIRE(card.properties.size() == 2);
  CHECK(card.properties[0].name == "NOTE");
  CHECK(card.properties[0].value == "line one\nline two; still two");
  CHECK(card.properties[1].name == "ORG");
  CHECK(card.properties[1].value == "Example Corp, Research; Development");
}

TEST_CASE("ParseVCards keeps groups and legacy parameters", "[vcard_parser]") {
  auto result = ParseVCards(
      "BEGIN:VCARD\n"
      "FN:Jane\n"
      "item1.tel;CELL;type=voice,text:+1 555 0100\n"
      "END:VCARD\n");

  REQUIRE(result.has_value());
  const auto& properties = result->front().properties;
  REQUIRE(properties.size() == 1);
  CHECK(properties[0].group == "item1");
  CHECK(properties[0].name == "TEL");
  CHECK(
      properties[0].types ==
      std::vector<std::string>{"cell", "voice", "text"});
  CHECK(properties[0].value == "+1 555 0100");
}

TEST_CASE("ParseVCards ignores colons in quoted parameters", "[vcard_parser]") {
  auto result = ParseVCards(
      "BEGIN:VCARD\n"
      "FN:Jane\n"
      "EMAIL;X-LABEL=\"Office: 3rd floor\";TYPE=\"work\":jane@example.com\n"
      "END:VCARD\n");

  REQUIRE(result.has_value());
  const auto& email = result->front().emails.front();
  CHECK(email.address == "jane@example.com");
  CHECK(email.types == std::vector<std::string>{"work"});
}

TEST_CASE("ParseVCards strips a mailto prefix", "[vcard_parser]") {
  auto result = ParseVCards(
      "BEGIN:VCARD\n"
      "FN:Jane\n"
      "EMAIL:mailto:jane@example.com\n"
      "END:VCARD\n");

  REQUIRE(result.has_value());
  CHECK(result->front().emails.front().address == "jane@example.com");
}

TEST_CASE("ParseVCards reports structural errors", "[vcard_parser]") {
  SECTION("Missing colon") {
    auto result = ParseVCards("BEGIN:VCARD\nFN Jane\nEND:VCARD\n");
    REQUIRE_FALSE(result.has_value());
    CHECK_THAT(
        result.error(),
        Catch::Matchers::ContainsSubstring("line 2: content line has no ':'"));
  }

  SECTION("Unclosed card") {
    auto result = ParseVCards("BEGIN:VCARD\nFN:Jane\n");
    REQUIRE_FALSE(result.has_value());
    CHECK_THAT(
        result.error(), Catch::Matchers::ContainsSubstring("not closed"));
  }

  SECTION("Nested card") {
    auto result = ParseVCards("BEGIN:VCARD\nBEGIN:VCARD\nEND:VCARD\n");
    REQUIRE_FALSE(result.has_value());
    CHECK_THAT(
        result.error(),
        Catch::Matchers::ContainsSubstring(
            "inside the card started at line 1"));
  }

  SECTION("END without BEGIN") {
    auto result = ParseVCards("END:VCARD\n");
    REQUIRE_FALSE(result.has_value());
    CHECK_THAT(
        result.error(),
        Catch::Matchers::ContainsSubstring("END:VCARD without BEGIN"));
  }

  SECTION("Property outside a card") {
    auto result = ParseVCards("FN:Jane\n");
    REQUIRE_FALSE(result.has_value());
    CHECK_THAT(
        result.error(),
        Catch::Matchers::ContainsSubstring("property FN outside of a card"));
  }
}

TEST_CASE("ParseVCards accepts empty input", "[vcard_parser]") {
  auto result = ParseVCards("");
  REQUIRE(result.has_value());
  CHECK(result->empty());
}

TEST_CASE("EscapeVCardValue escapes specials", "[vcard_parser]") {
  CHECK(EscapeVCardValue("Doe, Jane; \\x\nnext") ==
        "Doe\\, Jane\\; \\\\x\\nnext");
}
