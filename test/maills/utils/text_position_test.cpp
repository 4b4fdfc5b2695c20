#include "maills/utils/text_position.hpp"

#include <string>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using lsp::Position;
using lsp::PositionEncodingKind;
using maills::utils::IsValidUtf8;
using maills::utils::OffsetToPosition;
using maills::utils::PositionToOffset;

namespace {

constexpr auto kUtf8 = PositionEncodingKind::kUtf8;
constexpr auto kUtf16 = PositionEncodingKind::kUtf16;
constexpr auto kUtf32 = PositionEncodingKind::kUtf32;

// "é" is 2 bytes, "€" is 3 bytes, "😀" is 4 bytes and a UTF-16 pair
const std::string kMixed = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80z";

}  // namespace

TEST_CASE("PositionToOffset walks lines", "[text_position]") {
  const std::string text = "first\nsecond\nthird";

  CHECK(PositionToOffset(text, {.line = 0, .character = 0}, kUtf16) == 0);
  CHECK(PositionToOffset(text, {.line = 1, .character = 0}, kUtf16) == 6);
  CHECK(PositionToOffset(text, {.line = 1, .character = 3}, kUtf16) == 9);
  CHECK(PositionToOffset(text, {.line = 2, .character = 5}, kUtf16) == 18);
}

TEST_CASE("PositionToOffset clamps out of range positions", "[text_position]") {
  const std::string text = "ab\r\ncd";

  SECTION("Character past the line end stops before CRLF") {
    CHECK(PositionToOffset(text, {.line = 0, .character = 99}, kUtf16) == 2);
  }

  SECTION("Line past the end goes to the end of the text") {
    CHECK(
        PositionToOffset(text, {.line = 7, .character = 0}, kUtf16) ==
        text.size());
  }

  SECTION("Negative character counts as zero") {
    CHECK(PositionToOffset(text, {.line = 1, .character = -3}, kUtf16) == 4);
  }
}

TEST_CASE("PositionToOffset counts units per encoding", "[text_position]") {
  SECTION("UTF-16") {
    CHECK(PositionToOffset(kMixed, {.line = 0, .character = 2}, kUtf16) == 3);
    CHECK(PositionToOffset(kMixed, {.line = 0, .character = 3}, kUtf16) == 6);
    CHECK(PositionToOffset(kMixed, {.line = 0, .character = 5}, kUtf16) == 10);
    CHECK(PositionToOffset(kMixed, {.line = 0, .character = 6}, kUtf16) == 11);
  }

  SECTION("UTF-8") {
    CHECK(PositionToOffset(kMixed, {.line = 0, .character = 3}, kUtf8) == 3);
    CHECK(PositionToOffset(kMixed, {.line = 0, .character = 10}, kUtf8) == 10);
  }

  SECTION("UTF-32") {
    CHECK(PositionToOffset(kMixed, {.line = 0, .character = 4}, kUtf32) == 10);
  }
}

TEST_CASE(
    "PositionToOffset snaps into the start of a code point",
    "[text_position]") {
  // Character 4 in UTF-16 is between the two halves of the surrogate pair
  CHECK(PositionToOffset(kMixed, {.line = 0, .character = 4}, kUtf16) == 6);
  // Byte 2 in UTF-8 is inside "é"
  CHECK(PositionToOffset(kMixed, {.line = 0, .character = 2}, kUtf8) == 1);
}

TEST_CASE("OffsetToPosition inverts PositionToOffset", "[text_position]") {
  const std::string text = "one\n" + kMixed + "\nend";

  for (auto encoding : {kUtf8, kUtf16, kUtf32}) {
    for (std::size_t offset = 0; offset <= text.size(); ++offset) {
      auto position = OffsetToPosition(text, offset, encoding);
      auto back = PositionToOffset(text, position, encoding);
      // Offsets inside a code point come back at its first byte
      CHECK(back <= offset);
      CHECK(OffsetToPosition(text, back, encoding) == position);
    }
  }
}

TEST_CASE("OffsetToPosition reports lines and columns", "[text_position]") {
  const std::string text = "ab\r\n" + kMixed;

  CHECK(
      OffsetToPosition(text, 1, kUtf16) ==
      Position{.line = 0, .character = 1});
  // Between "\r" and "\n" is still the end of line 0
  CHECK(
      OffsetToPosition(text, 3, kUtf16) ==
      Position{.line = 0, .character = 2});
  CHECK(
      OffsetToPosition(text, 4, kUtf16) ==
      Position{.line = 1, .character = 0});
  CHECK(
      OffsetToPosition(text, 4 + 10, kUtf16) ==
      Position{.line = 1, .character = 5});
  CHECK(
      OffsetToPosition(text, 4 + 10, kUtf8) ==
      Position{.line = 1, .character = 10});
  CHECK(
      OffsetToPosition(text, 999, kUtf16) ==
      Position{.line = 1, .character = 6});
}

TEST_CASE("IsValidUtf8 accepts and rejects", "[text_position]") {
  CHECK(IsValidUtf8(""));
  CHECK(IsValidUtf8("plain ascii"));
  CHECK(IsValidUtf8(kMixed));

  CHECK_FALSE(IsValidUtf8("\xC3"));
  CHECK_FALSE(IsValidUtf8("\xC0\xAF"));
  CHECK_FALSE(IsValidUtf8("\xED\xA0\x80"));
  CHECK_FALSE(IsValidUtf8("\xF4\x90\x80\x80"));
  CHECK_FALSE(IsValidUtf8("\x80"));
}
