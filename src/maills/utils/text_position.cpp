#include "maills/utils/text_position.hpp"

#include <algorithm>

namespace maills::utils {

namespace {

auto IsContinuationByte(unsigned char c) -> bool {
  return (c & 0xC0) == 0x80;
}

// Length of the sequence introduced by a lead byte. Stray bytes count as one.
auto SequenceLength(unsigned char lead) -> std::size_t {
  if (lead < 0x80) {
    return 1;
  }
  if ((lead & 0xE0) == 0xC0) {
    return 2;
  }
  if ((lead & 0xF0) == 0xE0) {
    return 3;
  }
  if ((lead & 0xF8) == 0xF0) {
    return 4;
  }
  return 1;
}

auto UnitsFor(std::size_t sequence_length, lsp::PositionEncodingKind encoding)
    -> int {
  switch (encoding) {
    case lsp::PositionEncodingKind::kUtf8:
      return static_cast<int>(sequence_length);
    case lsp::PositionEncodingKind::kUtf16:
      return sequence_length == 4 ? 2 : 1;
    case lsp::PositionEncodingKind::kUtf32:
      return 1;
  }
  return 1;
}

// Width of the code point starting at offset, never crossing limit
auto CodePointWidth(
    std::string_view text, std::size_t offset, std::size_t limit)
    -> std::size_t {
  auto length = SequenceLength(static_cast<unsigned char>(text[offset]));
  return std::min(length, limit - offset);
}

// End of the line content that starts at line_start, excluding "\r\n"
auto LineContentEnd(std::string_view text, std::size_t line_start)
    -> std::size_t {
  auto newline = text.find('\n', line_start);
  if (newline == std::string_view::npos) {
    return text.size();
  }
  if (newline > line_start && text[newline - 1] == '\r') {
    return newline - 1;
  }
  return newline;
}

}  // namespace

auto IsValidUtf8(std::string_view text) -> bool {
  std::size_t i = 0;
  while (i < text.size()) {
    auto lead = static_cast<unsigned char>(text[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }

    std::size_t length = 0;
    char32_t code_point = 0;
    if ((lead & 0xE0) == 0xC0) {
      length = 2;
      code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      code_point = lead & 0x07;
    } else {
      return false;
    }

    if (i + length > text.size()) {
      return false;
    }
    for (std::size_t k = 1; k < length; ++k) {
      auto c = static_cast<unsigned char>(text[i + k]);
      if (!IsContinuationByte(c)) {
        return false;
      }
      code_point = (code_point << 6) | (c & 0x3F);
    }

    // Overlong forms, surrogates and values past U+10FFFF
    if ((length == 2 && code_point < 0x80) ||
        (length == 3 && code_point < 0x800) ||
        (length == 4 && code_point < 0x10000) || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }
    i += length;
  }
  return true;
}

auto PositionToOffset(
    std::string_view text, lsp::Position position,
    lsp::PositionEncodingKind encoding) -> std::size_t {
  std::size_t line_start = 0;
  for (int line = 0; line < position.line; ++line) {
    auto newline = text.find('\n', line_start);
    if (newline == std::string_view::npos) {
      return text.size();
    }
    line_start = newline + 1;
  }

  const auto line_end = LineContentEnd(text, line_start);
  auto offset = line_start;
  int remaining = std::max(position.character, 0);

  while (offset < line_end && remaining > 0) {
    auto width = CodePointWidth(text, offset, line_end);
    auto units = UnitsFor(width, encoding);
    if (units > remaining) {
      break;
    }
    remaining -= units;
    offset += width;
  }
  return offset;
}

auto OffsetToPosition(
    std::string_view text, std::size_t offset,
    lsp::PositionEncodingKind encoding) -> lsp::Position {
  offset = std::min(offset, text.size());
  while (offset > 0 && offset < text.size() &&
         IsContinuationByte(static_cast<unsigned char>(text[offset]))) {
    --offset;
  }

  int line = 0;
  std::size_t line_start = 0;
  for (auto newline = text.find('\n');
       newline != std::string_view::npos && newline < offset;
       newline = text.find('\n', newline + 1)) {
    ++line;
    line_start = newline + 1;
  }

  // Between "\r" and "\n" is the end of the line content
  const auto line_end = LineContentEnd(text, line_start);
  offset = std::min(offset, line_end);

  int character = 0;
  auto cursor = line_start;
  while (cursor < offset) {
    auto width = CodePointWidth(text, cursor, line_end);
    character += UnitsFor(width, encoding);
    cursor += width;
  }
  return {.line = line, .character = character};
}

}  // namespace maills::utils
