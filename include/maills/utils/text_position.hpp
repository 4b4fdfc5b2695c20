#pragma once

#include <cstddef>
#include <string_view>

#include "lsp/basic.hpp"

namespace maills::utils {

[[nodiscard]] auto IsValidUtf8(std::string_view text) -> bool;

// Converts an LSP position to a byte offset. Positions past the end of a line
// clamp to the line end (a "\r" before "\n" is not part of the line), lines
// past the end of the text clamp to the text end, and a character index
// inside a code point clamps back to that code point's first byte.
[[nodiscard]] auto PositionToOffset(
    std::string_view text, lsp::Position position,
    lsp::PositionEncodingKind encoding) -> std::size_t;

// Inverse of PositionToOffset. An offset inside a multi-byte sequence is
// moved back to the start of that sequence first.
[[nodiscard]] auto OffsetToPosition(
    std::string_view text, std::size_t offset,
    lsp::PositionEncodingKind encoding) -> lsp::Position;

}  // namespace maills::utils
