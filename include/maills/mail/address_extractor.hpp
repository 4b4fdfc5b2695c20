#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace maills::mail {

// Bare address found in a document. [start, end) is in bytes.
struct AddressToken {
  std::string address;
  std::size_t start = 0;
  std::size_t end = 0;
  // From `Name <addr>` or `"Quoted Name" <addr>`
  std::optional<std::string> display_name;
  // Header field name when found in a header region
  std::optional<std::string> header;

  friend auto operator==(const AddressToken&, const AddressToken&)
      -> bool = default;
};

// A byte range that may contain addresses. header is set for the value of an
// address-bearing header, including its continuation lines.
struct AddressRegion {
  std::size_t start = 0;
  std::size_t end = 0;
  std::optional<std::string> header;
};

// Document starting with a header block, plain or as markdown front matter
struct HeaderShape {
  std::vector<AddressRegion> header_regions;
  std::size_t body_start = 0;
};

struct FreeTextShape {};

using DocumentShape = std::variant<HeaderShape, FreeTextShape>;

// Header style needs at least one address-bearing field in the leading
// block. Anything else is free text.
[[nodiscard]] auto SniffShape(std::string_view text) -> DocumentShape;

[[nodiscard]] auto IsAddressHeader(std::string_view field_name) -> bool;

// Regions in document order. A header line is never also part of a free
// text region.
[[nodiscard]] auto AddressRegions(
    std::string_view text, const DocumentShape& shape)
    -> std::vector<AddressRegion>;

// Tokens ordered by start; spans never overlap
[[nodiscard]] auto ExtractAddresses(std::string_view text)
    -> std::vector<AddressToken>;

// Token with start <= offset < end, found by binary search over tokens
// ordered by start
[[nodiscard]] auto TokenAt(
    const std::vector<AddressToken>& tokens, std::size_t offset)
    -> std::optional<AddressToken>;

[[nodiscard]] auto TokenAt(std::string_view text, std::size_t offset)
    -> std::optional<AddressToken>;

struct CompletionContext {
  // Address characters ending at the cursor
  std::string prefix;
  std::size_t replace_start = 0;
  std::size_t replace_end = 0;
  bool in_header = false;
  // The address being typed directly follows "<"
  bool after_angle = false;
};

// nullopt when offset is outside every address-bearing region
[[nodiscard]] auto CompletionContextAt(
    std::string_view text, std::size_t offset)
    -> std::optional<CompletionContext>;

}  // namespace maills::mail
