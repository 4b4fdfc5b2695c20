#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace maills::contacts {

// One content line of a card, after unfolding and unescaping
struct VCardProperty {
  std::string group;
  // Uppercased
  std::string name;
  // Lowercased TYPE= values and bare legacy parameters
  std::vector<std::string> types;
  std::string value;
  int line = 0;
};

struct VCardEmail {
  std::string address;
  std::vector<std::string> types;
  int line = 0;
};

struct VCardRecord {
  int begin_line = 0;
  // FN, or assembled from N when FN is absent
  std::optional<std::string> formatted_name;
  std::optional<std::string> nickname;
  std::vector<VCardEmail> emails;
  // Everything except identity and bookkeeping properties, in file order
  std::vector<VCardProperty> properties;
};

// Parses every BEGIN:VCARD ... END:VCARD block in text. Line numbers are
// 0-based physical lines. The error string names the offending line.
auto ParseVCards(std::string_view text)
    -> std::expected<std::vector<VCardRecord>, std::string>;

// Escapes "\", ",", ";" and newlines for a property value
auto EscapeVCardValue(std::string_view value) -> std::string;

}  // namespace maills::contacts
