#include "maills/contacts/vcard_parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include <fmt/format.h>

#include "maills/mail/mailbox.hpp"

namespace maills::contacts {

namespace {

struct LogicalLine {
  std::string text;
  int line;
};

auto Unfold(std::string_view text) -> std::vector<LogicalLine> {
  std::vector<LogicalLine> lines;
  int line_number = 0;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    auto newline = text.find('\n', pos);
    auto end = newline == std::string_view::npos ? text.size() : newline;
    auto physical = text.substr(pos, end - pos);
    if (!physical.empty() && physical.back() == '\r') {
      physical.remove_suffix(1);
    }

    bool continuation = !physical.empty() &&
                        (physical.front() == ' ' || physical.front() == '\t');
    if (continuation && !lines.empty()) {
      lines.back().text.append(physical.substr(1));
    } else {
      lines.push_back({.text = std::string(physical), .line = line_number});
    }

    if (newline == std::string_view::npos) {
      break;
    }
    pos = newline + 1;
    ++line_number;
  }
  return lines;
}

// Splits on separator outside double quotes
auto SplitUnquoted(std::string_view text, char separator)
    -> std::vector<std::string_view> {
  std::vector<std::string_view> parts;
  bool quoted = false;
  std::size_t start = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '"') {
      quoted = !quoted;
    } else if (text[i] == separator && !quoted) {
      parts.push_back(text.substr(start, i - start));
      start = i + 1;
    }
  }
  parts.push_back(text.substr(start));
  return parts;
}

// Splits a structured value on ";" not preceded by a backslash
auto SplitStructured(std::string_view value) -> std::vector<std::string_view> {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\') {
      ++i;
    } else if (value[i] == ';') {
      parts.push_back(value.substr(start, i - start));
      start = i + 1;
    }
  }
  parts.push_back(value.substr(start));
  return parts;
}

auto Unescape(std::string_view value) -> std::string {
  std::string result;
  result.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '\\' || i + 1 == value.size()) {
      result += value[i];
      continue;
    }
    char next = value[++i];
    if (next == 'n' || next == 'N') {
      result += '\n';
    } else {
      result += next;
    }
  }
  return result;
}

auto StripQuotes(std::string_view text) -> std::string_view {
  if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

// Joins the non-empty unescaped parts of a structured value
auto JoinStructured(
    const std::vector<std::string_view>& parts, std::string_view separator)
    -> std::string {
  std::string result;
  for (auto part : parts) {
    auto unescaped = Unescape(mail::Trim(part));
    if (unescaped.empty()) {
      continue;
    }
    if (!result.empty()) {
      result += separator;
    }
    result += unescaped;
  }
  return result;
}

// N is family;given;additional;prefix;suffix
auto NameFromStructured(std::string_view raw) -> std::string {
  auto parts = SplitStructured(raw);
  parts.resize(5);
  return JoinStructured(
      {parts[3], parts[1], parts[2], parts[0], parts[4]}, " ");
}

auto IsBookkeepingProperty(std::string_view name) -> bool {
  static constexpr std::array<std::string_view, 4> kNames = {
      "VERSION", "PRODID", "UID", "REV"};
  return std::ranges::find(kNames, name) != kNames.end();
}

auto IsStructuredProperty(std::string_view name) -> bool {
  return name == "ADR" || name == "ORG";
}

struct ParsedLine {
  VCardProperty property;
  std::string raw_value;
};

auto ParseContentLine(const LogicalLine& line)
    -> std::expected<ParsedLine, std::string> {
  // The first ":" outside a quoted parameter value ends the name part
  std::size_t colon = std::string::npos;
  bool quoted = false;
  for (std::size_t i = 0; i < line.text.size(); ++i) {
    if (line.text[i] == '"') {
      quoted = !quoted;
    } else if (line.text[i] == ':' && !quoted) {
      colon = i;
      break;
    }
  }
  if (colon == std::string::npos) {
    return std::unexpected(
        fmt::format("line {}: content line has no ':'", line.line + 1));
  }

  std::string_view head(line.text.data(), colon);
  auto segments = SplitUnquoted(head, ';');

  ParsedLine parsed;
  parsed.property.line = line.line;
  parsed.raw_value = line.text.substr(colon + 1);

  auto name = mail::Trim(segments.front());
  if (auto dot = name.rfind('.'); dot != std::string_view::npos) {
    parsed.property.group = std::string(name.substr(0, dot));
    name = name.substr(dot + 1);
  }
  if (name.empty()) {
    return std::unexpected(
        fmt::format("line {}: property name is empty", line.line + 1));
  }
  auto upper = std::string(name);
  std::ranges::transform(upper, upper.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  parsed.property.name = std::move(upper);

  for (std::size_t i = 1; i < segments.size(); ++i) {
    auto param = mail::Trim(segments[i]);
    auto equals = param.find('=');
    if (equals == std::string_view::npos) {
      if (!param.empty()) {
        parsed.property.types.push_back(mail::ToLower(param));
      }
      continue;
    }
    if (mail::ToLower(param.substr(0, equals)) != "type") {
      continue;
    }
    for (auto type : SplitUnquoted(param.substr(equals + 1), ',')) {
      auto value = StripQuotes(mail::Trim(type));
      if (!value.empty()) {
        parsed.property.types.push_back(mail::ToLower(value));
      }
    }
  }

  if (IsStructuredProperty(parsed.property.name)) {
    parsed.property.value =
        JoinStructured(SplitStructured(parsed.raw_value), ", ");
  } else {
    parsed.property.value = Unescape(parsed.raw_value);
  }
  return parsed;
}

struct OpenCard {
  VCardRecord record;
  std::optional<std::string> structured_name;
};

void AddToCard(OpenCard& card, ParsedLine parsed) {
  auto& property = parsed.property;
  const auto& name = property.name;
  if (name == "FN") {
    auto value = std::string(mail::Trim(property.value));
    if (!value.empty() && !card.record.formatted_name) {
      card.record.formatted_name = std::move(value);
    }
  } else if (name == "N") {
    auto value = NameFromStructured(parsed.raw_value);
    if (!value.empty()) {
      card.structured_name = std::move(value);
    }
  } else if (name == "NICKNAME") {
    auto value = std::string(mail::Trim(property.value));
    if (!value.empty() && !card.record.nickname) {
      card.record.nickname = std::move(value);
    }
  } else if (name == "EMAIL") {
    auto address = mail::Trim(property.value);
    if (address.starts_with("mailto:")) {
      address.remove_prefix(7);
    }
    if (!address.empty()) {
      card.record.emails.push_back(
          {.address = std::string(address),
           .types = std::move(property.types),
           .line = property.line});
    }
  } else if (!IsBookkeepingProperty(name)) {
    card.record.properties.push_back(std::move(property));
  }
}

auto IsKeyword(const ParsedLine& parsed, std::string_view keyword) -> bool {
  return mail::ToLower(mail::Trim(parsed.property.value)) == keyword;
}

}  // namespace

auto ParseVCards(std::string_view text)
    -> std::expected<std::vector<VCardRecord>, std::string> {
  std::vector<VCardRecord> records;
  std::optional<OpenCard> card;

  for (const auto& line : Unfold(text)) {
    if (mail::Trim(line.text).empty()) {
      continue;
    }

    auto parsed = ParseContentLine(line);
    if (!parsed) {
      return std::unexpected(parsed.error());
    }

    const auto& name = parsed->property.name;
    if (name == "BEGIN" && IsKeyword(*parsed, "vcard")) {
      if (card) {
        return std::unexpected(fmt::format(
            "line {}: BEGIN:VCARD inside the card started at line {}",
            line.line + 1, card->record.begin_line + 1));
      }
      card.emplace();
      card->record.begin_line = line.line;
      continue;
    }

    if (name == "END" && IsKeyword(*parsed, "vcard")) {
      if (!card) {
        return std::unexpected(
            fmt::format("line {}: END:VCARD without BEGIN", line.line + 1));
      }
      if (!card->record.formatted_name && card->structured_name) {
        card->record.formatted_name = std::move(card->structured_name);
      }
      records.push_back(std::move(card->record));
      card.reset();
      continue;
    }

    if (!card) {
      return std::unexpected(fmt::format(
          "line {}: property {} outside of a card", line.line + 1, name));
    }
    AddToCard(*card, std::move(*parsed));
  }

  if (card) {
    return std::unexpected(fmt::format(
        "card started at line {} is not closed",
        card->record.begin_line + 1));
  }
  return records;
}

auto EscapeVCardValue(std::string_view value) -> std::string {
  std::string result;
  result.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '\\':
        result += "\\\\";
        break;
      case ',':
        result += "\\,";
        break;
      case ';':
        result += "\\;";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        break;
      default:
        result += c;
    }
  }
  return result;
}

}  // namespace maills::contacts
