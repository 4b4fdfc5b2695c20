#include "maills/mail/address_extractor.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "maills/mail/mailbox.hpp"

namespace maills::mail {

namespace {

struct Line {
  std::size_t start;
  // End of content, before any "\r\n"
  std::size_t end;
  // Start of the next line
  std::size_t next;
};

auto SplitLines(std::string_view text) -> std::vector<Line> {
  std::vector<Line> lines;
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto newline = text.find('\n', pos);
    if (newline == std::string_view::npos) {
      lines.push_back({pos, text.size(), text.size()});
      break;
    }
    auto end = newline;
    if (end > pos && text[end - 1] == '\r') {
      --end;
    }
    lines.push_back({pos, end, newline + 1});
    pos = newline + 1;
  }
  return lines;
}

auto LineText(std::string_view text, const Line& line) -> std::string_view {
  return text.substr(line.start, line.end - line.start);
}

auto IsBlank(std::string_view line) -> bool {
  return Trim(line).empty();
}

auto IsContinuation(std::string_view line) -> bool {
  return !line.empty() && (line.front() == ' ' || line.front() == '\t');
}

// Length of "Field-Name" in "Field-Name: value", or 0
auto HeaderNameLength(std::string_view line) -> std::size_t {
  std::size_t i = 0;
  while (i < line.size() &&
         (std::isalnum(static_cast<unsigned char>(line[i])) != 0 ||
          line[i] == '-')) {
    ++i;
  }
  if (i == 0 || i >= line.size() || line[i] != ':') {
    return 0;
  }
  return i;
}

auto IsFrontMatterFence(std::string_view line) -> bool {
  return Trim(line) == "---";
}

// Walks header lines from lines[first] and collects address-bearing regions.
// Returns the index of the first line after the block.
auto CollectHeaders(
    std::string_view text, const std::vector<Line>& lines, std::size_t first,
    bool fenced, std::vector<AddressRegion>& regions) -> std::size_t {
  std::optional<AddressRegion> current;
  auto flush = [&]() {
    if (current) {
      regions.push_back(std::move(*current));
      current.reset();
    }
  };

  std::size_t i = first;
  for (; i < lines.size(); ++i) {
    auto line = LineText(text, lines[i]);
    if ((fenced && IsFrontMatterFence(line)) || (!fenced && IsBlank(line))) {
      break;
    }
    if (IsContinuation(line)) {
      if (current) {
        current->end = lines[i].end;
      }
      continue;
    }
    auto name_length = HeaderNameLength(line);
    if (name_length == 0) {
      break;
    }
    flush();
    auto name = line.substr(0, name_length);
    if (IsAddressHeader(name)) {
      current = AddressRegion{
          .start = lines[i].start + name_length + 1,
          .end = lines[i].end,
          .header = std::string(name)};
    }
  }
  flush();
  return i;
}

// Name immediately before "<" at angle, quoted or bare, or nullopt
auto DisplayNameBefore(
    std::string_view text, std::size_t floor, std::size_t angle)
    -> std::optional<std::string> {
  auto end = angle;
  while (end > floor && (text[end - 1] == ' ' || text[end - 1] == '\t')) {
    --end;
  }
  if (end == floor) {
    return std::nullopt;
  }

  if (text[end - 1] == '"') {
    auto closing = end - 1;
    if (closing == floor) {
      return std::nullopt;
    }
    auto open = text.rfind('"', closing - 1);
    if (open == std::string_view::npos || open < floor) {
      return std::nullopt;
    }
    auto name = Trim(text.substr(open + 1, closing - open - 1));
    if (name.empty()) {
      return std::nullopt;
    }
    return std::string(name);
  }

  auto is_name_char = [](char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) != 0 || u >= 0x80 || c == ' ' || c == '\t' ||
           c == '-' || c == '\'' || c == '.' || c == '_';
  };
  auto start = end;
  while (start > floor && is_name_char(text[start - 1])) {
    --start;
  }
  auto name = Trim(text.substr(start, end - start));
  if (name.empty()) {
    return std::nullopt;
  }
  return std::string(name);
}

void ScanRegion(
    std::string_view text, const AddressRegion& region,
    std::vector<AddressToken>& tokens) {
  // Tokens never extend past the region
  auto bounded = text.substr(0, region.end);
  auto floor = region.start;

  std::size_t i = region.start;
  while (i < region.end) {
    if (!IsLocalPartChar(bounded[i])) {
      ++i;
      continue;
    }
    auto length = MatchAddressAt(bounded, i);
    if (length == 0) {
      while (i < region.end && IsAddressChar(bounded[i])) {
        ++i;
      }
      continue;
    }

    AddressToken token{
        .address = std::string(bounded.substr(i, length)),
        .start = i,
        .end = i + length,
        .display_name = std::nullopt,
        .header = region.header};
    if (i > floor && bounded[i - 1] == '<' && token.end < region.end &&
        bounded[token.end] == '>') {
      token.display_name = DisplayNameBefore(bounded, floor, i - 1);
    }
    floor = token.end;
    i = token.end;
    tokens.push_back(std::move(token));
  }
}

}  // namespace

auto IsAddressHeader(std::string_view field_name) -> bool {
  static constexpr std::array<std::string_view, 12> kHeaders = {
      "from",        "to",        "cc",
      "bcc",         "reply-to",  "sender",
      "resent-from", "resent-to", "resent-cc",
      "resent-bcc",  "mail-followup-to", "mail-reply-to"};
  auto lower = ToLower(field_name);
  return std::ranges::find(kHeaders, lower) != kHeaders.end();
}

auto SniffShape(std::string_view text) -> DocumentShape {
  auto lines = SplitLines(text);
  if (lines.empty()) {
    return FreeTextShape{};
  }

  HeaderShape shape;
  auto first = LineText(text, lines.front());
  if (IsFrontMatterFence(first)) {
    auto after = CollectHeaders(text, lines, 1, true, shape.header_regions);
    if (after >= lines.size() ||
        !IsFrontMatterFence(LineText(text, lines[after]))) {
      return FreeTextShape{};
    }
    if (shape.header_regions.empty()) {
      return FreeTextShape{};
    }
    shape.body_start = lines[after].next;
    return shape;
  }

  if (HeaderNameLength(first) == 0) {
    return FreeTextShape{};
  }
  auto after = CollectHeaders(text, lines, 0, false, shape.header_regions);
  // "Note: ..." or a URL is prose, not a mail header block
  if (shape.header_regions.empty()) {
    return FreeTextShape{};
  }
  shape.body_start = after < lines.size() ? lines[after].start : text.size();
  return shape;
}

auto AddressRegions(std::string_view text, const DocumentShape& shape)
    -> std::vector<AddressRegion> {
  if (std::holds_alternative<FreeTextShape>(shape)) {
    return {AddressRegion{.start = 0, .end = text.size(), .header = {}}};
  }
  const auto& headers = std::get<HeaderShape>(shape);
  auto regions = headers.header_regions;
  if (headers.body_start < text.size()) {
    regions.push_back(
        {.start = headers.body_start, .end = text.size(), .header = {}});
  }
  return regions;
}

auto ExtractAddresses(std::string_view text) -> std::vector<AddressToken> {
  std::vector<AddressToken> tokens;
  for (const auto& region : AddressRegions(text, SniffShape(text))) {
    ScanRegion(text, region, tokens);
  }
  return tokens;
}

auto TokenAt(const std::vector<AddressToken>& tokens, std::size_t offset)
    -> std::optional<AddressToken> {
  auto it = std::upper_bound(
      tokens.begin(), tokens.end(), offset,
      [](std::size_t value, const AddressToken& token) {
        return value < token.start;
      });
  if (it == tokens.begin()) {
    return std::nullopt;
  }
  --it;
  if (offset < it->end) {
    return *it;
  }
  return std::nullopt;
}

auto TokenAt(std::string_view text, std::size_t offset)
    -> std::optional<AddressToken> {
  return TokenAt(ExtractAddresses(text), offset);
}

auto CompletionContextAt(std::string_view text, std::size_t offset)
    -> std::optional<CompletionContext> {
  offset = std::min(offset, text.size());
  auto regions = AddressRegions(text, SniffShape(text));
  auto region = std::ranges::find_if(regions, [offset](const auto& r) {
    return r.start <= offset && offset <= r.end;
  });
  if (region == regions.end()) {
    return std::nullopt;
  }

  auto start = offset;
  while (start > region->start && IsAddressChar(text[start - 1])) {
    --start;
  }
  auto end = offset;
  while (end < region->end && IsAddressChar(text[end])) {
    ++end;
  }

  return CompletionContext{
      .prefix = std::string(text.substr(start, offset - start)),
      .replace_start = start,
      .replace_end = end,
      .in_header = region->header.has_value(),
      .after_angle = start > 0 && text[start - 1] == '<'};
}

}  // namespace maills::mail
