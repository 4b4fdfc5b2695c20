#include "maills/mail/mailbox.hpp"

#include <algorithm>
#include <cctype>

namespace maills::mail {

auto IsLocalPartChar(char c) -> bool {
  auto u = static_cast<unsigned char>(c);
  return std::isalnum(u) != 0 || c == '.' || c == '_' || c == '%' ||
         c == '+' || c == '-';
}

auto IsDomainChar(char c) -> bool {
  auto u = static_cast<unsigned char>(c);
  return std::isalnum(u) != 0 || c == '-' || c == '.';
}

auto IsAddressChar(char c) -> bool {
  return IsLocalPartChar(c) || c == '@';
}

auto MatchAddressAt(std::string_view text, std::size_t start) -> std::size_t {
  if (start >= text.size() || !IsLocalPartChar(text[start])) {
    return 0;
  }
  if (start > 0 && IsAddressChar(text[start - 1])) {
    return 0;
  }

  auto at = start;
  while (at < text.size() && IsLocalPartChar(text[at])) {
    ++at;
  }
  if (at >= text.size() || text[at] != '@') {
    return 0;
  }

  auto domain_start = at + 1;
  auto domain_end = domain_start;
  while (domain_end < text.size() && IsDomainChar(text[domain_end])) {
    ++domain_end;
  }
  // Trailing dots end a sentence, not the domain
  while (domain_end > domain_start && text[domain_end - 1] == '.') {
    --domain_end;
  }

  auto domain = text.substr(domain_start, domain_end - domain_start);
  if (domain.empty() || domain.front() == '.' ||
      domain.find("..") != std::string_view::npos) {
    return 0;
  }
  auto last_dot = domain.rfind('.');
  if (last_dot == std::string_view::npos) {
    return 0;
  }
  auto tld = domain.substr(last_dot + 1);
  if (tld.size() < 2 || !std::ranges::all_of(tld, [](char c) {
        return std::isalpha(static_cast<unsigned char>(c)) != 0;
      })) {
    return 0;
  }

  // "a@b.com@c" is not an address
  if (domain_end < text.size() && text[domain_end] == '@') {
    return 0;
  }
  return domain_end - start;
}

auto IsValidAddress(std::string_view text) -> bool {
  return !text.empty() && MatchAddressAt(text, 0) == text.size();
}

auto Trim(std::string_view text) -> std::string_view {
  auto is_space = [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

auto ToLower(std::string_view text) -> std::string {
  std::string result(text);
  std::ranges::transform(result, result.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return result;
}

auto NormalizeAddress(std::string_view address) -> std::string {
  return ToLower(Trim(address));
}

auto ParseMailbox(std::string_view text) -> std::optional<Mailbox> {
  text = Trim(text);
  auto open = text.rfind('<');
  if (open == std::string_view::npos) {
    if (!IsValidAddress(text)) {
      return std::nullopt;
    }
    return Mailbox{.name = std::nullopt, .address = std::string(text)};
  }

  if (text.back() != '>') {
    return std::nullopt;
  }
  auto address = Trim(text.substr(open + 1, text.size() - open - 2));
  if (!IsValidAddress(address)) {
    return std::nullopt;
  }

  auto name = Trim(text.substr(0, open));
  if (name.size() >= 2 && name.front() == '"' && name.back() == '"') {
    name = Trim(name.substr(1, name.size() - 2));
  }

  Mailbox mailbox{.name = std::nullopt, .address = std::string(address)};
  if (!name.empty()) {
    std::string unescaped;
    for (std::size_t i = 0; i < name.size(); ++i) {
      if (name[i] == '\\' && i + 1 < name.size()) {
        ++i;
      }
      unescaped += name[i];
    }
    mailbox.name = std::move(unescaped);
  }
  return mailbox;
}

auto FormatMailbox(const Mailbox& mailbox) -> std::string {
  if (!mailbox.name || mailbox.name->empty()) {
    return mailbox.address;
  }

  constexpr std::string_view kSpecials = "()<>[]:;@\\,.\"";
  const auto& name = *mailbox.name;
  if (name.find_first_of(kSpecials) == std::string::npos) {
    return name + " <" + mailbox.address + ">";
  }

  std::string quoted = "\"";
  for (char c : name) {
    if (c == '"' || c == '\\') {
      quoted += '\\';
    }
    quoted += c;
  }
  quoted += "\" <" + mailbox.address + ">";
  return quoted;
}

}  // namespace maills::mail
