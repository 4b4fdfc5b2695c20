#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace maills::mail {

// A display name plus a bare address, as in `"Jane Doe" <jane@example.com>`
struct Mailbox {
  std::optional<std::string> name;
  std::string address;

  friend auto operator==(const Mailbox&, const Mailbox&) -> bool = default;
};

// Character classes of the address token grammar
[[nodiscard]] auto IsLocalPartChar(char c) -> bool;
[[nodiscard]] auto IsDomainChar(char c) -> bool;
// Any character that may appear in an address being typed
[[nodiscard]] auto IsAddressChar(char c) -> bool;

// Length of the address-shaped token starting at text[start], or 0. The
// domain needs at least one dot and a final label of two or more letters.
// Trailing dots are not consumed.
[[nodiscard]] auto MatchAddressAt(std::string_view text, std::size_t start)
    -> std::size_t;

// True when the whole of text is one address token
[[nodiscard]] auto IsValidAddress(std::string_view text) -> bool;

// Index key: surrounding whitespace trimmed, ASCII lowercased
[[nodiscard]] auto NormalizeAddress(std::string_view address) -> std::string;

// "addr", "Name <addr>" or "\"Quoted Name\" <addr>". nullopt when the
// address part is not a valid address.
[[nodiscard]] auto ParseMailbox(std::string_view text)
    -> std::optional<Mailbox>;

// Inverse of ParseMailbox. Names containing RFC 5322 specials are quoted.
[[nodiscard]] auto FormatMailbox(const Mailbox& mailbox) -> std::string;

[[nodiscard]] auto Trim(std::string_view text) -> std::string_view;
[[nodiscard]] auto ToLower(std::string_view text) -> std::string;

}  // namespace maills::mail
