#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace maills {

// Absolute, symlink-resolved path used as the identity of a contact source.
// Paths that do not exist are kept lexically normalized.
class CanonicalPath {
 public:
  CanonicalPath() = default;

  explicit CanonicalPath(std::filesystem::path path);

  static auto FromUri(std::string_view uri) -> CanonicalPath;

  [[nodiscard]] auto ToUri() const -> std::string;

  [[nodiscard]] auto Path() const -> const std::filesystem::path& {
    return path_;
  }
  [[nodiscard]] auto String() const -> const std::string& {
    return string_;
  }

  [[nodiscard]] auto Empty() const -> bool {
    return path_.empty();
  }

  [[nodiscard]] auto Parent() const -> CanonicalPath;

  // Resolves a possibly relative path against this directory
  [[nodiscard]] auto Resolve(const std::filesystem::path& relative) const
      -> CanonicalPath;

  friend auto operator==(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.string_ == rhs.string_;
  }

  friend auto operator<(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.string_ < rhs.string_;
  }

 private:
  std::filesystem::path path_;
  std::string string_;
};

}  // namespace maills

template <>
struct fmt::formatter<maills::CanonicalPath> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const maills::CanonicalPath& p, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(p.String(), ctx);
  }
};

template <>
struct std::hash<maills::CanonicalPath> {
  auto operator()(const maills::CanonicalPath& path) const noexcept
      -> std::size_t {
    return std::hash<std::string>{}(path.String());
  }
};
