#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace maills {

// File type checks
[[nodiscard]] auto IsVCardFile(const std::filesystem::path& path) -> bool;

// URI operations
[[nodiscard]] auto UriToPath(std::string_view uri) -> std::filesystem::path;
[[nodiscard]] auto PathToUri(const std::filesystem::path& path) -> std::string;

// Canonical when the path exists, otherwise absolute and lexically normal
[[nodiscard]] auto NormalizePath(std::filesystem::path path)
    -> std::filesystem::path;

// "~" and "~/..." expand against $HOME; anything else is returned unchanged
[[nodiscard]] auto ExpandHomePath(std::string_view path)
    -> std::filesystem::path;

}  // namespace maills
