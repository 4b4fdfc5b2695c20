#include "maills/utils/canonical_path.hpp"

#include "maills/utils/path_utils.hpp"

namespace maills {

CanonicalPath::CanonicalPath(std::filesystem::path path)
    : path_(NormalizePath(std::move(path))), string_(path_.string()) {
}

auto CanonicalPath::FromUri(std::string_view uri) -> CanonicalPath {
  return CanonicalPath(UriToPath(uri));
}

auto CanonicalPath::ToUri() const -> std::string {
  return PathToUri(path_);
}

auto CanonicalPath::Parent() const -> CanonicalPath {
  return CanonicalPath(path_.parent_path());
}

auto CanonicalPath::Resolve(const std::filesystem::path& relative) const
    -> CanonicalPath {
  if (relative.is_absolute()) {
    return CanonicalPath(relative);
  }
  return CanonicalPath(path_ / relative);
}

}  // namespace maills
