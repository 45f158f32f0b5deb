#include "bspd/utils/canonical_path.hpp"

#include "bspd/utils/path_utils.hpp"

namespace bspd {

CanonicalPath::CanonicalPath(std::filesystem::path path)
    : path_(NormalizePath(std::move(path))), string_(path_.string()) {
}

auto CanonicalPath::FromUri(std::string_view uri) -> CanonicalPath {
  return CanonicalPath(UriToPath(uri));
}

auto CanonicalPath::ToUri() const -> std::string {
  return PathToUri(path_);
}

auto CanonicalPath::Path() const -> const std::filesystem::path& {
  return path_;
}

auto CanonicalPath::String() const -> const std::string& {
  return string_;
}

auto CanonicalPath::operator/(const std::filesystem::path& rhs) const
    -> CanonicalPath {
  return CanonicalPath(path_ / rhs);
}

}  // namespace bspd
