#include "bspd/utils/path_utils.hpp"

#include <cctype>
#include <system_error>

#include <fmt/format.h>

namespace bspd {

namespace {

constexpr std::string_view kFileScheme = "file://";

auto HexValue(char c) -> int {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower >= 'a' && lower <= 'f') {
    return lower - 'a' + 10;
  }
  return -1;
}

auto NeedsEscape(unsigned char c) -> bool {
  return c == ' ' || c == '%' || c == '#' || c == '?' || c > 127 || c < 32;
}

}  // namespace

auto UriToPath(std::string_view uri) -> std::filesystem::path {
  if (!uri.starts_with(kFileScheme)) {
    return {uri};
  }

  std::string_view path = uri.substr(kFileScheme.size());

  // Windows: file:///C:/path -> C:/path
  if (path.size() >= 3 && path[0] == '/' && path[2] == ':') {
    path.remove_prefix(1);
  }

  // Decode percent-encoded sequences, keeping malformed ones verbatim
  std::string decoded;
  decoded.reserve(path.size());
  for (std::size_t i = 0; i < path.size(); ++i) {
    if (path[i] == '%' && i + 2 < path.size()) {
      int high = HexValue(path[i + 1]);
      int low = HexValue(path[i + 2]);
      if (high >= 0 && low >= 0) {
        decoded += static_cast<char>((high << 4) | low);
        i += 2;
        continue;
      }
    }
    decoded += path[i];
  }

  return NormalizePath(decoded);
}

auto PathToUri(const std::filesystem::path& path) -> std::string {
  std::string result(kFileScheme);
  const auto& native = path.string();

  if (native.size() >= 2 && native[1] == ':') {
    result += '/';
  }

  for (char c : native) {
    if (NeedsEscape(static_cast<unsigned char>(c))) {
      result += fmt::format("%{:02X}", static_cast<unsigned char>(c));
    } else {
      result += c;
    }
  }

  return result;
}

auto NormalizePath(std::filesystem::path path) -> std::filesystem::path {
  // Existing files resolve symlinks; other paths are only made absolute
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    auto canonical = std::filesystem::canonical(path, ec);
    if (!ec) {
      return canonical;
    }
  }
  auto absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return path.lexically_normal();
  }
  return absolute.lexically_normal();
}

auto LastSegment(std::string_view uri) -> std::string {
  while (!uri.empty() && uri.back() == '/') {
    uri.remove_suffix(1);
  }
  auto pos = uri.find_last_of('/');
  if (pos == std::string_view::npos) {
    return std::string(uri);
  }
  return std::string(uri.substr(pos + 1));
}

}  // namespace bspd
