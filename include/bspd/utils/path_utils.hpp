#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace bspd {

// URI operations
[[nodiscard]] auto UriToPath(std::string_view uri) -> std::filesystem::path;
[[nodiscard]] auto PathToUri(const std::filesystem::path& path) -> std::string;
[[nodiscard]] auto NormalizePath(std::filesystem::path path)
    -> std::filesystem::path;

// Last non-empty segment of a URI or path, e.g. "file:///work/app/" -> "app"
[[nodiscard]] auto LastSegment(std::string_view uri) -> std::string;

}  // namespace bspd
