#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace bspd {

// Filesystem path normalized on construction, so that two spellings of the
// same existing file compare equal and produce the same file URI.
class CanonicalPath {
 public:
  CanonicalPath() = default;

  explicit CanonicalPath(std::filesystem::path path);

  static auto FromUri(std::string_view uri) -> CanonicalPath;

  [[nodiscard]] auto ToUri() const -> std::string;

  [[nodiscard]] auto Path() const -> const std::filesystem::path&;
  [[nodiscard]] auto String() const -> const std::string&;

  friend auto operator==(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.String() == rhs.String();
  }

  auto operator/(const std::filesystem::path& rhs) const -> CanonicalPath;

 private:
  std::filesystem::path path_;
  std::string string_;
};

}  // namespace bspd

// Format support for logging
template <>
struct fmt::formatter<bspd::CanonicalPath> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const bspd::CanonicalPath& p, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(p.String(), ctx);
  }
};

