#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace bsp {

// Optional fields are omitted on write and read back as nullopt when the key
// is absent or explicitly null.
template <typename T>
void to_json_optional(
    nlohmann::json& j, const std::string& key, const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}

template <typename T>
void from_json_optional(
    const nlohmann::json& j, const std::string& key, std::optional<T>& value) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    value = std::nullopt;
    return;
  }
  value = it->template get<T>();
}

template <typename T>
void to_json_required(
    nlohmann::json& j, const std::string& key, const T& value) {
  j[key] = value;
}

template <typename T>
void from_json_required(
    const nlohmann::json& j, const std::string& key, T& value) {
  j.at(key).get_to(value);
}

}  // namespace bsp
