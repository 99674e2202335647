#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcpeasy::util::json {

using json = nlohmann::json;

inline json parse(const std::string& s) { return json::parse(s); }
inline std::string dump(const json& j) { return j.dump(); }
inline std::string dump_pretty(const json& j, int indent = 2) { return j.dump(indent); }

// Optional string member; absent, null or non-string yields nullopt
inline std::optional<std::string> optional_string(const json& obj, const std::string& key) {
  if (!obj.is_object()) return std::nullopt;
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return std::nullopt;
  return it->get<std::string>();
}

} // namespace mcpeasy::util::json
