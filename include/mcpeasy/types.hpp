#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mcpeasy
{

using Json = nlohmann::json;

/// MCP protocol revision announced during initialize.
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

/// Identity reported in the initialize handshake.
struct ServerInfo
{
    std::string name;
    std::string version{"1.0.0"};
};

inline void to_json(Json& j, const ServerInfo& info)
{
    j = Json{{"name", info.name}, {"version", info.version}};
}

inline void from_json(const Json& j, ServerInfo& info)
{
    info.name = j.at("name").get<std::string>();
    if (j.contains("version"))
        info.version = j["version"].get<std::string>();
}

} // namespace mcpeasy
