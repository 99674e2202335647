#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace mcpeasy
{

using Json = nlohmann::json;

struct TextContent
{
    std::string type{"text"};
    std::string text;
};

/// Result envelope of tools/call.
struct ToolCallResult
{
    std::vector<TextContent> content;
    bool isError{false};
};

// nlohmann::json adapters
inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

inline void from_json(const Json& j, TextContent& c)
{
    c.type = j.value("type", std::string("text"));
    c.text = j.at("text").get<std::string>();
}

inline void to_json(Json& j, const ToolCallResult& r)
{
    j = Json{{"content", r.content}, {"isError", r.isError}};
}

inline void from_json(const Json& j, ToolCallResult& r)
{
    r.content = j.at("content").get<std::vector<TextContent>>();
    r.isError = j.value("isError", false);
}

} // namespace mcpeasy
