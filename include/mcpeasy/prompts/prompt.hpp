#pragma once
#include "mcpeasy/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpeasy::prompts
{

/// MCP Prompt argument definition
struct PromptArgument
{
    std::string name;
    std::string description;
    bool required{false};
};

/// MCP Prompt message
struct PromptMessage
{
    std::string role; // "user", "assistant"
    std::string text;
};

/// MCP Prompt definition
struct Prompt
{
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;

    /// Builds the messages; defaults to rendering `tmpl` as a single user message.
    std::function<std::vector<PromptMessage>(const Json&)> generator;

    /// Template with {arg} placeholders.
    std::string tmpl;

    std::vector<PromptMessage> messages(const Json& arguments) const;

    /// {name, description, arguments} as listed by prompts/list.
    Json to_json() const;
};

/// Replace every {key} in tmpl. Keys without a value are left as written.
std::string render(const std::string& tmpl,
                   const std::unordered_map<std::string, std::string>& vars);

/// Prompt argument values as strings; non-string values are serialized.
std::unordered_map<std::string, std::string> string_arguments(const Json& arguments);

} // namespace mcpeasy::prompts
