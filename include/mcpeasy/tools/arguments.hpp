#pragma once
#include "mcpeasy/types.hpp"

#include <optional>
#include <string>

namespace mcpeasy::tools
{

// Argument accessors for tool handlers. Failures throw ValidationError with
// a message meant for the client.

/// Present, non-null and non-empty string, else "Missing required argument: <key>".
std::string require_string(const Json& args, const std::string& key);

std::optional<std::string> optional_string(const Json& args, const std::string& key);

/// Accepts numbers and numeric strings.
std::optional<long long> optional_int(const Json& args, const std::string& key);

std::optional<bool> optional_bool(const Json& args, const std::string& key);

} // namespace mcpeasy::tools
