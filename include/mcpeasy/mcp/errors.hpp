#pragma once
#include "mcpeasy/content.hpp"
#include "mcpeasy/types.hpp"

#include <string>
#include <variant>

namespace mcpeasy::mcp
{

/// JSON-RPC 2.0 error codes used on the wire.
namespace error_code
{
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
} // namespace error_code

/// Handler returned normally.
struct ToolSuccess
{
    std::string text;
};

/// Handler failed; reported inside a successful envelope with isError:true.
struct BusinessError
{
    std::string message;
};

/// Request-level fault; reported as a JSON-RPC error object.
struct ProtocolError
{
    int code{error_code::INTERNAL_ERROR};
    std::string message;
    Json data; ///< null when absent
};

using InvocationResult = std::variant<ToolSuccess, BusinessError, ProtocolError>;

/// Prefix shown to the client in front of a business error message.
constexpr const char* BUSINESS_ERROR_PREFIX = "❌ Error: ";

ProtocolError parse_error(const std::string& detail);
ProtocolError invalid_request(const std::string& detail);
ProtocolError method_not_found(const std::string& method);
ProtocolError unknown_tool(const std::string& name);
ProtocolError unknown_prompt(const std::string& name);
ProtocolError invalid_params(const std::string& detail);
ProtocolError internal_error(const std::string& detail);

/// {"jsonrpc":"2.0","id":id,"result":result}
Json jsonrpc_result(const Json& id, Json result);

/// {"jsonrpc":"2.0","id":id|null,"error":{code,message[,data]}}
Json jsonrpc_error(const Json& id, const ProtocolError& error);

/// The tools/call result payload for a success or business error.
ToolCallResult tool_call_result(const std::string& text, bool is_error);

/// Exactly one response shape per outcome: result envelope for ToolSuccess and
/// BusinessError, error object for ProtocolError.
Json to_response(const Json& id, const InvocationResult& outcome);

} // namespace mcpeasy::mcp
