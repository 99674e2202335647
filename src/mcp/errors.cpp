#include "mcpeasy/mcp/errors.hpp"

namespace mcpeasy::mcp
{

ProtocolError parse_error(const std::string& detail)
{
    return {error_code::PARSE_ERROR, "Parse error", detail};
}

ProtocolError invalid_request(const std::string& detail)
{
    return {error_code::INVALID_REQUEST, "Invalid Request", detail};
}

ProtocolError method_not_found(const std::string& method)
{
    return {error_code::METHOD_NOT_FOUND, "Method not found", "Unknown method: " + method};
}

ProtocolError unknown_tool(const std::string& name)
{
    return {error_code::INVALID_PARAMS, "Unknown tool", "Tool '" + name + "' not found"};
}

ProtocolError unknown_prompt(const std::string& name)
{
    return {error_code::INVALID_PARAMS, "Unknown prompt", "Prompt '" + name + "' not found"};
}

ProtocolError invalid_params(const std::string& detail)
{
    return {error_code::INVALID_PARAMS, "Invalid params", detail};
}

ProtocolError internal_error(const std::string& detail)
{
    return {error_code::INTERNAL_ERROR, "Internal error", detail};
}

Json jsonrpc_result(const Json& id, Json result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

Json jsonrpc_error(const Json& id, const ProtocolError& error)
{
    Json err = {{"code", error.code}, {"message", error.message}};
    if (!error.data.is_null())
        err["data"] = error.data;
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"error", err}};
}

ToolCallResult tool_call_result(const std::string& text, bool is_error)
{
    ToolCallResult result;
    result.content.push_back(TextContent{"text", text});
    result.isError = is_error;
    return result;
}

Json to_response(const Json& id, const InvocationResult& outcome)
{
    if (const auto* ok = std::get_if<ToolSuccess>(&outcome))
        return jsonrpc_result(id, tool_call_result(ok->text, false));
    if (const auto* failed = std::get_if<BusinessError>(&outcome))
        return jsonrpc_result(id, tool_call_result(BUSINESS_ERROR_PREFIX + failed->message, true));
    return jsonrpc_error(id, std::get<ProtocolError>(outcome));
}

} // namespace mcpeasy::mcp
