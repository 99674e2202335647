#include "mcpeasy/mcp/handler.hpp"

#include "mcpeasy/util/json.hpp"

#include <utility>

namespace mcpeasy::mcp
{

namespace
{
bool is_notification(const Json& message)
{
    auto it = message.find("id");
    return it == message.end() || it->is_null();
}
} // namespace

std::optional<Method> method_from_string(const std::string& name)
{
    if (name == "initialize")
        return Method::Initialize;
    if (name == "notifications/initialized")
        return Method::Initialized;
    if (name == "tools/list")
        return Method::ToolsList;
    if (name == "tools/call")
        return Method::ToolsCall;
    if (name == "prompts/list")
        return Method::PromptsList;
    if (name == "prompts/get")
        return Method::PromptsGet;
    return std::nullopt;
}

std::string to_string(Method method)
{
    switch (method)
    {
    case Method::Initialize:
        return "initialize";
    case Method::Initialized:
        return "notifications/initialized";
    case Method::ToolsList:
        return "tools/list";
    case Method::ToolsCall:
        return "tools/call";
    case Method::PromptsList:
        return "prompts/list";
    case Method::PromptsGet:
        return "prompts/get";
    }
    return "unknown";
}

Dispatcher::Dispatcher(const ServiceDefinition& service, logging::Logger& log)
    : service_(service), log_(log), invoker_(service.tools, log)
{
}

std::optional<Json> Dispatcher::handle(const Json& message) const
{
    if (!message.is_object())
        return jsonrpc_error(Json(), invalid_request("request must be a JSON object"));

    const Json id = message.contains("id") ? message.at("id") : Json();
    const bool notification = is_notification(message);

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string())
        return jsonrpc_error(id, invalid_request("missing method"));
    const std::string method_name = method_it->get<std::string>();

    auto method = method_from_string(method_name);
    if (method == Method::Initialized)
        return std::nullopt;

    std::optional<Json> response;
    if (!method)
    {
        response = jsonrpc_error(id, method_not_found(method_name));
    }
    else
    {
        Json params = Json::object();
        auto params_it = message.find("params");
        if (params_it != message.end() && !params_it->is_null())
            params = *params_it;

        if (!params.is_object())
        {
            response = jsonrpc_error(id, invalid_params("params must be an object"));
        }
        else
        {
            try
            {
                response = dispatch(*method, id, params);
            }
            catch (const std::exception& e)
            {
                log_.error("Error handling request '" + method_name + "'", e);
                response = jsonrpc_error(id, internal_error(e.what()));
            }
        }
    }

    if (notification)
    {
        log_.debug("Dropping response to notification '" + method_name + "'");
        return std::nullopt;
    }
    return response;
}

Json Dispatcher::dispatch(Method method, const Json& id, const Json& params) const
{
    switch (method)
    {
    case Method::Initialize:
        return initialize(id);
    case Method::ToolsList:
        return tools_list(id);
    case Method::ToolsCall:
        return tools_call(id, params);
    case Method::PromptsList:
        return prompts_list(id);
    case Method::PromptsGet:
        return prompts_get(id, params);
    case Method::Initialized:
        break;
    }
    throw Error("no handler for method " + to_string(method));
}

Json Dispatcher::initialize(const Json& id) const
{
    Json capabilities = {{"tools", Json::object()}};
    if (!service_.prompts.empty())
        capabilities["prompts"] = Json::object();

    return jsonrpc_result(id, Json{{"protocolVersion", PROTOCOL_VERSION},
                                   {"capabilities", capabilities},
                                   {"serverInfo", service_.info}});
}

Json Dispatcher::tools_list(const Json& id) const
{
    Json tools_array = Json::array();
    for (const auto& tool : service_.tools.list())
        tools_array.push_back(tool.to_json());
    return jsonrpc_result(id, Json{{"tools", tools_array}});
}

Json Dispatcher::tools_call(const Json& id, const Json& params) const
{
    auto name = util::json::optional_string(params, "name");
    if (!name)
        return jsonrpc_error(id, invalid_params("Missing tool name"));

    Json arguments = Json::object();
    auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null())
    {
        if (!args_it->is_object())
            return jsonrpc_error(id, invalid_params("arguments must be an object"));
        arguments = *args_it;
    }

    return to_response(id, invoker_.invoke(*name, arguments));
}

Json Dispatcher::prompts_list(const Json& id) const
{
    Json prompts_array = Json::array();
    for (const auto& prompt : service_.prompts.list())
        prompts_array.push_back(prompt.to_json());
    return jsonrpc_result(id, Json{{"prompts", prompts_array}});
}

Json Dispatcher::prompts_get(const Json& id, const Json& params) const
{
    auto name = util::json::optional_string(params, "name");
    if (!name)
        return jsonrpc_error(id, invalid_params("Missing prompt name"));

    const prompts::Prompt* prompt = service_.prompts.find(*name);
    if (!prompt)
        return jsonrpc_error(id, unknown_prompt(*name));

    Json arguments = params.value("arguments", Json::object());
    if (arguments.is_null())
        arguments = Json::object();
    if (!arguments.is_object())
        return jsonrpc_error(id, invalid_params("arguments must be an object"));

    for (const auto& arg : prompt->arguments)
    {
        if (!arg.required)
            continue;
        auto it = arguments.find(arg.name);
        if (it == arguments.end() || it->is_null())
            return jsonrpc_error(id, invalid_params("Missing required argument: " + arg.name));
    }

    Json messages = Json::array();
    for (const auto& msg : prompt->messages(arguments))
        messages.push_back(
            {{"role", msg.role}, {"content", Json{{"type", "text"}, {"text", msg.text}}}});

    return jsonrpc_result(id, Json{{"description", prompt->description}, {"messages", messages}});
}

} // namespace mcpeasy::mcp
