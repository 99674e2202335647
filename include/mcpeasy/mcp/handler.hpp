#pragma once
#include "mcpeasy/logging.hpp"
#include "mcpeasy/mcp/errors.hpp"
#include "mcpeasy/mcp/invoker.hpp"
#include "mcpeasy/prompts/registry.hpp"
#include "mcpeasy/tools/registry.hpp"
#include "mcpeasy/types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace mcpeasy::mcp
{

/// Handler contract shared by transports: one parsed JSON-RPC message in,
/// at most one response out (nullopt for notifications).
using McpHandler = std::function<std::optional<Json>(const Json&)>;

/// The closed set of methods this server answers.
enum class Method
{
    Initialize,
    Initialized, ///< notifications/initialized
    ToolsList,
    ToolsCall,
    PromptsList,
    PromptsGet
};

std::optional<Method> method_from_string(const std::string& name);
std::string to_string(Method method);

/// Everything a service contributes to the protocol server.
struct ServiceDefinition
{
    ServerInfo info;
    tools::ToolRegistry tools;
    prompts::PromptRegistry prompts;
};

/**
 * Routes one JSON-RPC message by method name.
 *
 * Pure routing: registries answer list calls, the ToolInvoker answers
 * tools/call, and every failure leaves as exactly one of the two error
 * shapes (protocol error object or isError result). Messages whose id is
 * absent or null are notifications and produce no response.
 */
class Dispatcher
{
  public:
    Dispatcher(const ServiceDefinition& service, logging::Logger& log);

    std::optional<Json> handle(const Json& message) const;

    /// Convenience for transports.
    McpHandler as_handler() const
    {
        return [this](const Json& message) { return handle(message); };
    }

  private:
    Json dispatch(Method method, const Json& id, const Json& params) const;

    Json initialize(const Json& id) const;
    Json tools_list(const Json& id) const;
    Json tools_call(const Json& id, const Json& params) const;
    Json prompts_list(const Json& id) const;
    Json prompts_get(const Json& id, const Json& params) const;

    const ServiceDefinition& service_;
    logging::Logger& log_;
    ToolInvoker invoker_;
};

} // namespace mcpeasy::mcp
