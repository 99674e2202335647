#pragma once
#include "mcpeasy/mcp/handler.hpp"
#include "mcpeasy/mcp/invoker.hpp"
#include "mcpeasy/services/slack/service.hpp"
#include "mcpeasy/util/pagination.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mcpeasy::slack
{

constexpr const char* SERVICE_NAME = "slack";
constexpr const char* SERVER_NAME = "slack-mcp-server";
constexpr int DEFAULT_CHANNEL_LIMIT = 100;

enum class SlackTool
{
    TestConnection,
    ListChannels,
    PostMessage
};

std::string to_string(SlackTool tool);
std::optional<SlackTool> slack_tool_from_string(const std::string& name);

/**
 * Slack tools exposed over MCP.
 *
 * The Slack client is built on the first tools/call, so initialize and
 * tools/list need no token. Holds the list_channels page counters.
 */
class McpServer
{
  public:
    using ClientFactory = std::function<std::unique_ptr<Client>()>;

    explicit McpServer(ClientFactory factory);

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    const mcp::ServiceDefinition& definition() const
    {
        return definition_;
    }

    std::string call(SlackTool tool, const Json& arguments);

    bool client_constructed() const
    {
        return client_.constructed();
    }

  private:
    std::string test_connection();
    std::string list_channels(const Json& arguments);
    std::string post_message(const Json& arguments);

    mcp::LazyClient<Client> client_;
    util::pagination::PageTracker channel_pages_;
    mcp::ServiceDefinition definition_;
};

} // namespace mcpeasy::slack
