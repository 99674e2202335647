#include "mcpeasy/services/slack/mcp.hpp"

#include "mcpeasy/exceptions.hpp"
#include "mcpeasy/tools/arguments.hpp"

#include <algorithm>
#include <sstream>

namespace mcpeasy::slack
{

namespace
{
using tools::object_schema;

tools::Tool make_tool(McpServer& server, SlackTool id, std::string description, Json schema)
{
    return tools::Tool(to_string(id), std::move(description), std::move(schema),
                       [&server, id](const Json& args) { return server.call(id, args); });
}

std::vector<tools::Tool> slack_tools(McpServer& server)
{
    std::vector<tools::Tool> out;
    out.push_back(make_tool(server, SlackTool::TestConnection, "Test the Slack API connection",
                            object_schema()));
    out.push_back(make_tool(
        server, SlackTool::ListChannels,
        "List available Slack channels. When asked to list ALL channels, automatically retrieve "
        "all pages by calling this tool multiple times with the cursor parameter to get complete "
        "results.",
        object_schema(
            {{"limit",
              {{"type", "number"},
               {"description", "Maximum number of channels to return (default: 100, max: 1000)"}}},
             {"cursor",
              {{"type", "string"},
               {"description", "Cursor for pagination. Use the next_cursor from previous "
                               "response to get next page"}}},
             {"exclude_archived",
              {{"type", "boolean"},
               {"description", "Exclude archived channels from results (default: true)"}}}})));
    out.push_back(make_tool(
        server, SlackTool::PostMessage, "Post a message to a Slack channel",
        object_schema(
            {{"channel",
              {{"type", "string"}, {"description", "The Slack channel name (with or without #)"}}},
             {"text", {{"type", "string"}, {"description", "The message text to post"}}},
             {"username",
              {{"type", "string"}, {"description", "Optional custom username for the message"}}},
             {"thread_ts",
              {{"type", "string"},
               {"description", "Optional timestamp of parent message to reply to"}}}},
            {"channel", "text"})));
    return out;
}
} // namespace

std::string to_string(SlackTool tool)
{
    switch (tool)
    {
    case SlackTool::TestConnection:
        return "test_connection";
    case SlackTool::ListChannels:
        return "list_channels";
    case SlackTool::PostMessage:
        return "post_message";
    }
    return "unknown";
}

std::optional<SlackTool> slack_tool_from_string(const std::string& name)
{
    for (auto tool : {SlackTool::TestConnection, SlackTool::ListChannels, SlackTool::PostMessage})
        if (to_string(tool) == name)
            return tool;
    return std::nullopt;
}

McpServer::McpServer(ClientFactory factory)
    : client_(std::move(factory)),
      definition_{ServerInfo{SERVER_NAME, "1.0.0"}, tools::ToolRegistry(slack_tools(*this)),
                  prompts::PromptRegistry()}
{
}

std::string McpServer::call(SlackTool tool, const Json& arguments)
{
    switch (tool)
    {
    case SlackTool::TestConnection:
        return test_connection();
    case SlackTool::ListChannels:
        return list_channels(arguments);
    case SlackTool::PostMessage:
        return post_message(arguments);
    }
    throw Error("unhandled Slack tool");
}

std::string McpServer::test_connection()
{
    auto info = client_.get().test_connection();
    return "✅ Successfully connected to Slack. Bot: " + info.user + ", Team: " + info.team;
}

std::string McpServer::list_channels(const Json& arguments)
{
    long long requested = tools::optional_int(arguments, "limit").value_or(DEFAULT_CHANNEL_LIMIT);
    int limit = static_cast<int>(std::clamp<long long>(requested, 1, MAX_CHANNEL_LIMIT));
    std::string cursor = tools::optional_string(arguments, "cursor").value_or("");
    bool exclude_archived = tools::optional_bool(arguments, "exclude_archived").value_or(true);

    auto result = client_.get().list_channels(limit, cursor, exclude_archived);

    // Counted only once the upstream call succeeded, so a failed request does
    // not skew the displayed page numbers.
    auto page = channel_pages_.begin(cursor, limit);
    if (result.has_more)
        channel_pages_.advance(cursor, result.next_cursor);

    const int count = static_cast<int>(result.channels.size());
    std::ostringstream out;
    out << "📋 " << count << " Available channels: ";
    for (size_t i = 0; i < result.channels.size(); ++i)
    {
        if (i > 0)
            out << ", ";
        out << "#" << result.channels[i].name << " (ID: " << result.channels[i].id << ")";
    }
    out << "\n📄 **Page " << page.page << "** | ";
    if (count == 0)
        out << "No channels on this page";
    else
        out << "Showing channels " << page.first_item() << "-" << page.last_item(count);

    if (result.has_more)
        out << "\n_More channels available. Use `cursor: \"" << result.next_cursor
            << "\"` to get the next page._\n";
    else
        out << " of " << page.last_item(count) << " total\n";
    out << "\n";
    return out.str();
}

std::string McpServer::post_message(const Json& arguments)
{
    std::string channel = clean_channel_name(tools::require_string(arguments, "channel"));
    std::string text = tools::require_string(arguments, "text");
    std::string username = tools::optional_string(arguments, "username").value_or("");
    std::string thread_ts = tools::optional_string(arguments, "thread_ts").value_or("");

    auto posted = client_.get().post_message(channel, text, username, thread_ts);
    return "✅ Message posted successfully to #" + channel +
           " (Message timestamp: " + posted.ts + ")";
}

} // namespace mcpeasy::slack
