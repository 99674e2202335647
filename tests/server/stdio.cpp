/// @file stdio.cpp
/// @brief Tests for the line-delimited stdio serving loop

#include "mcpeasy/server/stdio_server.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <cassert>
#include <csignal>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace mcpeasy;

static std::vector<Json> response_lines(const std::string& output)
{
    std::vector<Json> out;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line))
    {
        assert(!line.empty());
        out.push_back(Json::parse(line));
    }
    return out;
}

static mcp::ServiceDefinition echo_service()
{
    std::vector<tools::Tool> tools;
    tools.emplace_back("echo", "Echo text", tools::object_schema(),
                       [](const Json& args) { return args.value("text", std::string()); });
    return mcp::ServiceDefinition{ServerInfo{"echo-server", "1.0.0"},
                                  tools::ToolRegistry(std::move(tools)), prompts::PromptRegistry()};
}

int main()
{
    std::ostringstream errors, startup;
    logging::Logger log("echo", std::make_shared<spdlog::sinks::ostream_sink_mt>(errors),
                        std::make_shared<spdlog::sinks::ostream_sink_mt>(startup));
    auto service = echo_service();
    mcp::Dispatcher dispatcher(service, log);

    std::cout << "Test: full session over streams...\n";
    {
        std::istringstream in(
            R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
            R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
            "\n"
            "   \r\n"
            R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n"
            R"(  {"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"echo","arguments":{"text":"héllo"}}}  )" "\n");
        std::ostringstream out;

        server::StdioServerWrapper server(dispatcher.as_handler(), log, in, out);
        assert(server.run());
        assert(!server.running());

        auto responses = response_lines(out.str());
        assert(responses.size() == 3);
        assert(server.responses_written() == 3);
        assert(responses[0]["id"] == 1);
        assert(responses[0]["result"]["serverInfo"]["name"] == "echo-server");
        assert(responses[1]["id"] == 2);
        assert(responses[2]["id"] == 3);
        assert(responses[2]["result"]["content"][0]["text"] == "héllo");

        assert(startup.str().find("echo MCP Server starting on stdio") != std::string::npos);
        assert(startup.str().find("client disconnected") != std::string::npos);
    }
    std::cout << "  [PASS]\n";

    std::cout << "Test: malformed lines are answered and skipped...\n";
    {
        std::istringstream in(
            "{not json\n"
            R"({"jsonrpc":"2.0","id":9,"method":"tools/list"})" "\n"
            "[1,2\n");
        std::ostringstream out;

        server::StdioServerWrapper server(dispatcher.as_handler(), log, in, out);
        server.run();

        auto responses = response_lines(out.str());
        assert(responses.size() == 3);
        assert(responses[0]["error"]["code"] == -32700);
        assert(responses[0]["error"]["message"] == "Parse error");
        assert(responses[0].contains("id") && responses[0]["id"].is_null());
        assert(responses[1]["id"] == 9);
        assert(responses[2]["error"]["code"] == -32700);
        assert(errors.str().find("Parse error") != std::string::npos);
    }
    std::cout << "  [PASS]\n";

    std::cout << "Test: handler exceptions...\n";
    {
        auto throwing = [](const Json&) -> std::optional<Json>
        { throw std::runtime_error("handler exploded"); };

        std::istringstream in(
            R"({"jsonrpc":"2.0","id":5,"method":"tools/list"})" "\n"
            R"({"jsonrpc":"2.0","method":"tools/list"})" "\n");
        std::ostringstream out;

        server::StdioServerWrapper server(throwing, log, in, out);
        server.run();

        // Only the request with an id is answered
        auto responses = response_lines(out.str());
        assert(responses.size() == 1);
        assert(responses[0]["id"] == 5);
        assert(responses[0]["error"]["code"] == -32603);
        assert(errors.str().find("handler exploded") != std::string::npos);
    }
    std::cout << "  [PASS]\n";

    std::cout << "Test: empty input exits cleanly...\n";
    {
        std::istringstream in("");
        std::ostringstream out;
        server::StdioServerWrapper server(dispatcher.as_handler(), log, in, out);
        assert(server.run());
        assert(out.str().empty());
    }
    std::cout << "  [PASS]\n";

    std::cout << "Test: broken output stream stops the loop...\n";
    {
        std::istringstream in(
            R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})" "\n"
            R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n");
        std::ostringstream out;
        out.setstate(std::ios::badbit);

        server::StdioServerWrapper server(dispatcher.as_handler(), log, in, out);
        server.run();
        assert(server.responses_written() == 0);
        // The second line was never consumed
        std::string rest;
        assert(std::getline(in, rest));
    }
    std::cout << "  [PASS]\n";

    // Must stay last: the interrupt flag is process-wide and never cleared.
    std::cout << "Test: SIGINT ends the loop between lines...\n";
    {
        std::ostringstream interrupt_startup;
        logging::Logger interrupt_log(
            "echo", std::make_shared<spdlog::sinks::ostream_sink_mt>(errors),
            std::make_shared<spdlog::sinks::ostream_sink_mt>(interrupt_startup));

        server::StdioServerWrapper::install_signal_handlers();
        assert(!server::StdioServerWrapper::interrupted());

        int handled = 0;
        auto interrupting = [&handled, &dispatcher](const Json& message) -> std::optional<Json>
        {
            ++handled;
            auto response = dispatcher.handle(message);
            std::raise(SIGINT);
            return response;
        };

        std::istringstream in(
            R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})" "\n"
            R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n"
            R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})" "\n");
        std::ostringstream out;

        server::StdioServerWrapper server(interrupting, interrupt_log, in, out);
        assert(server.run());
        assert(!server.running());
        assert(server::StdioServerWrapper::interrupted());

        // The request in flight is answered; nothing after the signal is read
        assert(handled == 1);
        auto responses = response_lines(out.str());
        assert(responses.size() == 1);
        assert(responses[0]["id"] == 1);
        std::string pending;
        assert(std::getline(in, pending));
        assert(pending.find("\"id\":2") != std::string::npos);

        assert(interrupt_startup.str().find("interrupted, shutting down") != std::string::npos);
        assert(interrupt_startup.str().find("client disconnected") == std::string::npos);
    }
    std::cout << "  [PASS]\n";

    std::cout << "\nAll stdio server tests passed!\n";
    return 0;
}
