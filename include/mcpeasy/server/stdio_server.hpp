#pragma once
#include "mcpeasy/logging.hpp"
#include "mcpeasy/mcp/handler.hpp"
#include "mcpeasy/types.hpp"

#include <atomic>
#include <iostream>
#include <string>

namespace mcpeasy::server
{

/**
 * STDIO-based MCP server for line-delimited JSON-RPC communication.
 *
 * Reads one JSON-RPC message per line from the input stream and writes at
 * most one response line per message, flushing after each. The output
 * stream carries protocol frames only; diagnostics go to the Logger.
 *
 * Usage:
 *   mcp::Dispatcher dispatcher(service, log);
 *   StdioServerWrapper server(dispatcher.as_handler(), log);
 *   server.run();  // Blocking - returns on EOF, SIGINT/SIGTERM or stop()
 */
class StdioServerWrapper
{
  public:
    using McpHandler = mcp::McpHandler;

    StdioServerWrapper(McpHandler handler, logging::Logger& log, std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    ~StdioServerWrapper();

    /**
     * Serve until the input stream closes or an interrupt arrives.
     *
     * End of stream and interrupts are ordinary shutdown paths, not errors.
     *
     * @return false if the server was already running
     */
    bool run();

    /// Ask the loop to exit after the current line.
    void stop();

    bool running() const
    {
        return running_.load();
    }

    /// Lines answered with a response so far.
    size_t responses_written() const
    {
        return responses_written_;
    }

    /// Route SIGINT/SIGTERM to a flag so a blocked read returns and run() exits
    /// cleanly. Installed without SA_RESTART.
    static void install_signal_handlers();

    /// True once SIGINT or SIGTERM has been received.
    static bool interrupted();

  private:
    void run_loop();
    void handle_line(const std::string& line);
    bool write_response(const Json& response);

    McpHandler handler_;
    logging::Logger& log_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    size_t responses_written_{0};
};

} // namespace mcpeasy::server
