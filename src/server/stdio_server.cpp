#include "mcpeasy/server/stdio_server.hpp"

#include "mcpeasy/exceptions.hpp"
#include "mcpeasy/mcp/errors.hpp"
#include "mcpeasy/util/json.hpp"

#include <csignal>
#include <string>

#ifndef _WIN32
#include <signal.h>
#endif

namespace mcpeasy::server
{

namespace
{
volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int)
{
    g_interrupted = 1;
}

std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
        return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

Json request_id(const Json& request)
{
    if (request.is_object() && request.contains("id"))
        return request["id"];
    return Json();
}
} // namespace

StdioServerWrapper::StdioServerWrapper(McpHandler handler, logging::Logger& log,
                                       std::istream& in, std::ostream& out)
    : handler_(std::move(handler)), log_(log), in_(in), out_(out)
{
}

StdioServerWrapper::~StdioServerWrapper()
{
    stop();
}

void StdioServerWrapper::install_signal_handlers()
{
#ifdef _WIN32
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);
#else
    struct sigaction sa = {};
    sa.sa_handler = on_interrupt;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART: a blocked read must return
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
#endif
}

bool StdioServerWrapper::interrupted()
{
    return g_interrupted != 0;
}

bool StdioServerWrapper::write_response(const Json& response)
{
    // Serialize completely before touching the stream so a failure never
    // leaves half a frame behind.
    std::string frame = response.dump(-1, ' ', false, Json::error_handler_t::replace);
    out_ << frame << '\n';
    out_.flush();
    if (!out_)
    {
        log_.error("Output stream failed; client gone");
        return false;
    }
    ++responses_written_;
    return true;
}

void StdioServerWrapper::handle_line(const std::string& line)
{
    Json request;
    try
    {
        request = util::json::parse(line);
    }
    catch (const Json::parse_error& e)
    {
        log_.warn(std::string("Parse error: ") + e.what());
        if (!write_response(mcp::jsonrpc_error(Json(), mcp::parse_error(e.what()))))
            stop_requested_ = true;
        return;
    }

    std::optional<Json> response;
    try
    {
        response = handler_(request);
    }
    catch (const std::exception& e)
    {
        log_.error("Error handling request", e);
        Json id = request_id(request);
        if (!id.is_null())
            response = mcp::jsonrpc_error(id, mcp::internal_error(e.what()));
    }

    if (response && !write_response(*response))
        stop_requested_ = true;
}

void StdioServerWrapper::run_loop()
{
    std::string line;

    while (!stop_requested_ && !interrupted() && std::getline(in_, line))
    {
        line = trim(line);
        // Skip empty lines
        if (line.empty())
            continue;

        try
        {
            handle_line(line);
        }
        catch (const std::exception& e)
        {
            log_.error("Error handling line", e);
        }
    }

    if (interrupted())
        log_.startup(log_.service() + " MCP Server interrupted, shutting down");
    else if (in_.eof())
        log_.startup(log_.service() + " MCP Server client disconnected");

    running_ = false;
}

bool StdioServerWrapper::run()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;
    log_.startup(log_.service() + " MCP Server starting on stdio");
    run_loop();

    return true;
}

void StdioServerWrapper::stop()
{
    stop_requested_ = true;
}

} // namespace mcpeasy::server
