/// @file invoker.cpp
/// @brief Tests for tool invocation outcomes and lazy client construction

#include "mcpeasy/exceptions.hpp"
#include "mcpeasy/mcp/invoker.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace mcpeasy;

struct Counter
{
    int value{0};
};

int main()
{
    std::ostringstream errors;
    logging::Logger log("test", std::make_shared<spdlog::sinks::ostream_sink_mt>(errors), nullptr);

    tools::ToolRegistry registry({
        tools::Tool("ok", "", tools::object_schema(),
                    [](const Json&) { return std::string("fine"); }),
        tools::Tool("boom", "", tools::object_schema(),
                    [](const Json&) -> std::string
                    { throw std::runtime_error("upstream said no"); }),
    });
    mcp::ToolInvoker invoker(registry, log);

    std::cout << "Test: success...\n";
    {
        auto result = invoker.invoke("ok", Json::object());
        assert(std::holds_alternative<mcp::ToolSuccess>(result));
        assert(std::get<mcp::ToolSuccess>(result).text == "fine");
    }
    std::cout << "  [PASS]\n";

    std::cout << "Test: handler failure becomes a business error...\n";
    {
        auto result = invoker.invoke("boom", Json::object());
        assert(std::holds_alternative<mcp::BusinessError>(result));
        assert(std::get<mcp::BusinessError>(result).message == "upstream said no");
        assert(errors.str().find("Tool error in 'boom'") != std::string::npos);
        assert(errors.str().find("runtime_error") != std::string::npos);
    }
    std::cout << "  [PASS]\n";

    std::cout << "Test: unknown tool is a protocol error...\n";
    {
        auto result = invoker.invoke("missing", Json::object());
        assert(std::holds_alternative<mcp::ProtocolError>(result));
        assert(std::get<mcp::ProtocolError>(result).code == mcp::error_code::INVALID_PARAMS);
    }
    std::cout << "  [PASS]\n";

    std::cout << "Test: lazy client...\n";
    {
        int built = 0;
        mcp::LazyClient<Counter> lazy(
            [&built]()
            {
                ++built;
                return std::make_unique<Counter>();
            });
        assert(!lazy.constructed());
        assert(built == 0);
        lazy.get().value = 5;
        assert(lazy.get().value == 5);
        assert(built == 1);
        assert(lazy.constructed());

        int attempts = 0;
        mcp::LazyClient<Counter> failing(
            [&attempts]() -> std::unique_ptr<Counter>
            {
                if (++attempts == 1)
                    throw ConfigError("token missing");
                return std::make_unique<Counter>();
            });
        bool threw = false;
        try
        {
            failing.get();
        }
        catch (const ConfigError&)
        {
            threw = true;
        }
        assert(threw);
        assert(!failing.constructed());
        failing.get();
        assert(failing.constructed());
        assert(attempts == 2);
    }
    std::cout << "  [PASS]\n";

    std::cout << "\nAll invoker tests passed!\n";
    return 0;
}
