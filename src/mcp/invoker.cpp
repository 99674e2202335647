#include "mcpeasy/mcp/invoker.hpp"

namespace mcpeasy::mcp
{

InvocationResult ToolInvoker::invoke(const std::string& name, const Json& arguments) const
{
    const tools::Tool* tool = tools_.find(name);
    if (!tool)
        return unknown_tool(name);

    try
    {
        return ToolSuccess{tool->invoke(arguments)};
    }
    catch (const std::exception& e)
    {
        log_.error("Tool error in '" + name + "'", e);
        return BusinessError{e.what()};
    }
    catch (...)
    {
        log_.error("Tool error in '" + name + "': non-standard exception");
        return BusinessError{"unknown failure"};
    }
}

} // namespace mcpeasy::mcp
