#include "mcpeasy/exceptions.hpp"
#include "mcpeasy/tools/registry.hpp"

#include <cassert>
#include <iostream>

using namespace mcpeasy;

static tools::Tool echo_tool(const std::string& name)
{
    return tools::Tool(name, "Echo the text argument",
                       tools::object_schema({{"text", {{"type", "string"}}}}, {"text"}),
                       [](const Json& args) { return args.value("text", std::string()); });
}

int main()
{
    std::cout << "Test: registration order and lookup...\n";
    {
        tools::ToolRegistry registry({echo_tool("echo"), echo_tool("shout")});
        assert(registry.size() == 2);
        assert(registry.list()[0].name() == "echo");
        assert(registry.list()[1].name() == "shout");
        assert(registry.has("shout"));
        assert(registry.find("missing") == nullptr);

        const tools::Tool* tool = registry.find("echo");
        assert(tool != nullptr);
        assert(tool->invoke(Json{{"text", "hi"}}) == "hi");
    }
    std::cout << "  [PASS]\n";

    std::cout << "Test: listing shape...\n";
    {
        auto listed = echo_tool("echo").to_json();
        assert(listed["name"] == "echo");
        assert(listed["description"] == "Echo the text argument");
        assert(listed["inputSchema"]["type"] == "object");
        assert(listed["inputSchema"]["required"] == Json::array({"text"}));
        assert(listed["inputSchema"]["properties"].contains("text"));

        tools::Tool bare("bare", "", Json(), [](const Json&) { return std::string(); });
        assert(bare.to_json()["inputSchema"]["type"] == "object");
    }
    std::cout << "  [PASS]\n";

    std::cout << "Test: duplicate and empty names are rejected...\n";
    {
        bool dup = false;
        try
        {
            tools::ToolRegistry registry({echo_tool("echo"), echo_tool("echo")});
        }
        catch (const ValidationError&)
        {
            dup = true;
        }
        assert(dup);

        bool empty = false;
        try
        {
            tools::ToolRegistry registry({echo_tool("")});
        }
        catch (const ValidationError&)
        {
            empty = true;
        }
        assert(empty);
    }
    std::cout << "  [PASS]\n";

    std::cout << "Test: empty registry...\n";
    {
        tools::ToolRegistry registry;
        assert(registry.empty());
        assert(registry.list().empty());
    }
    std::cout << "  [PASS]\n";

    std::cout << "\nAll tool registry tests passed!\n";
    return 0;
}
