#pragma once
#include "mcpeasy/exceptions.hpp"
#include "mcpeasy/tools/tool.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace mcpeasy::tools
{

/// Immutable catalog of tools, fixed at construction.
///
/// Owned by one server instance; listing order is registration order.
class ToolRegistry
{
  public:
    ToolRegistry() = default;

    /// Throws ValidationError on an empty or duplicate name.
    explicit ToolRegistry(std::vector<Tool> tools) : tools_(std::move(tools))
    {
        index_.reserve(tools_.size());
        for (size_t i = 0; i < tools_.size(); ++i)
        {
            const auto& name = tools_[i].name();
            if (name.empty())
                throw ValidationError("tool name must not be empty");
            if (!index_.emplace(name, i).second)
                throw ValidationError("duplicate tool name: " + name);
        }
    }

    /// nullptr when no tool has this name.
    const Tool* find(const std::string& name) const
    {
        auto it = index_.find(name);
        return it == index_.end() ? nullptr : &tools_[it->second];
    }

    bool has(const std::string& name) const
    {
        return index_.count(name) > 0;
    }

    const std::vector<Tool>& list() const
    {
        return tools_;
    }

    size_t size() const
    {
        return tools_.size();
    }
    bool empty() const
    {
        return tools_.empty();
    }

  private:
    std::vector<Tool> tools_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace mcpeasy::tools
