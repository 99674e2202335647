#pragma once
#include "mcpeasy/exceptions.hpp"
#include "mcpeasy/prompts/prompt.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace mcpeasy::prompts
{

/// Immutable catalog of prompts, fixed at construction.
class PromptRegistry
{
  public:
    PromptRegistry() = default;

    explicit PromptRegistry(std::vector<Prompt> prompts) : prompts_(std::move(prompts))
    {
        for (size_t i = 0; i < prompts_.size(); ++i)
        {
            const auto& name = prompts_[i].name;
            if (name.empty())
                throw ValidationError("prompt name must not be empty");
            if (!index_.emplace(name, i).second)
                throw ValidationError("duplicate prompt name: " + name);
        }
    }

    const Prompt* find(const std::string& name) const
    {
        auto it = index_.find(name);
        return it == index_.end() ? nullptr : &prompts_[it->second];
    }

    bool has(const std::string& name) const
    {
        return index_.count(name) > 0;
    }

    const std::vector<Prompt>& list() const
    {
        return prompts_;
    }

    bool empty() const
    {
        return prompts_.empty();
    }
    size_t size() const
    {
        return prompts_.size();
    }

  private:
    std::vector<Prompt> prompts_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace mcpeasy::prompts
