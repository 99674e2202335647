#pragma once
#include "mcpeasy/logging.hpp"
#include "mcpeasy/mcp/errors.hpp"
#include "mcpeasy/tools/registry.hpp"

#include <functional>
#include <memory>
#include <string>

namespace mcpeasy::mcp
{

/// Instance-scoped, construct-on-first-use holder for a service client.
///
/// Nothing is built until get() is called, so initialize and tools/list work
/// without credentials. A throwing factory leaves the slot empty and the next
/// get() tries again.
template <typename T>
class LazyClient
{
  public:
    using Factory = std::function<std::unique_ptr<T>()>;

    explicit LazyClient(Factory factory) : factory_(std::move(factory)) {}

    T& get()
    {
        if (!client_)
        {
            if (!factory_)
                throw ConfigError("no service client factory configured");
            client_ = factory_();
            if (!client_)
                throw ConfigError("service client factory returned nothing");
        }
        return *client_;
    }

    bool constructed() const
    {
        return client_ != nullptr;
    }

  private:
    Factory factory_;
    std::unique_ptr<T> client_;
};

/// Resolves a tool by name, runs it and classifies the outcome.
///
/// Unknown tool is a ProtocolError. Anything thrown by the handler is logged
/// in full and becomes a BusinessError carrying only the message text.
class ToolInvoker
{
  public:
    ToolInvoker(const tools::ToolRegistry& tools, logging::Logger& log)
        : tools_(tools), log_(log)
    {
    }

    InvocationResult invoke(const std::string& name, const Json& arguments) const;

  private:
    const tools::ToolRegistry& tools_;
    logging::Logger& log_;
};

} // namespace mcpeasy::mcp
