#pragma once
#include "mcpeasy/types.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace mcpeasy::tools
{

/// A named operation invocable through tools/call.
///
/// The input schema documents the arguments for the client; it is not
/// enforced here. Handlers reject missing arguments themselves by throwing.
class Tool
{
  public:
    using Fn = std::function<std::string(const Json&)>;

    Tool(std::string name, std::string description, Json input_schema, Fn fn)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const Json& input_schema() const
    {
        return input_schema_;
    }
    std::string invoke(const Json& arguments) const
    {
        return fn_(arguments);
    }

    /// {name, description, inputSchema} as listed by tools/list.
    Json to_json() const
    {
        Json schema = input_schema_.is_object() ? input_schema_ : Json{{"type", "object"}};
        return Json{{"name", name_}, {"description", description_}, {"inputSchema", schema}};
    }

  private:
    std::string name_;
    std::string description_;
    Json input_schema_;
    Fn fn_;
};

/// Object schema builder: properties plus the required list.
inline Json object_schema(Json properties = Json::object(),
                          std::vector<std::string> required = {})
{
    return Json{{"type", "object"},
                {"properties", std::move(properties)},
                {"required", std::move(required)}};
}

} // namespace mcpeasy::tools
