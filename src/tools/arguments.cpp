#include "mcpeasy/tools/arguments.hpp"

#include "mcpeasy/exceptions.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace mcpeasy::tools
{

namespace
{
const Json* lookup(const Json& args, const std::string& key)
{
    if (!args.is_object())
        return nullptr;
    auto it = args.find(key);
    if (it == args.end() || it->is_null())
        return nullptr;
    return &*it;
}
} // namespace

std::string require_string(const Json& args, const std::string& key)
{
    auto value = optional_string(args, key);
    if (!value || value->empty())
        throw ValidationError("Missing required argument: " + key);
    return *value;
}

std::optional<std::string> optional_string(const Json& args, const std::string& key)
{
    const Json* v = lookup(args, key);
    if (!v)
        return std::nullopt;
    if (v->is_string())
        return v->get<std::string>();
    if (v->is_number() || v->is_boolean())
        return v->dump();
    throw ValidationError("Argument '" + key + "' must be a string");
}

std::optional<long long> optional_int(const Json& args, const std::string& key)
{
    const Json* v = lookup(args, key);
    if (!v)
        return std::nullopt;
    if (v->is_number_unsigned())
    {
        auto u = v->get<unsigned long long>();
        if (u > static_cast<unsigned long long>(std::numeric_limits<long long>::max()))
            throw ValidationError("Argument '" + key + "' is out of range");
        return static_cast<long long>(u);
    }
    if (v->is_number_integer())
        return v->get<long long>();
    if (v->is_number_float())
    {
        const double d = std::trunc(v->get<double>());
        // 2^63 is exactly representable; anything at or beyond it does not fit.
        if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0)
            throw ValidationError("Argument '" + key + "' is out of range");
        return static_cast<long long>(d);
    }
    if (v->is_string())
    {
        const std::string s = v->get<std::string>();
        errno = 0;
        char* end = nullptr;
        long long parsed = std::strtoll(s.c_str(), &end, 10);
        if (errno == ERANGE)
            throw ValidationError("Argument '" + key + "' is out of range");
        if (!s.empty() && end != s.c_str())
            return parsed;
    }
    throw ValidationError("Argument '" + key + "' must be a number");
}

std::optional<bool> optional_bool(const Json& args, const std::string& key)
{
    const Json* v = lookup(args, key);
    if (!v)
        return std::nullopt;
    if (v->is_boolean())
        return v->get<bool>();
    if (v->is_string())
    {
        const std::string s = v->get<std::string>();
        if (s == "true")
            return true;
        if (s == "false")
            return false;
    }
    throw ValidationError("Argument '" + key + "' must be a boolean");
}

} // namespace mcpeasy::tools
