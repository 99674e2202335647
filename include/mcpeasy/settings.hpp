#pragma once
#include "mcpeasy/types.hpp"

#include <string>

namespace mcpeasy
{

struct Settings
{
    std::string log_level{"INFO"};
    std::string config_dir;
    std::string logs_dir;

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace mcpeasy
