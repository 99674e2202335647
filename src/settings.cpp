#include "mcpeasy/settings.hpp"

#include <algorithm>
#include <cstdlib>

namespace mcpeasy
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::string home_dir()
{
    return getenv_str("HOME", ".");
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("MCPEASY_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    s.config_dir = getenv_str("MCPEASY_CONFIG_DIR", home_dir() + "/.config/mcpeasy");
    s.logs_dir = getenv_str("MCPEASY_LOGS_DIR", home_dir() + "/.local/share/mcpeasy/logs");
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s = from_env();
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("config_dir"))
        s.config_dir = j.at("config_dir").get<std::string>();
    if (j.contains("logs_dir"))
        s.logs_dir = j.at("logs_dir").get<std::string>();
    return s;
}

} // namespace mcpeasy
