#include "mcpeasy/config.hpp"

#include "mcpeasy/exceptions.hpp"

#include <system_error>

namespace mcpeasy
{

namespace fs = std::filesystem;

Config::Config(const Settings& settings)
    : config_dir_(settings.config_dir), logs_dir_(settings.logs_dir)
{
}

fs::path Config::log_file_path(const std::string& service, const std::string& type) const
{
    return logs_dir_ / ("mcp_" + service + "_" + type + ".log");
}

void Config::ensure_config_dirs() const
{
    for (const auto& dir : {config_dir_, google_dir(), slack_dir(), logs_dir_})
    {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec)
            throw ConfigError("Cannot create directory " + dir.string() + ": " + ec.message());
    }
}

Json Config::status() const
{
    auto present = [](const fs::path& p)
    {
        std::error_code ec;
        return fs::exists(p, ec);
    };
    return Json{{"config_dir", config_dir_.string()},
                {"logs_dir", logs_dir_.string()},
                {"google_credentials", present(google_credentials_path())},
                {"google_token", present(google_token_path())},
                {"slack_config", present(slack_token_path())}};
}

} // namespace mcpeasy
