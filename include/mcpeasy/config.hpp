#pragma once
#include "mcpeasy/settings.hpp"
#include "mcpeasy/types.hpp"

#include <filesystem>
#include <string>

namespace mcpeasy
{

/**
 * Resolves every on-disk location mcpeasy uses.
 *
 * Layout (defaults):
 *   ~/.config/mcpeasy/{google,slack}/...   credentials and tokens
 *   ~/.local/share/mcpeasy/logs/           mcp_<service>_<type>.log
 *
 * Paths are computed only; nothing is created until ensure_config_dirs().
 */
class Config
{
  public:
    explicit Config(const Settings& settings = Settings::from_env());

    const std::filesystem::path& config_dir() const
    {
        return config_dir_;
    }
    const std::filesystem::path& logs_dir() const
    {
        return logs_dir_;
    }
    std::filesystem::path google_dir() const
    {
        return config_dir_ / "google";
    }
    std::filesystem::path slack_dir() const
    {
        return config_dir_ / "slack";
    }

    std::filesystem::path google_credentials_path() const
    {
        return google_dir() / "credentials.json";
    }
    std::filesystem::path google_token_path() const
    {
        return google_dir() / "token.json";
    }
    std::filesystem::path slack_token_path() const
    {
        return slack_dir() / "token.json";
    }

    /// <logs_dir>/mcp_<service>_<type>.log
    std::filesystem::path log_file_path(const std::string& service,
                                        const std::string& type = "error") const;

    /// Create the config, per-service and logs directories. Throws ConfigError.
    void ensure_config_dirs() const;

    /// Which directories and credential files are present.
    Json status() const;

  private:
    std::filesystem::path config_dir_;
    std::filesystem::path logs_dir_;
};

} // namespace mcpeasy
