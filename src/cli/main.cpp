#include "mcpeasy/auth/callback_server.hpp"
#include "mcpeasy/auth/credential_store.hpp"
#include "mcpeasy/auth/google_oauth.hpp"
#include "mcpeasy/config.hpp"
#include "mcpeasy/exceptions.hpp"
#include "mcpeasy/http/client.hpp"
#include "mcpeasy/logging.hpp"
#include "mcpeasy/mcp/handler.hpp"
#include "mcpeasy/server/stdio_server.hpp"
#include "mcpeasy/services/slack/mcp.hpp"
#include "mcpeasy/services/slack/service.hpp"
#include "mcpeasy/settings.hpp"
#include "mcpeasy/util/json.hpp"
#include "mcpeasy/version.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "mcpeasy " << mcpeasy::VERSION_MAJOR << "." << mcpeasy::VERSION_MINOR << "."
              << mcpeasy::VERSION_PATCH << "\n";
    std::cout << "Usage:\n";
    std::cout << "  mcpeasy --help\n";
    std::cout << "  mcpeasy slack mcp                    Serve the Slack tools over stdio\n";
    std::cout << "  mcpeasy slack test                   Check the stored bot token\n";
    std::cout << "  mcpeasy slack set_bot_token <token>  Store the Slack bot token\n";
    std::cout << "  mcpeasy google auth                  Run the Google OAuth flow\n";
    std::cout << "  mcpeasy config status                Show configuration paths\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  MCPEASY_LOG_LEVEL    DEBUG, INFO, WARN or ERROR (default INFO)\n";
    std::cout << "  MCPEASY_CONFIG_DIR   Override ~/.config/mcpeasy\n";
    std::cout << "  MCPEASY_LOGS_DIR     Override ~/.local/share/mcpeasy/logs\n";
    return exit_code;
}

static int run_slack_mcp(const mcpeasy::Settings& settings, const mcpeasy::Config& config)
{
    using namespace mcpeasy;

    config.ensure_config_dirs();
    logging::Logger log(config, slack::SERVICE_NAME, settings.log_level);

    // The token is only read when the first tool runs.
    slack::McpServer slack_server([&config, &log]() -> std::unique_ptr<slack::Client>
                                  { return slack::Service::from_config(config, &log); });

    mcp::Dispatcher dispatcher(slack_server.definition(), log);
    server::StdioServerWrapper server(dispatcher.as_handler(), log);
    server::StdioServerWrapper::install_signal_handlers();
    server.run();
    return 0;
}

static int run_slack_test(const mcpeasy::Config& config)
{
    auto service = mcpeasy::slack::Service::from_config(config);
    auto info = service->test_connection();
    std::cout << "✅ Successfully connected to Slack\n";
    std::cout << "   Bot: " << info.user << "\n";
    std::cout << "   Team: " << info.team << "\n";
    if (!info.url.empty())
        std::cout << "   URL: " << info.url << "\n";
    return 0;
}

static int run_slack_set_bot_token(const mcpeasy::Config& config, const std::string& token)
{
    if (token.empty())
    {
        std::cerr << "Bot token must not be empty\n";
        return 1;
    }
    config.ensure_config_dirs();
    mcpeasy::auth::CredentialStore store(config.slack_token_path());
    store.write_field("bot_token", token);
    std::cout << "✅ Bot token saved to " << store.path().string() << "\n";
    return 0;
}

static int run_google_auth(const mcpeasy::Config& config)
{
    config.ensure_config_dirs();
    mcpeasy::auth::GoogleOAuth oauth(config);
    mcpeasy::auth::CallbackServer callback;
    oauth.authenticate(std::cout, callback);
    std::cout << "✅ Token saved to " << oauth.token_store().path().string() << "\n";
    return 0;
}

static int run_config_status(const mcpeasy::Config& config)
{
    std::cout << mcpeasy::util::json::dump_pretty(config.status()) << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty())
        return usage();
    if (args[0] == "--help" || args[0] == "-h")
        return usage(0);

    mcpeasy::http::GlobalInit curl_init;

    try
    {
        auto settings = mcpeasy::Settings::from_env();
        mcpeasy::Config config(settings);

        if (args[0] == "slack" && args.size() >= 2)
        {
            if (args[1] == "mcp")
                return run_slack_mcp(settings, config);
            if (args[1] == "test")
                return run_slack_test(config);
            if (args[1] == "set_bot_token" && args.size() >= 3)
                return run_slack_set_bot_token(config, args[2]);
        }
        if (args[0] == "google" && args.size() >= 2 && args[1] == "auth")
            return run_google_auth(config);
        if (args[0] == "config" && args.size() >= 2 && args[1] == "status")
            return run_config_status(config);
    }
    catch (const mcpeasy::ConfigError& e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return usage();
}
