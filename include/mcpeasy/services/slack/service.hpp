#pragma once
#include "mcpeasy/config.hpp"
#include "mcpeasy/http/client.hpp"
#include "mcpeasy/logging.hpp"
#include "mcpeasy/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mcpeasy::slack
{

constexpr const char* API_BASE = "https://slack.com/api/";
constexpr int MAX_CHANNEL_LIMIT = 1000;
constexpr int MAX_RETRIES = 3;

struct Channel
{
    std::string name;
    std::string id;
};

struct ChannelPage
{
    std::vector<Channel> channels;
    bool has_more{false};
    std::string next_cursor;
};

struct AuthInfo
{
    std::string user;
    std::string team;
    std::string url;
};

struct PostedMessage
{
    std::string channel;
    std::string ts;
};

/// Slack operations the MCP server consumes.
class Client
{
  public:
    virtual ~Client() = default;

    virtual AuthInfo test_connection() = 0;
    virtual ChannelPage list_channels(int limit, const std::string& cursor,
                                      bool exclude_archived) = 0;
    virtual PostedMessage post_message(const std::string& channel, const std::string& text,
                                       const std::string& username,
                                       const std::string& thread_ts) = 0;
};

/// Slack Web API client authenticated with a bot token.
class Service : public Client
{
  public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    Service(std::string bot_token, http::Client http = http::Client{},
            logging::Logger* log = nullptr);

    /// Bot token from slack/token.json. Throws ConfigError when absent.
    static std::unique_ptr<Service> from_config(const Config& config,
                                                logging::Logger* log = nullptr);

    AuthInfo test_connection() override;
    ChannelPage list_channels(int limit, const std::string& cursor,
                              bool exclude_archived) override;
    PostedMessage post_message(const std::string& channel, const std::string& text,
                               const std::string& username,
                               const std::string& thread_ts) override;

    /// Replaces the retry back-off wait.
    void set_sleeper(Sleeper sleeper)
    {
        sleep_ = std::move(sleeper);
    }

  private:
    http::Headers auth_headers() const;

    std::string token_;
    http::Client http_;
    logging::Logger* log_;
    Sleeper sleep_;
};

/// Strip surrounding whitespace and one leading '#'.
std::string clean_channel_name(const std::string& channel);

/// Throws ServiceError "<what>: <error>" unless body.ok is true.
void check_ok(const Json& body, const std::string& what);

ChannelPage parse_channel_page(const Json& body);
AuthInfo parse_auth_info(const Json& body);
PostedMessage parse_posted_message(const Json& body);

} // namespace mcpeasy::slack
