#include "mcpeasy/services/slack/service.hpp"

#include "mcpeasy/auth/credential_store.hpp"
#include "mcpeasy/exceptions.hpp"
#include "mcpeasy/util/json.hpp"

#include <algorithm>
#include <cstdlib>
#include <thread>

namespace mcpeasy::slack
{

namespace
{
std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos)
        return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::chrono::milliseconds retry_after(const http::Response& res)
{
    auto header = res.header("Retry-After");
    if (header)
    {
        char* end = nullptr;
        long secs = std::strtol(header->c_str(), &end, 10);
        if (end != header->c_str() && secs >= 0)
            return std::chrono::seconds(secs);
    }
    return std::chrono::seconds(1);
}
} // namespace

std::string clean_channel_name(const std::string& channel)
{
    std::string out = trim(channel);
    if (!out.empty() && out.front() == '#')
        out.erase(0, 1);
    return trim(out);
}

void check_ok(const Json& body, const std::string& what)
{
    if (body.is_object() && body.value("ok", false))
        return;
    std::string error = "unknown_error";
    if (body.is_object() && body.contains("error") && body["error"].is_string())
        error = body["error"].get<std::string>();
    throw ServiceError(what + ": " + error);
}

ChannelPage parse_channel_page(const Json& body)
{
    check_ok(body, "Failed to list channels");

    ChannelPage page;
    if (body.contains("channels") && body["channels"].is_array())
    {
        for (const auto& ch : body["channels"])
            page.channels.push_back(
                Channel{ch.value("name", std::string()), ch.value("id", std::string())});
    }
    if (body.contains("response_metadata") && body["response_metadata"].is_object())
    {
        auto next = util::json::optional_string(body["response_metadata"], "next_cursor");
        if (next)
            page.next_cursor = *next;
    }
    page.has_more = !page.next_cursor.empty();
    return page;
}

AuthInfo parse_auth_info(const Json& body)
{
    check_ok(body, "Authentication failed");
    return AuthInfo{body.value("user", std::string()), body.value("team", std::string()),
                    body.value("url", std::string())};
}

PostedMessage parse_posted_message(const Json& body)
{
    check_ok(body, "Failed to post message");
    return PostedMessage{body.value("channel", std::string()), body.value("ts", std::string())};
}

Service::Service(std::string bot_token, http::Client http, logging::Logger* log)
    : token_(std::move(bot_token)), http_(std::move(http)), log_(log),
      sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })
{
    if (token_.empty())
        throw ConfigError("Slack bot token is empty");
}

std::unique_ptr<Service> Service::from_config(const Config& config, logging::Logger* log)
{
    auth::CredentialStore store(config.slack_token_path());
    auto token = store.read_field("bot_token");
    if (!token)
        throw ConfigError("Slack bot token is not configured!\n"
                          "Please run: mcpeasy slack set_bot_token YOUR_TOKEN");
    return std::make_unique<Service>(*token, http::Client{}, log);
}

http::Headers Service::auth_headers() const
{
    return {"Authorization: Bearer " + token_};
}

AuthInfo Service::test_connection()
{
    auto res = http_.post_json(std::string(API_BASE) + "auth.test", Json::object(), auth_headers());
    return parse_auth_info(res.json());
}

ChannelPage Service::list_channels(int limit, const std::string& cursor, bool exclude_archived)
{
    limit = std::clamp(limit, 1, MAX_CHANNEL_LIMIT);
    http::Params query = {{"types", "public_channel,private_channel"},
                          {"limit", std::to_string(limit)},
                          {"exclude_archived", exclude_archived ? "true" : "false"}};
    if (!trim(cursor).empty())
        query.emplace_back("cursor", cursor);

    auto res = http_.get(std::string(API_BASE) + "conversations.list", query, auth_headers());
    return parse_channel_page(res.json());
}

PostedMessage Service::post_message(const std::string& channel, const std::string& text,
                                    const std::string& username, const std::string& thread_ts)
{
    const std::string clean_channel = clean_channel_name(channel);
    const std::string clean_text = trim(text);
    if (clean_channel.empty())
        throw ValidationError("Channel cannot be empty");
    if (clean_text.empty())
        throw ValidationError("Text cannot be empty");

    Json payload = {{"channel", clean_channel}, {"text", clean_text}};
    if (!trim(username).empty())
        payload["username"] = username;
    if (!trim(thread_ts).empty())
        payload["thread_ts"] = thread_ts;

    const std::string url = std::string(API_BASE) + "chat.postMessage";
    for (int attempt = 0;; ++attempt)
    {
        try
        {
            auto res = http_.post_json(url, payload, auth_headers());
            if (res.status == 429 && attempt < MAX_RETRIES)
            {
                sleep_(retry_after(res));
                continue;
            }
            if (res.status == 429)
                throw ServiceError("Slack API Error: rate limited");
            return parse_posted_message(res.json());
        }
        catch (const TimeoutError& e)
        {
            if (attempt >= MAX_RETRIES)
            {
                if (log_)
                    log_->error("slack::Service::post_message", e);
                throw ServiceError(std::string("Slack API Error: ") + e.what());
            }
            sleep_(std::chrono::milliseconds(500 * (attempt + 1)));
        }
    }
}

} // namespace mcpeasy::slack
