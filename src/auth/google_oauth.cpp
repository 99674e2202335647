#include "mcpeasy/auth/google_oauth.hpp"

#include "mcpeasy/exceptions.hpp"
#include "mcpeasy/util/json.hpp"

namespace mcpeasy::auth
{

namespace
{
long long now_seconds()
{
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}
} // namespace

std::string token_error_detail(const http::Response& res)
{
    try
    {
        auto body = res.json();
        if (!body.is_object())
            return "HTTP " + std::to_string(res.status);
        std::string detail = util::json::optional_string(body, "error").value_or("unknown_error");
        if (auto description = util::json::optional_string(body, "error_description"))
            detail += ": " + *description;
        return detail;
    }
    catch (const TransportError&)
    {
        return "HTTP " + std::to_string(res.status);
    }
}

GoogleOAuth::GoogleOAuth(const Config& config, http::Client client)
    : credentials_(config.google_credentials_path()), tokens_(config.google_token_path()),
      client_(std::move(client))
{
}

ClientCredentials GoogleOAuth::client_credentials() const
{
    auto data = credentials_.read();
    if (!data || !data->is_object())
        throw ConfigError("Google credentials not found. Save your credentials.json to " +
                          credentials_.path().string());

    for (const char* block : {"installed", "web"})
    {
        if (!data->contains(block) || !(*data)[block].is_object())
            continue;
        const auto& client = (*data)[block];
        auto id = util::json::optional_string(client, "client_id");
        auto secret = util::json::optional_string(client, "client_secret");
        if (id && secret)
            return ClientCredentials{*id, *secret};
    }
    throw ConfigError("credentials.json has no installed/web client_id and client_secret");
}

std::string GoogleOAuth::authorization_url(const ClientCredentials& creds) const
{
    return std::string(GOOGLE_AUTH_URI) + "?" +
           http::encode_params({{"client_id", creds.client_id},
                                {"redirect_uri", GOOGLE_REDIRECT_URI},
                                {"response_type", "code"},
                                {"scope", GOOGLE_SCOPE},
                                {"access_type", "offline"},
                                {"prompt", "consent"}});
}

Json GoogleOAuth::save_token_response(const ClientCredentials& creds, const Json& response,
                                      const std::string& refresh_token) const
{
    auto access = util::json::optional_string(response, "access_token");
    if (!access)
        throw AuthError("token response has no access_token");

    Json token = {
        {"client_id", creds.client_id},
        {"client_secret", creds.client_secret},
        {"scope", response.value("scope", std::string(GOOGLE_SCOPE))},
        {"refresh_token", response.value("refresh_token", refresh_token)},
        {"access_token", *access},
        {"expires_at", now_seconds() + response.value("expires_in", 3600LL)},
    };
    tokens_.write(token);
    return token;
}

Json GoogleOAuth::exchange_code(const ClientCredentials& creds, const std::string& code) const
{
    auto res = client_.post_form(GOOGLE_TOKEN_URI, {{"code", code},
                                                    {"client_id", creds.client_id},
                                                    {"client_secret", creds.client_secret},
                                                    {"redirect_uri", GOOGLE_REDIRECT_URI},
                                                    {"grant_type", "authorization_code"}});
    if (!res.ok())
        throw AuthError("Token exchange failed: " + token_error_detail(res));
    return save_token_response(creds, res.json(), "");
}

Json GoogleOAuth::authenticate(std::ostream& out, CallbackServer& callback,
                               std::chrono::seconds timeout) const
{
    auto creds = client_credentials();

    out << "Open this URL in your browser to authorize mcpeasy:\n\n"
        << authorization_url(creds) << "\n\n"
        << "Waiting for OAuth callback on port " << callback.port() << "... (will timeout in "
        << timeout.count() << " seconds)\n";
    out.flush();

    auto code = callback.capture_code(timeout);
    if (!code)
    {
        if (callback.error())
            throw AuthError("Authorization denied: " + *callback.error());
        throw AuthError("Failed to receive authorization code. Please try again.");
    }

    out << "✅ Authorization code received!\n";
    return exchange_code(creds, *code);
}

Json GoogleOAuth::refresh() const
{
    auto stored = tokens_.read();
    if (!stored)
        throw ConfigError("Google authentication required. Run: mcpeasy google auth");

    auto refresh_token = util::json::optional_string(*stored, "refresh_token");
    if (!refresh_token || refresh_token->empty())
        throw AuthError("Stored Google token has no refresh_token; run: mcpeasy google auth");

    ClientCredentials creds{stored->value("client_id", std::string()),
                            stored->value("client_secret", std::string())};
    if (creds.client_id.empty() || creds.client_secret.empty())
        creds = client_credentials();

    auto res = client_.post_form(GOOGLE_TOKEN_URI, {{"client_id", creds.client_id},
                                                    {"client_secret", creds.client_secret},
                                                    {"refresh_token", *refresh_token},
                                                    {"grant_type", "refresh_token"}});
    if (!res.ok())
        throw AuthError("Token refresh failed: " + token_error_detail(res));
    return save_token_response(creds, res.json(), *refresh_token);
}

std::string GoogleOAuth::access_token() const
{
    auto stored = tokens_.read();
    if (!stored)
        throw ConfigError("Google authentication required. Run: mcpeasy google auth");

    long long expires_at = 0;
    if (stored->contains("expires_at") && (*stored)["expires_at"].is_number())
        expires_at = (*stored)["expires_at"].get<long long>();
    auto access = util::json::optional_string(*stored, "access_token");
    if (access && !access->empty() && now_seconds() < expires_at)
        return *access;

    return refresh().at("access_token").get<std::string>();
}

} // namespace mcpeasy::auth
