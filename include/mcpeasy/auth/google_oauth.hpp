#pragma once
#include "mcpeasy/auth/callback_server.hpp"
#include "mcpeasy/auth/credential_store.hpp"
#include "mcpeasy/config.hpp"
#include "mcpeasy/http/client.hpp"
#include "mcpeasy/types.hpp"

#include <chrono>
#include <ostream>
#include <string>

namespace mcpeasy::auth
{

constexpr const char* GOOGLE_AUTH_URI = "https://accounts.google.com/o/oauth2/auth";
constexpr const char* GOOGLE_TOKEN_URI = "https://oauth2.googleapis.com/token";
constexpr const char* GOOGLE_REDIRECT_URI = "http://localhost:8080";
constexpr const char* GOOGLE_SCOPE = "https://www.googleapis.com/auth/calendar.readonly "
                                     "https://www.googleapis.com/auth/drive.readonly";

struct ClientCredentials
{
    std::string client_id;
    std::string client_secret;
};

/// "error: error_description" from a failed token endpoint reply, or
/// "HTTP <status>" when the body is not a JSON object.
std::string token_error_detail(const http::Response& res);

/**
 * Google OAuth2 installed-app flow and token maintenance.
 *
 * Client id/secret come from google/credentials.json (the "installed" or
 * "web" block downloaded from the Cloud console); the resulting token lives
 * in google/token.json with an absolute expires_at (unix seconds).
 */
class GoogleOAuth
{
  public:
    GoogleOAuth(const Config& config, http::Client client = http::Client{});

    /// Throws ConfigError when credentials.json is missing or incomplete.
    ClientCredentials client_credentials() const;

    std::string authorization_url(const ClientCredentials& creds) const;

    /// Trade an authorization code for tokens and save them. Throws AuthError.
    Json exchange_code(const ClientCredentials& creds, const std::string& code) const;

    /// Interactive flow: print the URL, wait for the callback, exchange, save.
    Json authenticate(std::ostream& out, CallbackServer& callback,
                      std::chrono::seconds timeout = std::chrono::seconds(60)) const;

    /// New access token from the stored refresh token, written back to the store.
    Json refresh() const;

    /// Current access token, refreshed first when expired. Throws ConfigError
    /// when no token has been stored yet.
    std::string access_token() const;

    const CredentialStore& token_store() const
    {
        return tokens_;
    }

  private:
    Json save_token_response(const ClientCredentials& creds, const Json& response,
                             const std::string& refresh_token) const;

    CredentialStore credentials_;
    CredentialStore tokens_;
    http::Client client_;
};

} // namespace mcpeasy::auth
