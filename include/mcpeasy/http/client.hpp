#pragma once
#include "mcpeasy/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mcpeasy::http
{

using Params = std::vector<std::pair<std::string, std::string>>;
using Headers = std::vector<std::string>; ///< "Name: value"

struct Response
{
    long status{0};
    std::string body;
    std::map<std::string, std::string> headers; ///< lowercase names

    bool ok() const
    {
        return status >= 200 && status < 300;
    }

    std::optional<std::string> header(const std::string& name) const;

    /// Body parsed as JSON. Throws TransportError when it is not JSON.
    Json json() const;
};

struct Options
{
    long connect_timeout_s{5};
    long timeout_s{10};
    std::string user_agent{"mcpeasy/1.0"};
};

/// Blocking HTTPS client over libcurl; one easy handle per request.
class Client
{
  public:
    explicit Client(Options options = {}) : options_(std::move(options)) {}

    Response get(const std::string& url, const Params& query = {},
                 const Headers& headers = {}) const;
    Response post_json(const std::string& url, const Json& body,
                       const Headers& headers = {}) const;
    Response post_form(const std::string& url, const Params& fields,
                       const Headers& headers = {}) const;

    const Options& options() const
    {
        return options_;
    }

  private:
    Response perform(const std::string& url, const std::string* body,
                     const Headers& headers) const;

    Options options_;
};

/// RFC 3986 percent-encoding of everything but unreserved characters.
std::string url_encode(const std::string& value);

/// key=value&key=value, both sides encoded.
std::string encode_params(const Params& params);

/// Process-wide curl_global_init/cleanup; create one in main().
class GlobalInit
{
  public:
    GlobalInit();
    ~GlobalInit();
    GlobalInit(const GlobalInit&) = delete;
    GlobalInit& operator=(const GlobalInit&) = delete;
};

} // namespace mcpeasy::http
