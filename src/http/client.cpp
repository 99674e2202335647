#include "mcpeasy/http/client.hpp"

#include "mcpeasy/exceptions.hpp"
#include "mcpeasy/util/json.hpp"

#include <curl/curl.h>

#include <cctype>

namespace mcpeasy::http
{

namespace
{
std::string lower(std::string s)
{
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* buf = static_cast<std::string*>(userdata);
    buf->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t write_header(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string line(ptr, size * nmemb);
    auto colon = line.find(':');
    if (colon != std::string::npos)
    {
        std::string name = lower(line.substr(0, colon));
        std::string value = line.substr(colon + 1);
        auto b = value.find_first_not_of(" \t");
        auto e = value.find_last_not_of(" \t\r\n");
        value = (b == std::string::npos) ? std::string() : value.substr(b, e - b + 1);
        (*headers)[name] = value;
    }
    return size * nmemb;
}
} // namespace

std::optional<std::string> Response::header(const std::string& name) const
{
    auto it = headers.find(lower(name));
    if (it == headers.end())
        return std::nullopt;
    return it->second;
}

Json Response::json() const
{
    try
    {
        return util::json::parse(body);
    }
    catch (const Json::parse_error& e)
    {
        throw TransportError("HTTP " + std::to_string(status) +
                             " response is not JSON: " + e.what());
    }
}

std::string url_encode(const std::string& value)
{
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string encode_params(const Params& params)
{
    std::string out;
    for (const auto& kv : params)
    {
        if (!out.empty())
            out.push_back('&');
        out += url_encode(kv.first);
        out.push_back('=');
        out += url_encode(kv.second);
    }
    return out;
}

Response Client::get(const std::string& url, const Params& query, const Headers& headers) const
{
    std::string full = url;
    if (!query.empty())
        full += (url.find('?') == std::string::npos ? "?" : "&") + encode_params(query);
    return perform(full, nullptr, headers);
}

Response Client::post_json(const std::string& url, const Json& body, const Headers& headers) const
{
    Headers all = headers;
    all.push_back("Content-Type: application/json; charset=utf-8");
    std::string payload = body.dump();
    return perform(url, &payload, all);
}

Response Client::post_form(const std::string& url, const Params& fields,
                           const Headers& headers) const
{
    Headers all = headers;
    all.push_back("Content-Type: application/x-www-form-urlencoded");
    std::string payload = encode_params(fields);
    return perform(url, &payload, all);
}

Response Client::perform(const std::string& url, const std::string* body,
                         const Headers& headers) const
{
    CURL* curl = curl_easy_init();
    if (!curl)
        throw TransportError("libcurl init failed");

    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Accept: application/json");
    for (const auto& h : headers)
        header_list = curl_slist_append(header_list, h.c_str());

    Response response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    if (body)
    {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, write_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_s);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeout_s);

    CURLcode code = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (code == CURLE_OPERATION_TIMEDOUT)
        throw TimeoutError(std::string("HTTP request timed out: ") + curl_easy_strerror(code));
    if (code != CURLE_OK)
        throw TransportError(std::string("HTTP request failed: ") + curl_easy_strerror(code));
    return response;
}

GlobalInit::GlobalInit()
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

GlobalInit::~GlobalInit()
{
    curl_global_cleanup();
}

} // namespace mcpeasy::http
