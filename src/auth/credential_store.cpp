#include "mcpeasy/auth/credential_store.hpp"

#include "mcpeasy/exceptions.hpp"
#include "mcpeasy/util/json.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace mcpeasy::auth
{

namespace fs = std::filesystem;

bool CredentialStore::exists() const
{
    std::error_code ec;
    return fs::exists(path_, ec);
}

std::optional<Json> CredentialStore::read() const
{
    if (!exists())
        return std::nullopt;

    std::ifstream in(path_);
    if (!in)
        throw ConfigError("Cannot read " + path_.string());
    std::stringstream buffer;
    buffer << in.rdbuf();

    try
    {
        return util::json::parse(buffer.str());
    }
    catch (const Json::parse_error& e)
    {
        throw ConfigError("Malformed JSON in " + path_.string() + ": " + e.what());
    }
}

void CredentialStore::write(const Json& data) const
{
    std::error_code ec;
    if (path_.has_parent_path())
        fs::create_directories(path_.parent_path(), ec);
    if (ec)
        throw ConfigError("Cannot create " + path_.parent_path().string() + ": " + ec.message());

    {
        std::ofstream out(path_, std::ios::trunc);
        if (!out)
            throw ConfigError("Cannot write " + path_.string());
        out << util::json::dump_pretty(data) << '\n';
        if (!out)
            throw ConfigError("Failed writing " + path_.string());
    }

    // Not every filesystem supports POSIX modes; the file is written either way.
    fs::permissions(path_, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
}

std::optional<std::string> CredentialStore::read_field(const std::string& key) const
{
    auto data = read();
    if (!data)
        return std::nullopt;
    auto value = util::json::optional_string(*data, key);
    if (value && value->empty())
        return std::nullopt;
    return value;
}

void CredentialStore::write_field(const std::string& key, const Json& value) const
{
    Json data = read().value_or(Json::object());
    if (!data.is_object())
        data = Json::object();
    data[key] = value;
    write(data);
}

} // namespace mcpeasy::auth
