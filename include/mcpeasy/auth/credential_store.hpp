#pragma once
#include "mcpeasy/types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace mcpeasy::auth
{

/// A JSON credentials/token file.
///
/// read() returns nullopt when the file does not exist; a file that exists but
/// cannot be parsed is a ConfigError. Writes replace the whole file.
class CredentialStore
{
  public:
    explicit CredentialStore(std::filesystem::path path) : path_(std::move(path)) {}

    const std::filesystem::path& path() const
    {
        return path_;
    }

    bool exists() const;

    std::optional<Json> read() const;

    /// Pretty-printed, parent directories created, owner-only permissions.
    void write(const Json& data) const;

    /// String member `key` of the stored object.
    std::optional<std::string> read_field(const std::string& key) const;

    /// Merge `key` into the stored object, keeping other members.
    void write_field(const std::string& key, const Json& value) const;

  private:
    std::filesystem::path path_;
};

} // namespace mcpeasy::auth
