#include "mcpeasy/auth/credential_store.hpp"
#include "mcpeasy/exceptions.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

using namespace mcpeasy;
namespace fs = std::filesystem;

int main()
{
    auto root = fs::temp_directory_path() / ("mcpeasy_store_" + std::to_string(::getpid()));
    fs::remove_all(root);

    std::cout << "Test: missing file...\n";
    auth::CredentialStore store(root / "slack" / "token.json");
    assert(!store.exists());
    assert(!store.read());
    assert(!store.read_field("bot_token"));
    std::cout << "  [PASS]\n";

    std::cout << "Test: write creates parents and restricts permissions...\n";
    store.write_field("bot_token", "xoxb-123");
    assert(store.exists());
    assert(*store.read_field("bot_token") == "xoxb-123");
    auto perms = fs::status(store.path()).permissions();
    assert((perms & fs::perms::group_read) == fs::perms::none);
    assert((perms & fs::perms::others_read) == fs::perms::none);
    std::cout << "  [PASS]\n";

    std::cout << "Test: write_field keeps other members...\n";
    store.write_field("team", "acme");
    auto data = store.read();
    assert(data);
    assert((*data)["bot_token"] == "xoxb-123");
    assert((*data)["team"] == "acme");
    std::cout << "  [PASS]\n";

    std::cout << "Test: empty and non-string fields read as absent...\n";
    store.write(Json{{"bot_token", ""}, {"count", 3}});
    assert(!store.read_field("bot_token"));
    assert(!store.read_field("count"));
    std::cout << "  [PASS]\n";

    std::cout << "Test: malformed file is a ConfigError...\n";
    std::ofstream(store.path(), std::ios::trunc) << "{ not json";
    bool threw = false;
    try
    {
        store.read();
    }
    catch (const ConfigError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "  [PASS]\n";

    fs::remove_all(root);
    std::cout << "\nAll credential store tests passed!\n";
    return 0;
}
