/// @file config.cpp
/// @brief Tests for on-disk layout resolution and directory creation

#include "mcpeasy/config.hpp"
#include "mcpeasy/exceptions.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

using namespace mcpeasy;
namespace fs = std::filesystem;

static fs::path scratch_dir(const std::string& name)
{
    auto dir = fs::temp_directory_path() / (name + "_" + std::to_string(::getpid()));
    fs::remove_all(dir);
    return dir;
}

void test_paths_follow_settings()
{
    Settings s;
    s.config_dir = "/cfg";
    s.logs_dir = "/logs";
    Config config(s);

    assert(config.google_dir() == fs::path("/cfg/google"));
    assert(config.slack_dir() == fs::path("/cfg/slack"));
    assert(config.google_credentials_path() == fs::path("/cfg/google/credentials.json"));
    assert(config.google_token_path() == fs::path("/cfg/google/token.json"));
    assert(config.slack_token_path() == fs::path("/cfg/slack/token.json"));
    assert(config.log_file_path("slack") == fs::path("/logs/mcp_slack_error.log"));
    assert(config.log_file_path("gmail", "startup") == fs::path("/logs/mcp_gmail_startup.log"));

    std::cout << "  [PASS] paths follow settings\n";
}

void test_ensure_dirs_and_status()
{
    auto root = scratch_dir("mcpeasy_config_test");
    Settings s;
    s.config_dir = (root / "config").string();
    s.logs_dir = (root / "logs").string();
    Config config(s);

    // Nothing is created until asked
    assert(!fs::exists(config.config_dir()));
    auto before = config.status();
    assert(before["slack_config"] == false);

    config.ensure_config_dirs();
    assert(fs::is_directory(config.google_dir()));
    assert(fs::is_directory(config.slack_dir()));
    assert(fs::is_directory(config.logs_dir()));

    std::ofstream(config.slack_token_path()) << "{}";
    auto after = config.status();
    assert(after["slack_config"] == true);
    assert(after["google_token"] == false);
    assert(after["config_dir"] == s.config_dir);

    fs::remove_all(root);
    std::cout << "  [PASS] ensure_config_dirs and status\n";
}

void test_ensure_dirs_failure_is_config_error()
{
    auto root = scratch_dir("mcpeasy_config_blocked");
    fs::create_directories(root);
    std::ofstream(root / "file") << "x";

    Settings s;
    s.config_dir = (root / "file" / "config").string();
    s.logs_dir = (root / "logs").string();
    Config config(s);

    bool threw = false;
    try
    {
        config.ensure_config_dirs();
    }
    catch (const ConfigError&)
    {
        threw = true;
    }
    assert(threw);

    fs::remove_all(root);
    std::cout << "  [PASS] ensure_config_dirs reports ConfigError\n";
}

int main()
{
    std::cout << "Config tests\n";
    test_paths_follow_settings();
    test_ensure_dirs_and_status();
    test_ensure_dirs_failure_is_config_error();
    std::cout << "All config tests passed\n";
    return 0;
}
