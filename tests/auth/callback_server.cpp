/// @file callback_server.cpp
/// @brief Loopback tests for the one-shot OAuth callback listener

#include "mcpeasy/auth/callback_server.hpp"

#include <httplib.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

using namespace mcpeasy;

static int test_port(int offset)
{
    return 20000 + static_cast<int>(::getpid() % 20000) + offset;
}

/// GET path on the listener, retrying until it is up.
static httplib::Result get_when_ready(int port, const std::string& path)
{
    httplib::Client cli("127.0.0.1", port);
    for (int attempt = 0; attempt < 100; ++attempt)
    {
        auto res = cli.Get(path.c_str());
        if (res)
            return res;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return cli.Get(path.c_str());
}

void test_code_is_captured()
{
    int port = test_port(0);
    auth::CallbackServer callback(port);
    assert(callback.port() == port);

    std::optional<std::string> code;
    std::thread waiter([&] { code = callback.capture_code(std::chrono::seconds(10)); });

    auto waiting = get_when_ready(port, "/");
    assert(waiting);
    assert(waiting->status == 200);
    assert(waiting->body.find("Waiting for Authorization") != std::string::npos);

    auto done = get_when_ready(port, "/?code=4%2F0Adeu5BX&scope=calendar");
    assert(done);
    assert(done->body.find("Authorization Successful") != std::string::npos);

    waiter.join();
    assert(code && *code == "4/0Adeu5BX");
    assert(!callback.error());
    std::cout << "  [PASS] authorization code captured\n";
}

void test_provider_error()
{
    int port = test_port(1);
    auth::CallbackServer callback(port);

    std::optional<std::string> code;
    auto started = std::chrono::steady_clock::now();
    std::thread waiter([&] { code = callback.capture_code(std::chrono::seconds(10)); });

    auto denied = get_when_ready(port, "/?error=access_denied");
    assert(denied);
    assert(denied->body.find("Authorization Failed") != std::string::npos);
    assert(denied->body.find("access_denied") != std::string::npos);

    waiter.join();
    // Woken by the callback, not by the timeout
    assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(8));
    assert(!code);
    assert(callback.error() && *callback.error() == "access_denied");
    std::cout << "  [PASS] provider error ends the wait\n";
}

void test_timeout()
{
    auth::CallbackServer callback(test_port(2));
    auto started = std::chrono::steady_clock::now();
    auto code = callback.capture_code(std::chrono::seconds(1));
    auto elapsed = std::chrono::steady_clock::now() - started;

    assert(!code);
    assert(!callback.error());
    assert(elapsed >= std::chrono::milliseconds(900));
    assert(elapsed < std::chrono::seconds(5));
    std::cout << "  [PASS] timeout returns no code\n";
}

int main()
{
    std::cout << "CallbackServer tests\n";
    test_code_is_captured();
    test_provider_error();
    test_timeout();
    std::cout << "All callback server tests passed\n";
    return 0;
}
