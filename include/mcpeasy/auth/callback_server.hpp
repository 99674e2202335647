#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace httplib
{
class Server;
}

namespace mcpeasy::auth
{

/**
 * One-shot local listener that captures an OAuth authorization code.
 *
 * Binds 127.0.0.1:<port> on a single background thread. The browser is
 * redirected to http://localhost:<port>/?code=... (or ?error=...). The
 * listener is stopped and its thread joined before capture_code() returns.
 */
class CallbackServer
{
  public:
    explicit CallbackServer(int port = 8080, std::string host = "127.0.0.1");
    ~CallbackServer();

    CallbackServer(const CallbackServer&) = delete;
    CallbackServer& operator=(const CallbackServer&) = delete;

    /// Wait up to `timeout` for a callback. Returns the code, or nullopt on
    /// timeout or when the provider redirected with an error.
    /// Throws AuthError if the port cannot be bound.
    std::optional<std::string> capture_code(std::chrono::seconds timeout = std::chrono::seconds(60));

    /// Error reported by the provider on the last capture, if any.
    const std::optional<std::string>& error() const
    {
        return error_;
    }

    int port() const
    {
        return port_;
    }

  private:
    void start();
    void stop();

    std::string host_;
    int port_;
    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;

    std::mutex mutex_; ///< guards everything below
    std::condition_variable cv_;
    bool listening_failed_{false};
    bool received_{false};
    std::optional<std::string> code_;
    std::optional<std::string> error_;
};

} // namespace mcpeasy::auth
