#pragma once
#include <spdlog/logger.h>

#include <exception>
#include <memory>
#include <string>

namespace mcpeasy
{
class Config;
}

namespace mcpeasy::logging
{

/**
 * Append-only diagnostic log for one service.
 *
 * stdout carries protocol frames only, so every diagnostic goes here. Two
 * targets per service: "error" (failures with full detail) and "startup"
 * (lifecycle events). Writes are best-effort: no method ever throws, and a
 * sink that cannot be opened degrades to a null sink.
 */
class Logger
{
  public:
    using SinkPtr = std::shared_ptr<spdlog::sinks::sink>;

    /// Discards everything.
    Logger();

    /// File sinks at config.log_file_path(service, "error" | "startup").
    Logger(const Config& config, std::string service, const std::string& level = "INFO");

    /// Caller-provided sinks (tests use ostream sinks).
    Logger(std::string service, SinkPtr error_sink, SinkPtr startup_sink,
           const std::string& level = "INFO");

    const std::string& service() const
    {
        return service_;
    }

    void startup(const std::string& message) noexcept;
    void debug(const std::string& message) noexcept;
    void info(const std::string& message) noexcept;
    void warn(const std::string& message) noexcept;
    void error(const std::string& message) noexcept;

    /// Logs context, exception type, message and the nested-exception chain.
    void error(const std::string& context, const std::exception& e) noexcept;

  private:
    std::string service_;
    std::shared_ptr<spdlog::logger> error_log_;
    std::shared_ptr<spdlog::logger> startup_log_;
};

/// "Type: message" lines for e and every exception nested inside it.
std::string describe_exception(const std::exception& e);

} // namespace mcpeasy::logging
