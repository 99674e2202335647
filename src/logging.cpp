#include "mcpeasy/logging.hpp"

#include "mcpeasy/config.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <filesystem>
#include <sstream>
#include <typeinfo>

#ifdef __GNUG__
#include <cstdlib>
#include <cxxabi.h>
#endif

namespace mcpeasy::logging
{

namespace
{
constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

std::string type_name(const std::exception& e)
{
    const char* raw = typeid(e).name();
#ifdef __GNUG__
    int status = 0;
    char* demangled = abi::__cxa_demangle(raw, nullptr, nullptr, &status);
    if (status == 0 && demangled)
    {
        std::string out(demangled);
        std::free(demangled);
        return out;
    }
#endif
    return raw;
}

void describe_into(std::ostringstream& out, const std::exception& e, int depth)
{
    if (depth > 0)
        out << "\n  caused by: ";
    out << type_name(e) << ": " << e.what();
    try
    {
        std::rethrow_if_nested(e);
    }
    catch (const std::exception& inner)
    {
        describe_into(out, inner, depth + 1);
    }
    catch (...)
    {
        out << "\n  caused by: <non-standard exception>";
    }
}

Logger::SinkPtr open_file_sink(const std::filesystem::path& path)
{
    try
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        return std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
    }
    catch (const spdlog::spdlog_ex&)
    {
        return std::make_shared<spdlog::sinks::null_sink_mt>();
    }
}

std::shared_ptr<spdlog::logger> make_logger(const std::string& name, Logger::SinkPtr sink,
                                            const std::string& level)
{
    if (!sink)
        sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    // Not registered globally, so two servers never share a logger by name.
    auto log = std::make_shared<spdlog::logger>(name, std::move(sink));
    log->set_pattern(LOG_PATTERN);
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off" && level != "OFF")
        lvl = spdlog::level::info;
    log->set_level(lvl);
    log->flush_on(spdlog::level::trace);
    log->set_error_handler([](const std::string&) {});
    return log;
}

std::string lower(std::string s)
{
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}
} // namespace

std::string describe_exception(const std::exception& e)
{
    std::ostringstream out;
    describe_into(out, e, 0);
    return out.str();
}

Logger::Logger() : Logger("null", nullptr, nullptr) {}

Logger::Logger(const Config& config, std::string service, const std::string& level)
    : Logger(service, open_file_sink(config.log_file_path(service, "error")),
             open_file_sink(config.log_file_path(service, "startup")), level)
{
}

Logger::Logger(std::string service, SinkPtr error_sink, SinkPtr startup_sink,
               const std::string& level)
    : service_(std::move(service))
{
    // spdlog level names are lowercase; settings are uppercased
    auto lvl = lower(level);
    if (lvl == "warning")
        lvl = "warn";
    error_log_ = make_logger(service_ + ".error", std::move(error_sink), lvl);
    startup_log_ = make_logger(service_ + ".startup", std::move(startup_sink), lvl);
}

void Logger::startup(const std::string& message) noexcept
{
    try
    {
        startup_log_->info(message);
    }
    catch (const std::exception&)
    {
    }
}

void Logger::debug(const std::string& message) noexcept
{
    try
    {
        error_log_->debug(message);
    }
    catch (const std::exception&)
    {
    }
}

void Logger::info(const std::string& message) noexcept
{
    try
    {
        error_log_->info(message);
    }
    catch (const std::exception&)
    {
    }
}

void Logger::warn(const std::string& message) noexcept
{
    try
    {
        error_log_->warn(message);
    }
    catch (const std::exception&)
    {
    }
}

void Logger::error(const std::string& message) noexcept
{
    try
    {
        error_log_->error(message);
    }
    catch (const std::exception&)
    {
    }
}

void Logger::error(const std::string& context, const std::exception& e) noexcept
{
    try
    {
        error_log_->error("{}: {}", context, describe_exception(e));
    }
    catch (const std::exception&)
    {
    }
}

} // namespace mcpeasy::logging
