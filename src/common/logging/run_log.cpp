#include "delf/logging.hpp"

#include <cstdlib>
#include <string>
#include <system_error>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace delf::logging
{
namespace
{
constexpr const char *kLoggerName = "delf";
constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S] [%l] %v";

std::shared_ptr<spdlog::logger> &current()
{
    static std::shared_ptr<spdlog::logger> logger =
        std::make_shared<spdlog::logger>(kLoggerName, std::make_shared<spdlog::sinks::null_sink_mt>());
    return logger;
}

} // namespace

std::filesystem::path defaultLogPath()
{
    if (const char *state = std::getenv("XDG_STATE_HOME"))
    {
        std::filesystem::path path(state);
        if (!path.empty())
            return path / "delf" / "delf.log";
    }
    if (const char *home = std::getenv("HOME"))
    {
        std::filesystem::path path(home);
        if (!path.empty())
            return path / ".delf" / "delf.log";
    }
    return std::filesystem::path(".delf") / "delf.log";
}

bool initRunLog(const std::filesystem::path &file, std::string_view level)
{
    std::error_code ec;
    if (file.has_parent_path())
        std::filesystem::create_directories(file.parent_path(), ec);

    try
    {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string(), false);
        auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
        logger->set_pattern(kPattern);
        logger->set_level(parseLevel(level));
        logger->flush_on(spdlog::level::warn);
        current() = std::move(logger);
    }
    catch (const spdlog::spdlog_ex &)
    {
        disableRunLog();
        return false;
    }
    return true;
}

void disableRunLog()
{
    if (current())
        current()->flush();
    current() = std::make_shared<spdlog::logger>(kLoggerName, std::make_shared<spdlog::sinks::null_sink_mt>());
}

std::shared_ptr<spdlog::logger> runLog()
{
    return current();
}

spdlog::level::level_enum parseLevel(std::string_view level) noexcept
{
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "warn" || level == "warning")
        return spdlog::level::warn;
    if (level == "error")
        return spdlog::level::err;
    if (level == "off")
        return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace delf::logging
