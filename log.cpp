#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "log.h"

namespace nett
{

namespace
{

constexpr const char* kLogPattern = "%Y%m%d %T.%f %t %L %v %s:%#";

spdlog::level::level_enum parse_level_name(const std::string& level)
{
    struct level_alias
    {
        const char* name;
        spdlog::level::level_enum value;
    };

    static constexpr level_alias kLevels[] = {
        {.name = "trace", .value = spdlog::level::trace},
        {.name = "debug", .value = spdlog::level::debug},
        {.name = "info", .value = spdlog::level::info},
        {.name = "warn", .value = spdlog::level::warn},
        {.name = "warning", .value = spdlog::level::warn},
        {.name = "err", .value = spdlog::level::err},
        {.name = "error", .value = spdlog::level::err},
        {.name = "off", .value = spdlog::level::off},
    };

    for (const auto& entry : kLevels)
    {
        if (level == entry.name)
        {
            return entry.value;
        }
    }
    return spdlog::level::info;
}

std::uint32_t env_or(const char* name, const std::uint32_t fallback)
{
    const char* value = std::getenv(name);
    if (value == nullptr)
    {
        return fallback;
    }
    const long parsed = std::strtol(value, nullptr, 10);
    return parsed > 0 ? static_cast<std::uint32_t>(parsed) : fallback;
}

void apply_level(const std::string& level)
{
    if (std::getenv("TRACE") != nullptr)
    {
        spdlog::set_level(spdlog::level::trace);
    }
    else if (std::getenv("DEBUG") != nullptr)
    {
        spdlog::set_level(spdlog::level::debug);
    }
    else
    {
        spdlog::set_level(parse_level_name(level));
    }
}

void install(std::vector<spdlog::sink_ptr> sinks, const std::string& level)
{
    auto logger = std::make_shared<spdlog::logger>("", begin(sinks), end(sinks));
    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(3));
    spdlog::set_pattern(kLogPattern);
    apply_level(level);
}

}    // namespace

void init_log(const std::string& filename, const std::string& level)
{
    constexpr std::uint32_t kFileSize = 50 * 1024 * 1024;
    constexpr std::uint32_t kFileCount = 5;

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    sinks.push_back(
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(filename, env_or("kLogFileSize", kFileSize), env_or("kLogFileCount", kFileCount)));
    install(std::move(sinks), level);
}

void init_console_log(const std::string& level)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    install(std::move(sinks), level);
}

void set_level(const std::string& level) { spdlog::set_level(parse_level_name(level)); }

void shutdown_log()
{
    spdlog::default_logger()->flush();
    spdlog::shutdown();
}

}    // namespace nett
