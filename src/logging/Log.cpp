// src/logging/Log.cpp
#include "logging/Log.h"

#include "rustactions/util/StringUtil.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <system_error>
#include <vector>

namespace rustactions::logging {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMaxFileSize = 1u << 20; // 1 MiB
constexpr std::size_t kMaxFiles    = 4;

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

} // namespace

void Init(const LogOptions& options)
{
    std::vector<spdlog::sink_ptr> sinks;

    if (options.console)
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string fileError;
    if (!options.directory.empty())
    {
        std::error_code ec;
        fs::create_directories(options.directory, ec);
        if (ec)
        {
            fileError = "cannot create " + options.directory.string() + ": " + ec.message();
        }
        else
        {
            const fs::path file = options.directory / fs::path(std::string(options.fileName));
            try
            {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    file.string(), kMaxFileSize, kMaxFiles));
            }
            catch (const spdlog::spdlog_ex& e)
            {
                fileError = e.what();
            }
        }
    }

    auto logger = std::make_shared<spdlog::logger>("rustactions", sinks.begin(), sinks.end());
    logger->set_level(options.level);
    logger->set_pattern(kPattern);
    logger->flush_on(spdlog::level::warn);

    spdlog::drop("rustactions");
    spdlog::set_default_logger(logger);

    if (!fileError.empty())
        spdlog::warn("Logging: file sink disabled: {}", fileError);

    spdlog::debug("Logging started (level {})", spdlog::level::to_string_view(options.level));
}

void Shutdown() noexcept
{
    try
    {
        if (auto logger = spdlog::default_logger())
            logger->flush();
        spdlog::shutdown();
    }
    catch (const std::exception&)
    {
        // Nothing left to report to at this point.
    }
}

std::optional<spdlog::level::level_enum> ParseLevel(std::string_view text)
{
    const std::string t = util::ToLowerCopy(util::Trim(text));
    if (t == "trace")                    return spdlog::level::trace;
    if (t == "debug")                    return spdlog::level::debug;
    if (t == "info")                     return spdlog::level::info;
    if (t == "warn" || t == "warning")   return spdlog::level::warn;
    if (t == "error" || t == "err")      return spdlog::level::err;
    if (t == "critical")                 return spdlog::level::critical;
    if (t == "off")                      return spdlog::level::off;
    return std::nullopt;
}

} // namespace rustactions::logging
