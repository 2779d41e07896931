#include "oztransfer/logger.hpp"

#include "oztransfer/error_codes.hpp"
#include "oztransfer/exception.hpp"

#include <fmt/chrono.h>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <unordered_map>
#include <vector>

namespace
{
    namespace log_ns = oztransfer::log;

    // NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
    std::shared_ptr<spdlog::logger> g_log;
    log_ns::level g_default_level = log_ns::level::info;
    bool g_structured = false;
    // NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)

    constexpr const char* g_logger_name = "oztransfer";

    auto make_default_logger() -> std::shared_ptr<spdlog::logger>
    {
        auto sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>(g_logger_name, std::move(sink));
        logger->set_pattern("%v");
        logger->set_level(spdlog::level::trace);
        return logger;
    } // make_default_logger

    auto to_spdlog_level(log_ns::level _level) noexcept -> spdlog::level::level_enum
    {
        // clang-format off
        switch (_level) {
            case log_ns::level::trace:    return spdlog::level::trace;
            case log_ns::level::debug:    return spdlog::level::debug;
            case log_ns::level::info:     return spdlog::level::info;
            case log_ns::level::warn:     return spdlog::level::warn;
            case log_ns::level::error:    return spdlog::level::err;
            case log_ns::level::critical: return spdlog::level::critical;
        }
        // clang-format on

        return spdlog::level::info;
    } // to_spdlog_level

    auto utc_timestamp() -> std::string
    {
        const auto now = std::chrono::system_clock::now();
        const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
        return fmt::format("{:%FT%T}.{:06}Z", fmt::gmtime(std::chrono::system_clock::to_time_t(now)), micros);
    } // utc_timestamp

    auto format_record(log_ns::level _level, std::string_view _category, std::string_view _message) -> std::string
    {
        if (g_structured) {
            // clang-format off
            const nlohmann::json record{
                {"log_category",  std::string{_category}},
                {"log_level",     std::string{log_ns::to_string(_level)}},
                {"log_message",   std::string{_message}},
                {"log_timestamp", utc_timestamp()},
                {"process_id",    getpid()}
            };
            // clang-format on

            return record.dump();
        }

        return fmt::format("[{}] [{}] [{}] {}", utc_timestamp(), log_ns::to_string(_level), _category, _message);
    } // format_record
} // anonymous namespace

namespace oztransfer::log
{
    auto init(const init_options& _options) -> void
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

        if (!_options.log_file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(_options.log_file));
            }
            catch (const spdlog::spdlog_ex& e) {
                THROW(SYS_INVALID_INPUT_PARAM, fmt::format("Cannot open log file [{}]: {}", _options.log_file, e.what()));
            }
        }

        auto composite = std::make_shared<spdlog::logger>(g_logger_name, std::begin(sinks), std::end(sinks));
        composite->set_pattern("%v");
        composite->set_level(spdlog::level::trace);

        g_log = std::move(composite);
        g_structured = _options.structured;
        g_default_level = _options.log_level;

        orchestrator::set_level(_options.log_level);
        config::set_level(_options.log_level);
        environment::set_level(_options.log_level);
        discovery::set_level(_options.log_level);
        transfer::set_level(_options.log_level);
        process::set_level(_options.log_level);
    } // init

    auto to_level(std::string_view _level) noexcept -> level
    {
        // clang-format off
        static const std::unordered_map<std::string_view, level> conv_table{
            {"trace",    level::trace},
            {"debug",    level::debug},
            {"info",     level::info},
            {"warn",     level::warn},
            {"error",    level::error},
            {"critical", level::critical}
        };
        // clang-format on

        if (auto iter = conv_table.find(_level); std::end(conv_table) != iter) {
            return iter->second;
        }

        return level::info;
    } // to_level

    auto to_string(level _level) noexcept -> std::string_view
    {
        // clang-format off
        switch (_level) {
            case level::trace:    return "trace";
            case level::debug:    return "debug";
            case level::info:     return "info";
            case level::warn:     return "warn";
            case level::error:    return "error";
            case level::critical: return "critical";
        }
        // clang-format on

        return "?";
    } // to_string

    namespace detail
    {
        auto write(level _level, std::string_view _category, std::string_view _message) noexcept -> void
        {
            try {
                if (!g_log) {
                    g_log = make_default_logger();
                }

                g_log->log(to_spdlog_level(_level), format_record(_level, _category, _message));
            }
            catch (const std::exception& e) {
                std::cerr << "oztransfer: failed to write log record: " << e.what() << '\n';
            }
        } // write

        auto default_level() noexcept -> level
        {
            return g_default_level;
        } // default_level
    } // namespace detail
} // namespace oztransfer::log
