#ifndef OZTRANSFER_LOGGER_HPP
#define OZTRANSFER_LOGGER_HPP

/// \file

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace oztransfer::log
{
    enum class level : std::uint8_t
    {
        trace,
        debug,
        info,
        warn,
        error,
        critical
    }; // enum class level

    struct category
    {
        struct orchestrator;
        struct config;
        struct environment;
        struct discovery;
        struct transfer;
        struct process;
    }; // struct category

    template <typename Category>
    class logger_config;

    template <typename Category>
    class logger;

    // clang-format off
    using orchestrator = logger<category::orchestrator>;
    using config       = logger<category::config>;
    using environment  = logger<category::environment>;
    using discovery    = logger<category::discovery>;
    using transfer     = logger<category::transfer>;
    using process      = logger<category::process>;
    // clang-format on

    struct init_options
    {
        level log_level = level::info;

        // Records are also appended to this file when it is not empty.
        std::string log_file;

        // Emit one JSON object per record instead of plain text.
        bool structured = false;
    }; // struct init_options

    /// Installs the process-wide sinks and sets the level of every category.
    ///
    /// Logging works without calling this function. In that case, plain text
    /// records at level info and above are written to stderr.
    ///
    /// \throws oztransfer::exception If the log file cannot be opened.
    auto init(const init_options& _options) -> void;

    /// Converts a level name ("trace", "debug", ...) to a level. Unknown names map to info.
    auto to_level(std::string_view _level) noexcept -> level;

    auto to_string(level _level) noexcept -> std::string_view;

    namespace detail
    {
        auto write(level _level, std::string_view _category, std::string_view _message) noexcept -> void;

        auto default_level() noexcept -> level;
    } // namespace detail

    // clang-format off
    template <> class logger_config<category::orchestrator> { public: static constexpr const char* name = "orchestrator"; };
    template <> class logger_config<category::config>       { public: static constexpr const char* name = "config"; };
    template <> class logger_config<category::environment>  { public: static constexpr const char* name = "environment"; };
    template <> class logger_config<category::discovery>    { public: static constexpr const char* name = "discovery"; };
    template <> class logger_config<category::transfer>     { public: static constexpr const char* name = "transfer"; };
    template <> class logger_config<category::process>      { public: static constexpr const char* name = "process"; };
    // clang-format on

    template <typename Category>
    class logger
    {
    public:
        template <level Level>
        class impl
        {
        public:
            constexpr impl() = default;

            impl(const impl&) = delete;
            auto operator=(const impl&) -> impl& = delete;

            template <typename... Args>
            auto operator()(fmt::format_string<Args...> _format, Args&&... _args) const noexcept -> void
            {
                if (Level < logger::get_level()) {
                    return;
                }

                try {
                    detail::write(Level,
                                  logger_config<Category>::name,
                                  fmt::format(_format, std::forward<Args>(_args)...));
                }
                catch (const std::exception& e) {
                    detail::write(level::error, logger_config<Category>::name, e.what());
                }
            }
        }; // class impl

        logger() = delete;

        static auto set_level(level _level) noexcept -> void
        {
            level_ = _level;
            level_is_set_ = true;
        }

        static auto get_level() noexcept -> level
        {
            return level_is_set_ ? level_ : detail::default_level();
        }

        // clang-format off
        inline static const impl<level::trace>    trace{};
        inline static const impl<level::debug>    debug{};
        inline static const impl<level::info>     info{};
        inline static const impl<level::warn>     warn{};
        inline static const impl<level::error>    error{};
        inline static const impl<level::critical> critical{};
        // clang-format on

    private:
        inline static level level_ = level::info;
        inline static bool level_is_set_ = false;
    }; // class logger
} // namespace oztransfer::log

#endif // OZTRANSFER_LOGGER_HPP
