#ifndef KGSS_LOGGER_HPP
#define KGSS_LOGGER_HPP

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace kgss::log
{
    using key_value = std::pair<const std::string, std::string>;

    enum class level : std::uint8_t
    {
        trace,
        debug,
        info,
        warn,
        error,
        critical
    };

    struct category
    {
        struct session;
        struct authentication;
        struct negotiation;
        struct protection;
        struct configuration;
    };

    template <typename Category>
    class logger_config;

    template <typename Category>
    class logger;

    // clang-format off
    using session        = logger<category::session>;
    using authentication = logger<category::authentication>;
    using negotiation    = logger<category::negotiation>;
    using protection     = logger<category::protection>;
    using configuration  = logger<category::configuration>;
    // clang-format on

    /// Installs the sinks every category writes to.
    ///
    /// When \p _sinks is empty, a single colored stderr sink is used. Calling this function
    /// again replaces the previous sinks.
    void init(std::vector<spdlog::sink_ptr> _sinks = {}) noexcept;

    auto to_level(std::string_view _level) noexcept -> level;

    auto to_string(level _level) noexcept -> std::string_view;

    /// Sets the threshold of the category named \p _category (e.g. "negotiation").
    ///
    /// \returns false if no category carries that name.
    auto set_level(std::string_view _category, level _level) noexcept -> bool;

    namespace detail
    {
        auto get_logger() noexcept -> std::shared_ptr<spdlog::logger>;
    } // namespace detail

    template <typename Category>
    class logger
    {
      public:
        template <level Level>
        class impl;

        logger() = delete;

        logger(const logger&) = delete;
        auto operator=(const logger&) -> logger& = delete;

        static void set_level(level _level) noexcept
        {
            logger_config<Category>::level = _level;
        }

        static auto get_level() noexcept -> level
        {
            return logger_config<Category>::level;
        }

        // clang-format off
        inline static const auto trace    = impl<level::trace>{};
        inline static const auto debug    = impl<level::debug>{};
        inline static const auto info     = impl<level::info>{};
        inline static const auto warn     = impl<level::warn>{};
        inline static const auto error    = impl<level::error>{};
        inline static const auto critical = impl<level::critical>{};
        // clang-format on
    }; // class logger

    //
    // Logger Configuration
    //

    template <>
    class logger_config<category::session>
    {
        static constexpr const char* name = "session";
        inline static log::level level = log::level::info;

        friend class logger<category::session>;
        friend auto set_level(std::string_view, log::level) noexcept -> bool;
    };

    template <>
    class logger_config<category::authentication>
    {
        static constexpr const char* name = "authentication";
        inline static log::level level = log::level::info;

        friend class logger<category::authentication>;
        friend auto set_level(std::string_view, log::level) noexcept -> bool;
    };

    template <>
    class logger_config<category::negotiation>
    {
        static constexpr const char* name = "negotiation";
        inline static log::level level = log::level::info;

        friend class logger<category::negotiation>;
        friend auto set_level(std::string_view, log::level) noexcept -> bool;
    };

    template <>
    class logger_config<category::protection>
    {
        static constexpr const char* name = "protection";
        inline static log::level level = log::level::info;

        friend class logger<category::protection>;
        friend auto set_level(std::string_view, log::level) noexcept -> bool;
    };

    template <>
    class logger_config<category::configuration>
    {
        static constexpr const char* name = "configuration";
        inline static log::level level = log::level::info;

        friend class logger<category::configuration>;
        friend auto set_level(std::string_view, log::level) noexcept -> bool;
    };

    //
    // Logger
    //

    template <typename Category>
    template <level Level>
    class logger<Category>::impl
    {
      public:
        template <typename... Args>
        void operator()(fmt::format_string<Args...> _format, Args&&... _args) const noexcept
        {
            if (!should_log()) {
                return;
            }

            try {
                (*this)({{"log_message", fmt::format(_format, std::forward<Args>(_args)...)}});
            }
            catch (const std::exception&) {
            }
        }

        void operator()(std::initializer_list<key_value> _list) const noexcept
        {
            (*this)(std::begin(_list), std::end(_list));
        }

        // Only ranges of key_value pairs. Any other pair of pointers (e.g. a format string
        // followed by a single C string) belongs to the format string overload.
        template <typename ForwardIt,
                  std::enable_if_t<std::is_same_v<typename std::iterator_traits<ForwardIt>::value_type, key_value>,
                                   int> = 0>
        void operator()(ForwardIt _first, ForwardIt _last) const noexcept
        {
            if (!should_log()) {
                return;
            }

            auto log = detail::get_logger();

            if (!log) {
                return;
            }

            try {
                const auto msg = to_json_string(_first, _last);

                if constexpr (Level == level::trace) {
                    log->trace(msg);
                }
                else if constexpr (Level == level::debug) {
                    log->debug(msg);
                }
                else if constexpr (Level == level::info) {
                    log->info(msg);
                }
                else if constexpr (Level == level::warn) {
                    log->warn(msg);
                }
                else if constexpr (Level == level::error) {
                    log->error(msg);
                }
                else if constexpr (Level == level::critical) {
                    log->critical(msg);
                }
            }
            catch (const std::exception&) {
            }
        }

      private:
        static auto should_log() noexcept -> bool
        {
            return Level >= logger_config<Category>::level;
        }

        template <typename ForwardIt>
        static auto to_json_string(ForwardIt _first, ForwardIt _last) -> std::string
        {
            nlohmann::json msg;

            msg["log_category"] = logger_config<Category>::name;
            msg["log_level"] = std::string{to_string(Level)};

            for (; _first != _last; ++_first) {
                msg[_first->first] = _first->second;
            }

            return msg.dump();
        }
    }; // class logger<Category>::impl
} // namespace kgss::log

#endif // KGSS_LOGGER_HPP
