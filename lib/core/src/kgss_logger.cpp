#include "kgss/kgss_logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <unordered_map>

namespace
{
    // NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
    std::shared_ptr<spdlog::logger> g_log;
    std::mutex g_log_mutex;
    // NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)

    auto make_logger(std::vector<spdlog::sink_ptr> _sinks) -> std::shared_ptr<spdlog::logger>
    {
        if (_sinks.empty()) {
            _sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }

        auto log = std::make_shared<spdlog::logger>("kgss", std::begin(_sinks), std::end(_sinks));

        // Filtering happens per category. The spdlog logger passes everything through.
        log->set_level(spdlog::level::trace);
        log->set_pattern("%v");

        return log;
    } // make_logger
} // anonymous namespace

namespace kgss::log
{
    void init(std::vector<spdlog::sink_ptr> _sinks) noexcept
    {
        try {
            auto log = make_logger(std::move(_sinks));

            std::lock_guard lock{g_log_mutex};
            g_log = std::move(log);
        }
        catch (const std::exception&) {
        }
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
        switch (_level) {
            case level::trace:    return "trace";
            case level::debug:    return "debug";
            case level::info:     return "info";
            case level::warn:     return "warn";
            case level::error:    return "error";
            case level::critical: return "critical";
        }

        return "info";
    } // to_string

    auto set_level(std::string_view _category, level _level) noexcept -> bool
    {
        // clang-format off
        if (_category == logger_config<category::session>::name)        { session::set_level(_level); }
        else if (_category == logger_config<category::authentication>::name) { authentication::set_level(_level); }
        else if (_category == logger_config<category::negotiation>::name)    { negotiation::set_level(_level); }
        else if (_category == logger_config<category::protection>::name)     { protection::set_level(_level); }
        else if (_category == logger_config<category::configuration>::name)  { configuration::set_level(_level); }
        else { return false; }
        // clang-format on

        return true;
    } // set_level

    namespace detail
    {
        auto get_logger() noexcept -> std::shared_ptr<spdlog::logger>
        {
            std::lock_guard lock{g_log_mutex};

            if (!g_log) {
                try {
                    g_log = make_logger({});
                }
                catch (const std::exception&) {
                    return nullptr;
                }
            }

            return g_log;
        } // get_logger
    } // namespace detail
} // namespace kgss::log
