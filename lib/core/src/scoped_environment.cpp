#include "kgss/scoped_environment.hpp"

#include "kgss/kgss_exception.hpp"
#include "kgss/kgss_logger.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace
{
    // NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
    std::mutex g_environment_mutex;
    thread_local bool t_scope_held = false;
    // NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)

    auto capture(const char* _name) -> std::optional<std::string>
    {
        if (const char* value = std::getenv(_name); value) { // NOLINT(concurrency-mt-unsafe)
            return value;
        }

        return std::nullopt;
    } // capture

    auto assign(const char* _name, const std::optional<std::string>& _value) noexcept -> int
    {
        // NOLINTNEXTLINE(concurrency-mt-unsafe)
        return _value ? ::setenv(_name, _value->c_str(), 1) : ::unsetenv(_name);
    } // assign
} // anonymous namespace

namespace kgss
{
    scoped_environment::scoped_environment(const std::string& _config_path, const std::string& _cache_path)
    {
        if (t_scope_held) {
            KGSS_THROW(errc::environment_scope_reentered,
                       "scoped_environment: the calling thread already holds the environment scope.");
        }

        lock_ = std::unique_lock{g_environment_mutex};

        previous_config_ = capture(config_variable);
        previous_cache_ = capture(cache_variable);

        // The captures allocate. Mark the scope as held only once they have succeeded.
        t_scope_held = true;

        if (assign(config_variable, _config_path) != 0 || assign(cache_variable, _cache_path) != 0) {
            const auto error = errno;
            restore();
            t_scope_held = false;
            KGSS_THROW(errc::environment_update_failed,
                       fmt::format("scoped_environment: could not update the environment. [{}]",
                                   std::strerror(error))); // NOLINT(concurrency-mt-unsafe)
        }
    } // scoped_environment

    scoped_environment::~scoped_environment()
    {
        restore();
        t_scope_held = false;
    } // ~scoped_environment

    auto scoped_environment::held_by_this_thread() noexcept -> bool
    {
        return t_scope_held;
    } // held_by_this_thread

    void scoped_environment::restore() noexcept
    {
        if (assign(config_variable, previous_config_) != 0) {
            log::session::error("scoped_environment: could not restore [{}].", config_variable);
        }

        if (assign(cache_variable, previous_cache_) != 0) {
            log::session::error("scoped_environment: could not restore [{}].", cache_variable);
        }
    } // restore
} // namespace kgss
