#include <catch2/catch.hpp>

#include "kgss/kgss_exception.hpp"
#include "kgss/scoped_environment.hpp"

#include "kgss_error_matcher.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <new>
#include <optional>
#include <string>
#include <thread>

namespace
{
    constexpr const char* config_variable = kgss::scoped_environment::config_variable;
    constexpr const char* cache_variable = kgss::scoped_environment::cache_variable;

    auto get_env(const char* _name) -> std::optional<std::string>
    {
        if (const char* value = std::getenv(_name); value) { // NOLINT(concurrency-mt-unsafe)
            return value;
        }

        return std::nullopt;
    }

    // Number of allocations the calling thread may perform before operator new fails.
    // Negative values disable the failure.
    thread_local int t_allocations_until_failure = -1; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
} // anonymous namespace

// NOLINTBEGIN(cppcoreguidelines-no-malloc, cppcoreguidelines-owning-memory)
auto operator new(std::size_t _size) -> void*
{
    if (t_allocations_until_failure == 0) {
        t_allocations_until_failure = -1;
        throw std::bad_alloc{};
    }

    if (t_allocations_until_failure > 0) {
        --t_allocations_until_failure;
    }

    if (void* p = std::malloc(_size == 0 ? 1 : _size); p) {
        return p;
    }

    throw std::bad_alloc{};
}

void operator delete(void* _p) noexcept
{
    std::free(_p);
}

void operator delete(void* _p, std::size_t) noexcept
{
    std::free(_p);
}
// NOLINTEND(cppcoreguidelines-no-malloc, cppcoreguidelines-owning-memory)

TEST_CASE("scoped_environment")
{
    ::setenv(config_variable, "/etc/krb5.conf", 1); // NOLINT(concurrency-mt-unsafe)
    ::unsetenv(cache_variable);                     // NOLINT(concurrency-mt-unsafe)

    SECTION("variables point at the private files while in scope")
    {
        {
            kgss::scoped_environment env{"/tmp/a.conf", "/tmp/a.cache"};

            CHECK(kgss::scoped_environment::held_by_this_thread());
            CHECK(get_env(config_variable) == "/tmp/a.conf");
            CHECK(get_env(cache_variable) == "/tmp/a.cache");
        }

        CHECK_FALSE(kgss::scoped_environment::held_by_this_thread());
        CHECK(get_env(config_variable) == "/etc/krb5.conf");
        CHECK_FALSE(get_env(cache_variable).has_value());
    }

    SECTION("previous values are restored when the scope is left by an exception")
    {
        try {
            kgss::scoped_environment env{"/tmp/b.conf", "/tmp/b.cache"};
            KGSS_THROW(kgss::errc::negotiation_failed, "leaving the scope early");
        }
        catch (const kgss::exception&) {
        }

        CHECK_FALSE(kgss::scoped_environment::held_by_this_thread());
        CHECK(get_env(config_variable) == "/etc/krb5.conf");
        CHECK_FALSE(get_env(cache_variable).has_value());
    }

    SECTION("entering the scope twice from one thread throws")
    {
        kgss::scoped_environment outer{"/tmp/c.conf", "/tmp/c.cache"};

        CHECK_THROWS_MATCHES(kgss::scoped_environment("/tmp/d.conf", "/tmp/d.cache"),
                             kgss::exception,
                             has_error_code(kgss::errc::environment_scope_reentered));

        // The outer scope is unaffected.
        CHECK(kgss::scoped_environment::held_by_this_thread());
        CHECK(get_env(config_variable) == "/tmp/c.conf");
        CHECK(get_env(cache_variable) == "/tmp/c.cache");
    }

    SECTION("scopes held by different threads never overlap")
    {
        std::atomic<bool> entered{false};
        std::atomic<bool> held_before_entering{true};
        std::optional<std::string> seen_by_other_thread;

        std::thread other;

        {
            kgss::scoped_environment env{"/tmp/e.conf", "/tmp/e.cache"};

            other = std::thread{[&] {
                held_before_entering = kgss::scoped_environment::held_by_this_thread();

                kgss::scoped_environment inner{"/tmp/f.conf", "/tmp/f.cache"};
                seen_by_other_thread = get_env(config_variable);
                entered = true;
            }};

            std::this_thread::sleep_for(std::chrono::milliseconds{100});

            CHECK_FALSE(entered.load());
            CHECK(get_env(config_variable) == "/tmp/e.conf");
        }

        other.join();

        CHECK(entered.load());
        CHECK_FALSE(held_before_entering.load());
        CHECK(seen_by_other_thread == "/tmp/f.conf");
        CHECK(get_env(config_variable) == "/etc/krb5.conf");
        CHECK_FALSE(get_env(cache_variable).has_value());
    }

    ::unsetenv(config_variable); // NOLINT(concurrency-mt-unsafe)
}

TEST_CASE("scoped_environment is not held after a failed capture of the previous values")
{
    // Long enough to defeat the small string optimization.
    ::setenv(config_variable, "/etc/kerberos/configuration/krb5.conf", 1); // NOLINT(concurrency-mt-unsafe)
    ::unsetenv(cache_variable);                                            // NOLINT(concurrency-mt-unsafe)

    const std::string config_path = "/tmp/g.conf";
    const std::string cache_path = "/tmp/g.cache";

    const auto enter = [&] {
        t_allocations_until_failure = 0;
        kgss::scoped_environment env{config_path, cache_path};
    };

    CHECK_THROWS_AS(enter(), std::bad_alloc);
    t_allocations_until_failure = -1;

    CHECK_FALSE(kgss::scoped_environment::held_by_this_thread());
    CHECK(get_env(config_variable) == "/etc/kerberos/configuration/krb5.conf");

    // The mutex was released and the thread may enter a new scope.
    {
        kgss::scoped_environment env{config_path, cache_path};
        CHECK(kgss::scoped_environment::held_by_this_thread());
        CHECK(get_env(config_variable) == config_path);
    }

    CHECK_FALSE(kgss::scoped_environment::held_by_this_thread());

    ::unsetenv(config_variable); // NOLINT(concurrency-mt-unsafe)
}
