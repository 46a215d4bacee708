#include <catch2/catch.hpp>

#include "kgss/kgss_exception.hpp"
#include "kgss/security_context.hpp"

#include "fake_native_api.hpp"
#include "kgss_error_matcher.hpp"

#include <fmt/format.h>

#include <string>
#include <utility>

namespace
{
    auto to_bytes(const std::string& _s) -> kgss::bytes
    {
        return {std::begin(_s), std::end(_s)};
    }
} // anonymous namespace

TEST_CASE("security_context multi-round negotiation")
{
    kgss::test::fake_native_api api;
    kgss::security_context context{api};

    CHECK(context.state() == kgss::negotiation_state::uninitialized);
    CHECK(context.handle() == GSS_C_NO_CONTEXT);

    const auto first = context.step("HTTP@service.example.com");

    CHECK(first.output == to_bytes("token-1"));
    CHECK_FALSE(first.completed);
    CHECK(context.state() == kgss::negotiation_state::negotiating);
    CHECK_FALSE(context.established());
    CHECK(api.last_target == "HTTP@service.example.com");
    CHECK(api.negotiation_inputs.empty());
    CHECK(api.live_names == 0);

    const auto second = context.step("HTTP@service.example.com", to_bytes("reply-1"));

    CHECK(second.output == to_bytes("token-2"));
    CHECK(second.completed);
    CHECK(context.established());
    REQUIRE(api.negotiation_inputs.size() == 1);
    CHECK(api.negotiation_inputs[0] == to_bytes("reply-1"));

    // One native context lives across both rounds.
    CHECK(api.live_security_contexts == 1);
    CHECK(api.live_names == 0);
    CHECK(api.live_buffers == 0);

    SECTION("no round may run once established")
    {
        CHECK_THROWS_MATCHES(context.step("HTTP@service.example.com", to_bytes("reply-2")),
                             kgss::exception,
                             has_error_code(kgss::errc::context_already_established));

        CHECK(api.call_count("init_sec_context") == 2);
        CHECK(api.call_count("import_name") == 2);
    }

    SECTION("reset deletes the native context")
    {
        context.reset();

        CHECK(context.state() == kgss::negotiation_state::uninitialized);
        CHECK(context.handle() == GSS_C_NO_CONTEXT);
        CHECK(api.call_count("delete_sec_context") == 1);
        CHECK(api.leaked_resources() == 0);
    }
}

TEST_CASE("security_context completes in a single round")
{
    kgss::test::fake_native_api api;
    api.negotiation_script = {GSS_S_COMPLETE};

    kgss::security_context context{api};

    SECTION("with a token for the peer")
    {
        const auto result = context.step("ldap@directory.example.com");

        CHECK(result.completed);
        CHECK(result.output == to_bytes("token-1"));
        CHECK(context.established());
    }

    SECTION("without a token for the peer")
    {
        api.final_round_has_token = false;

        const auto result = context.step("ldap@directory.example.com");

        CHECK(result.completed);
        CHECK(result.output.empty());
    }
}

TEST_CASE("security_context request flags")
{
    kgss::test::fake_native_api api;

    SECTION("none by default")
    {
        kgss::security_context context{api};
        context.step("HTTP@host");
        CHECK(api.last_request_flags == 0);
    }

    SECTION("as configured")
    {
        kgss::negotiation_options options;
        options.mutual_authentication = true;
        options.integrity = true;

        kgss::security_context context{api, options};
        context.step("HTTP@host");
        CHECK(api.last_request_flags == (GSS_C_MUTUAL_FLAG | GSS_C_INTEG_FLAG));
    }
}

TEST_CASE("security_context failures")
{
    kgss::test::fake_native_api api;

    SECTION("negotiation failure")
    {
        api.negotiation_script = {GSS_S_FAILURE};
        api.negotiation_minor = 7;

        kgss::security_context context{api};

        try {
            context.step("HTTP@unknown.example.com");
            FAIL("expected an exception");
        }
        catch (const kgss::exception& e) {
            CHECK(e.code() == kgss::errc::negotiation_failed);
            CHECK(e.native().source == kgss::native_status::family::gss);
            CHECK(e.native().major == GSS_S_FAILURE);
            CHECK(e.native().minor == 7);
            CHECK(std::string{e.what()} ==
                  fmt::format("gss_init_sec_context failed: major status {0}: minor status 7. (error code {0} - 7)",
                              GSS_S_FAILURE));
        }

        CHECK(context.state() == kgss::negotiation_state::negotiating);
        CHECK(api.live_names == 0);
        CHECK(api.live_buffers == 0);
    }

    SECTION("target name cannot be imported")
    {
        api.import_name_major = GSS_S_BAD_NAMETYPE;

        kgss::security_context context{api};

        CHECK_THROWS_MATCHES(context.step("not a service name"),
                             kgss::exception,
                             has_error_code(kgss::errc::name_import_failed));

        CHECK(api.call_count("init_sec_context") == 0);
        CHECK(context.state() == kgss::negotiation_state::uninitialized);
    }
}

TEST_CASE("security_context move leaves the source uninitialized")
{
    kgss::test::fake_native_api api;
    api.negotiation_script = {GSS_S_COMPLETE};

    kgss::security_context source{api};
    source.step("HTTP@host");
    REQUIRE(source.established());

    SECTION("move construction")
    {
        kgss::security_context target{std::move(source)};

        CHECK(target.established());
        CHECK(target.handle() != GSS_C_NO_CONTEXT);
        CHECK(source.state() == kgss::negotiation_state::uninitialized); // NOLINT(bugprone-use-after-move)
        CHECK(source.handle() == GSS_C_NO_CONTEXT);                      // NOLINT(bugprone-use-after-move)
    }

    SECTION("move assignment releases the target's previous context")
    {
        kgss::test::fake_native_api other_api;
        kgss::security_context target{other_api};
        target.step("HTTP@other");
        REQUIRE(other_api.live_security_contexts == 1);

        target = std::move(source);

        CHECK(other_api.live_security_contexts == 0);
        CHECK(target.established());
        CHECK(&target.api() == &api);
        CHECK_FALSE(source.established()); // NOLINT(bugprone-use-after-move)
        CHECK(api.live_security_contexts == 1);
    }
}

TEST_CASE("negotiation_state names")
{
    CHECK(kgss::to_string(kgss::negotiation_state::uninitialized) == "uninitialized");
    CHECK(kgss::to_string(kgss::negotiation_state::negotiating) == "negotiating");
    CHECK(kgss::to_string(kgss::negotiation_state::established) == "established");
}
