#include <catch2/catch.hpp>

#include "kgss/kgss_exception.hpp"
#include "kgss/message_protection.hpp"

#include "fake_native_api.hpp"
#include "kgss_error_matcher.hpp"

#include <string>

using fake_native_api = kgss::test::fake_native_api;

TEST_CASE("message protection requires an established context")
{
    fake_native_api api;
    kgss::security_context context{api};

    const kgss::bytes message{1, 2, 3};

    CHECK_THROWS_MATCHES(kgss::wrap(context, message),
                         kgss::exception,
                         has_error_code(kgss::errc::context_not_established));

    CHECK_THROWS_MATCHES(kgss::unwrap(context, message),
                         kgss::exception,
                         has_error_code(kgss::errc::context_not_established));

    // Still refused part way through negotiation.
    context.step("HTTP@host");
    REQUIRE(context.state() == kgss::negotiation_state::negotiating);

    CHECK_THROWS_MATCHES(kgss::wrap(context, message),
                         kgss::exception,
                         has_error_code(kgss::errc::context_not_established));

    CHECK(api.call_count("wrap") == 0);
    CHECK(api.call_count("unwrap") == 0);
}

TEST_CASE("message protection with an established context")
{
    fake_native_api api;
    api.negotiation_script = {GSS_S_COMPLETE};

    kgss::security_context context{api};
    context.step("HTTP@host");
    REQUIRE(context.established());

    const kgss::bytes message{'h', 'e', 'l', 'l', 'o'};

    SECTION("wrap requests confidentiality by default")
    {
        CHECK(kgss::wrap(context, message) == fake_native_api::protect(message));
        CHECK(api.last_confidentiality_request == 1);
        CHECK(api.live_buffers == 0);
    }

    SECTION("wrap with integrity only")
    {
        CHECK(kgss::wrap(context, message, false) == fake_native_api::protect(message));
        CHECK(api.last_confidentiality_request == 0);
    }

    SECTION("confidentiality not granted is not an error")
    {
        api.grant_confidentiality = false;
        CHECK(kgss::wrap(context, message) == fake_native_api::protect(message));
    }

    SECTION("unwrap reverses the peer's wrap")
    {
        CHECK(kgss::unwrap(context, fake_native_api::protect(message)) == message);
        CHECK(api.live_buffers == 0);
    }

    SECTION("empty messages")
    {
        const auto wrapped = kgss::wrap(context, {});
        CHECK(wrapped == kgss::bytes{fake_native_api::wrap_marker});
        CHECK(kgss::unwrap(context, wrapped).empty());
    }

    SECTION("tampered message")
    {
        try {
            kgss::unwrap(context, message);
            FAIL("expected an exception");
        }
        catch (const kgss::exception& e) {
            CHECK(e.code() == kgss::errc::protection_failed);
            CHECK(e.native().major == GSS_S_DEFECTIVE_TOKEN);
            CHECK(std::string{e.what()}.rfind("gss_unwrap failed: ", 0) == 0);
        }
    }

    SECTION("wrap failure")
    {
        api.wrap_major = GSS_S_CONTEXT_EXPIRED;

        try {
            kgss::wrap(context, message);
            FAIL("expected an exception");
        }
        catch (const kgss::exception& e) {
            CHECK(e.code() == kgss::errc::protection_failed);
            CHECK(e.native().major == GSS_S_CONTEXT_EXPIRED);
            CHECK(std::string{e.what()}.rfind("gss_wrap failed: ", 0) == 0);
        }
    }
}
