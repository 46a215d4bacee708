#include <catch2/catch.hpp>

#include "kgss/kgss_exception.hpp"
#include "kgss/session.hpp"

#include "kgss_error_matcher.hpp"
#include "test_utilities.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

// These tests use the installed MIT Kerberos libraries. No KDC is required: the KDC address
// points at a port nothing listens on.

namespace fs = std::filesystem;

namespace
{
    auto make_unreachable_configuration(const std::string& _file_prefix) -> kgss::session_configuration
    {
        auto config = kgss::test::make_configuration(_file_prefix);
        config.kdc_host = "127.0.0.1:1";
        config.realm = "KGSS.TEST";
        return config;
    }
} // anonymous namespace

TEST_CASE("mit session provisions and removes its private files", "[mit]")
{
    std::string config_path;

    {
        kgss::session session{make_unreachable_configuration("test-mit-files-")};
        config_path = session.configuration_path();

        REQUIRE(fs::exists(config_path));

        std::ifstream in{config_path};
        const std::string contents{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
        CHECK(contents.find("default_realm = KGSS.TEST") != std::string::npos);
        CHECK(contents.find("kdc = 127.0.0.1:1") != std::string::npos);
    }

    CHECK_FALSE(fs::exists(config_path));
}

TEST_CASE("mit session reports an unreachable KDC", "[mit]")
{
    kgss::session session{make_unreachable_configuration("test-mit-kdc-")};

    try {
        session.authenticate_with_password("alice@KGSS.TEST", "s3cret");
        FAIL("expected an exception");
    }
    catch (const kgss::exception& e) {
        CHECK(e.code() == kgss::errc::kdc_unreachable);
        CHECK(e.native().source == kgss::native_status::family::krb5);
        CHECK(std::string{e.what()}.rfind("Unable to reach the KDC: ", 0) == 0);
    }
}

TEST_CASE("mit session reports a missing keytab", "[mit]")
{
    kgss::session session{make_unreachable_configuration("test-mit-keytab-")};

    CHECK_THROWS_MATCHES(session.authenticate_with_keytab("svc/host@KGSS.TEST", "/no/such/file.keytab"),
                         kgss::exception,
                         has_error_code(kgss::errc::keytab_not_found));
}

TEST_CASE("mit session refuses message protection before negotiation", "[mit]")
{
    kgss::session session{make_unreachable_configuration("test-mit-protection-")};

    CHECK_THROWS_MATCHES(session.wrap(kgss::bytes{1, 2, 3}),
                         kgss::exception,
                         has_error_code(kgss::errc::context_not_established));
}

TEST_CASE("mit session negotiation without credentials fails", "[mit]")
{
    kgss::session session{make_unreachable_configuration("test-mit-negotiation-")};

    CHECK_THROWS_MATCHES(session.step("HTTP@service.kgss.test"),
                         kgss::exception,
                         has_error_code(kgss::errc::negotiation_failed));
}
