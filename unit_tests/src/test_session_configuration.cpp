#include <catch2/catch.hpp>

#include "kgss/kgss_exception.hpp"
#include "kgss/kgss_logger.hpp"
#include "kgss/session_configuration.hpp"

#include "kgss_error_matcher.hpp"
#include "test_utilities.hpp"

#include <gssapi/gssapi.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using json = nlohmann::json;

TEST_CASE("session_configuration defaults")
{
    const auto config = kgss::session_configuration::make("kdc.example.com", "EXAMPLE.COM");

    CHECK(config.kdc_host == "kdc.example.com");
    CHECK(config.realm == "EXAMPLE.COM");
    CHECK(config.file_prefix == "kgss-krb5-");
    CHECK_FALSE(config.temporary_directory.empty());
    CHECK(config.negotiation.request_flags() == 0);
    CHECK(config.protection.confidentiality);
    CHECK(config.log_level.empty());
}

TEST_CASE("negotiation_options maps to request flags")
{
    kgss::negotiation_options options;

    options.mutual_authentication = true;
    CHECK(options.request_flags() == GSS_C_MUTUAL_FLAG);

    options.confidentiality = true;
    options.integrity = true;
    options.delegate_credentials = true;
    CHECK(options.request_flags() == (GSS_C_MUTUAL_FLAG | GSS_C_CONF_FLAG | GSS_C_INTEG_FLAG | GSS_C_DELEG_FLAG));
}

TEST_CASE("render_krb5_config")
{
    const auto config = kgss::session_configuration::make("kdc.example.com:88", "EXAMPLE.COM");

    const std::string expected = "[libdefaults]\n"
                                 "  default_realm = EXAMPLE.COM\n"
                                 "  default_ccache_name = FILE:/tmp/kgss-krb5-1234.cache\n"
                                 "\n"
                                 "[realms]\n"
                                 "  EXAMPLE.COM = {\n"
                                 "    kdc = kdc.example.com:88\n"
                                 "  }\n";

    CHECK(config.render_krb5_config("/tmp/kgss-krb5-1234.cache") == expected);
}

TEST_CASE("session_configuration::from_json")
{
    SECTION("every property")
    {
        const auto doc = json::parse(R"_({
            "kdc_host": "kdc.example.com",
            "realm": "EXAMPLE.COM",
            "temporary_directory": "/var/tmp",
            "file_prefix": "app-",
            "negotiation": {"mutual_authentication": true, "delegate_credentials": true},
            "protection": {"confidentiality": false},
            "log_level": {"negotiation": "debug"}
        })_");

        const auto config = kgss::session_configuration::from_json(doc);

        CHECK(config.kdc_host == "kdc.example.com");
        CHECK(config.realm == "EXAMPLE.COM");
        CHECK(config.temporary_directory.string() == "/var/tmp");
        CHECK(config.file_prefix == "app-");
        CHECK(config.negotiation.mutual_authentication);
        CHECK_FALSE(config.negotiation.confidentiality);
        CHECK(config.negotiation.delegate_credentials);
        CHECK_FALSE(config.protection.confidentiality);
        CHECK(config.log_level.at("negotiation") == "debug");
    }

    SECTION("only the required properties")
    {
        const auto config = kgss::session_configuration::from_json({{"kdc_host", "kdc"}, {"realm", "R"}});

        CHECK(config.file_prefix == "kgss-krb5-");
        CHECK(config.negotiation.request_flags() == 0);
        CHECK(config.protection.confidentiality);
    }

    SECTION("missing realm")
    {
        CHECK_THROWS_MATCHES(kgss::session_configuration::from_json({{"kdc_host", "kdc"}}),
                             kgss::exception,
                             has_error_code(kgss::errc::invalid_configuration));
    }

    SECTION("empty kdc_host")
    {
        CHECK_THROWS_MATCHES(kgss::session_configuration::from_json({{"kdc_host", ""}, {"realm", "R"}}),
                             kgss::exception,
                             has_error_code(kgss::errc::invalid_configuration));
    }

    SECTION("property with the wrong type")
    {
        CHECK_THROWS_MATCHES(kgss::session_configuration::from_json({{"kdc_host", "kdc"}, {"realm", 5}}),
                             kgss::exception,
                             has_error_code(kgss::errc::invalid_configuration));

        const auto doc = json::parse(R"_({"kdc_host": "kdc", "realm": "R", "negotiation": {"integrity": "yes"}})_");
        CHECK_THROWS_MATCHES(kgss::session_configuration::from_json(doc),
                             kgss::exception,
                             has_error_code(kgss::errc::invalid_configuration));
    }

    SECTION("sections which are not objects")
    {
        const auto negotiation = json::parse(R"_({"kdc_host": "kdc", "realm": "R", "negotiation": "mutual"})_");
        CHECK_THROWS_MATCHES(kgss::session_configuration::from_json(negotiation),
                             kgss::exception,
                             has_error_code(kgss::errc::invalid_configuration));

        const auto protection = json::parse(R"_({"kdc_host": "kdc", "realm": "R", "protection": [1, 2]})_");
        CHECK_THROWS_MATCHES(kgss::session_configuration::from_json(protection),
                             kgss::exception,
                             has_error_code(kgss::errc::invalid_configuration));

        const auto log_level = json::parse(R"_({"kdc_host": "kdc", "realm": "R", "log_level": [["session", "debug"]]})_");
        CHECK_THROWS_MATCHES(kgss::session_configuration::from_json(log_level),
                             kgss::exception,
                             has_error_code(kgss::errc::invalid_configuration));
    }

    SECTION("document is not an object")
    {
        CHECK_THROWS_MATCHES(kgss::session_configuration::from_json(json::array()),
                             kgss::exception,
                             has_error_code(kgss::errc::invalid_configuration));
    }
}

TEST_CASE("session_configuration::load")
{
    const auto path = kgss::test::scratch_directory() / "test_session_configuration_load.json";

    SECTION("valid file")
    {
        std::ofstream{path} << R"_({"kdc_host": "kdc.example.com", "realm": "EXAMPLE.COM"})_";

        const auto config = kgss::session_configuration::load(path);
        CHECK(config.kdc_host == "kdc.example.com");
        CHECK(config.realm == "EXAMPLE.COM");
    }

    SECTION("malformed file")
    {
        std::ofstream{path} << R"_({"kdc_host": )_";

        CHECK_THROWS_MATCHES(kgss::session_configuration::load(path),
                             kgss::exception,
                             has_error_code(kgss::errc::invalid_configuration));
    }

    SECTION("missing file")
    {
        CHECK_THROWS_MATCHES(kgss::session_configuration::load(path.string() + ".missing"),
                             kgss::exception,
                             has_error_code(kgss::errc::invalid_configuration));
    }

    std::filesystem::remove(path);
}

TEST_CASE("apply_log_levels")
{
    namespace log = kgss::log;

    const auto previous_level = log::negotiation::get_level();

    auto config = kgss::session_configuration::make("kdc", "R");
    config.log_level = {{"negotiation", "trace"}, {"no_such_category", "debug"}};
    config.apply_log_levels();

    CHECK(log::negotiation::get_level() == log::level::trace);

    log::negotiation::set_level(previous_level);
}
