#include "kgss/system_error.hpp"

#include <fmt/format.h>

#include <unordered_map>

namespace
{
    // clang-format off
    const std::unordered_map<int, std::string_view> g_error_names{
        {static_cast<int>(kgss::errc::success),                       "SUCCESS"},
        {static_cast<int>(kgss::errc::config_write_failed),           "CONFIG_WRITE_FAILED"},
        {static_cast<int>(kgss::errc::context_init_failed),           "CONTEXT_INIT_FAILED"},
        {static_cast<int>(kgss::errc::cache_open_failed),             "CACHE_OPEN_FAILED"},
        {static_cast<int>(kgss::errc::invalid_principal),             "INVALID_PRINCIPAL"},
        {static_cast<int>(kgss::errc::keytab_not_found),              "KEYTAB_NOT_FOUND"},
        {static_cast<int>(kgss::errc::kdc_unreachable),               "KDC_UNREACHABLE"},
        {static_cast<int>(kgss::errc::realm_unresolvable),            "REALM_UNRESOLVABLE"},
        {static_cast<int>(kgss::errc::credential_acquisition_failed), "CREDENTIAL_ACQUISITION_FAILED"},
        {static_cast<int>(kgss::errc::cache_init_failed),             "CACHE_INIT_FAILED"},
        {static_cast<int>(kgss::errc::cache_store_failed),            "CACHE_STORE_FAILED"},
        {static_cast<int>(kgss::errc::name_import_failed),            "NAME_IMPORT_FAILED"},
        {static_cast<int>(kgss::errc::negotiation_failed),            "NEGOTIATION_FAILED"},
        {static_cast<int>(kgss::errc::context_already_established),   "CONTEXT_ALREADY_ESTABLISHED"},
        {static_cast<int>(kgss::errc::context_not_established),       "CONTEXT_NOT_ESTABLISHED"},
        {static_cast<int>(kgss::errc::protection_failed),             "PROTECTION_FAILED"},
        {static_cast<int>(kgss::errc::sasl_security_layer_rejected),  "SASL_SECURITY_LAYER_REJECTED"},
        {static_cast<int>(kgss::errc::environment_scope_reentered),   "ENVIRONMENT_SCOPE_REENTERED"},
        {static_cast<int>(kgss::errc::invalid_configuration),         "INVALID_CONFIGURATION"},
        {static_cast<int>(kgss::errc::invalid_input),                 "INVALID_INPUT"},
        {static_cast<int>(kgss::errc::environment_update_failed),     "ENVIRONMENT_UPDATE_FAILED"}
    }; // g_error_names
    // clang-format on
} // anonymous namespace

namespace kgss
{
    auto error_category::message(int _condition) const -> std::string
    {
        if (const auto iter = g_error_names.find(_condition); iter != std::end(g_error_names)) {
            return std::string{iter->second};
        }

        return fmt::format("Unknown error {}", _condition);
    } // error_category::message

    auto kgss_category() noexcept -> const error_category&
    {
        static const error_category category;
        return category;
    } // kgss_category

    auto make_error_code(errc _ec) noexcept -> std::error_code
    {
        return {static_cast<int>(_ec), kgss_category()};
    } // make_error_code

    auto to_string(errc _ec) noexcept -> std::string_view
    {
        if (const auto iter = g_error_names.find(static_cast<int>(_ec)); iter != std::end(g_error_names)) {
            return iter->second;
        }

        return "UNKNOWN_ERROR";
    } // to_string
} // namespace kgss
