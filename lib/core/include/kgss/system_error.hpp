#ifndef KGSS_SYSTEM_ERROR_HPP
#define KGSS_SYSTEM_ERROR_HPP

/// \file

#include <string>
#include <string_view>
#include <system_error>

namespace kgss
{
    /// The error table shared by every kgss component.
    ///
    /// Values are negative multiples of 1000 so they never collide with errno values or
    /// native Kerberos/GSSAPI status codes, which are carried separately.
    // clang-format off
    enum class errc : int
    {
        success                      = 0,

        // Session construction
        config_write_failed          = -1000,
        context_init_failed          = -2000,
        cache_open_failed            = -3000,

        // Credential acquisition
        invalid_principal            = -10000,
        keytab_not_found             = -11000,
        kdc_unreachable              = -12000,
        realm_unresolvable           = -13000,
        credential_acquisition_failed = -14000,
        cache_init_failed            = -15000,
        cache_store_failed           = -16000,

        // Negotiation
        name_import_failed           = -20000,
        negotiation_failed           = -21000,
        context_already_established  = -22000,

        // Message protection
        context_not_established      = -30000,
        protection_failed            = -31000,

        // SASL security layer
        sasl_security_layer_rejected = -40000,

        // Ambient
        environment_scope_reentered  = -50000,
        invalid_configuration        = -51000,
        invalid_input                = -52000,
        environment_update_failed    = -53000
    }; // enum class errc
    // clang-format on

    class error_category : public std::error_category
    {
      public:
        auto name() const noexcept -> const char* override
        {
            return "kgss";
        }

        auto message(int _condition) const -> std::string override;
    }; // class error_category

    auto kgss_category() noexcept -> const error_category&;

    auto make_error_code(errc _ec) noexcept -> std::error_code;

    /// Returns the symbolic name of \p _ec (e.g. "KDC_UNREACHABLE").
    ///
    /// Unknown values produce "UNKNOWN_ERROR".
    auto to_string(errc _ec) noexcept -> std::string_view;
} // namespace kgss

namespace std
{
    template <>
    struct is_error_code_enum<kgss::errc> : true_type
    {
    };
} // namespace std

#endif // KGSS_SYSTEM_ERROR_HPP
