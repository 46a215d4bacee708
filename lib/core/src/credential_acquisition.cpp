#include "kgss/credential_acquisition.hpp"

#include "kgss/error_translator.hpp"
#include "kgss/kgss_exception.hpp"
#include "kgss/kgss_logger.hpp"
#include "kgss/scoped_environment.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <system_error>

namespace
{
    auto contains_nul(const std::string& _s) noexcept -> bool
    {
        return _s.find('\0') != std::string::npos;
    } // contains_nul

    auto parse_principal(kgss::credential_cache& _cache, const std::string& _username) -> kgss::unique_krb5_principal
    {
        auto& api = _cache.api();

        if (contains_nul(_username)) {
            KGSS_THROW(kgss::errc::invalid_principal, "Principal name contains an embedded null character.");
        }

        krb5_principal principal = nullptr;

        if (const auto ec = api.parse_name(_cache.context(), _username.c_str(), &principal); ec != 0) {
            KGSS_THROW_NATIVE(kgss::errc::invalid_principal,
                              "krb5_parse_name failed",
                              kgss::translate_krb5_status(api, _cache.context(), ec));
        }

        return {principal, kgss::krb5_principal_deleter{&api, _cache.context()}};
    } // parse_principal

    [[noreturn]] void throw_acquisition_error(kgss::credential_cache& _cache, const char* _prefix, krb5_error_code _ec)
    {
        auto translated = kgss::translate_krb5_status(_cache.api(), _cache.context(), _ec);

        switch (_ec) {
            case KRB5_KDC_UNREACH:
                KGSS_THROW_NATIVE(kgss::errc::kdc_unreachable, "Unable to reach the KDC", translated);

            case KRB5_REALM_CANT_RESOLVE:
                KGSS_THROW_NATIVE(kgss::errc::realm_unresolvable, "Cannot resolve the realm", translated);

            default:
                KGSS_THROW_NATIVE(kgss::errc::credential_acquisition_failed, _prefix, translated);
        }
    } // throw_acquisition_error

    void store_credentials(kgss::credential_cache& _cache, krb5_principal _principal, kgss::scoped_credentials& _creds)
    {
        auto& api = _cache.api();

        if (const auto ec = api.cc_initialize(_cache.context(), _cache.cache(), _principal); ec != 0) {
            KGSS_THROW_NATIVE(kgss::errc::cache_init_failed,
                              "krb5_cc_initialize failed",
                              kgss::translate_krb5_status(api, _cache.context(), ec));
        }

        if (const auto ec = api.cc_store_cred(_cache.context(), _cache.cache(), _creds.get()); ec != 0) {
            KGSS_THROW_NATIVE(kgss::errc::cache_store_failed,
                              "krb5_cc_store_cred failed",
                              kgss::translate_krb5_status(api, _cache.context(), ec));
        }
    } // store_credentials

    void require_open(const kgss::credential_cache& _cache)
    {
        if (!_cache.is_open()) {
            KGSS_THROW(kgss::errc::invalid_input, "The session has already been closed.");
        }
    } // require_open
} // anonymous namespace

namespace kgss
{
    void authenticate_with_password(credential_cache& _cache,
                                    const std::string& _username,
                                    const std::string& _password)
    {
        require_open(_cache);

        if (contains_nul(_password)) {
            KGSS_THROW(errc::invalid_input, "Password contains an embedded null character.");
        }

        scoped_environment env{_cache.configuration_path(), _cache.cache_path()};

        auto& api = _cache.api();
        const auto principal = parse_principal(_cache, _username);

        scoped_credentials creds{api, _cache.context()};

        log::authentication::debug("Requesting initial credentials for [{}] using a password.", _username);

        if (const auto ec = api.get_init_creds_password(_cache.context(), creds.get(), principal.get(), _password.c_str());
            ec != 0)
        {
            throw_acquisition_error(_cache, "krb5_get_init_creds_password failed", ec);
        }

        creds.populated();
        store_credentials(_cache, principal.get(), creds);

        log::authentication::info("Acquired initial credentials for [{}].", _username);
    } // authenticate_with_password

    void authenticate_with_keytab(credential_cache& _cache,
                                  const std::string& _username,
                                  const std::string& _keytab_path)
    {
        require_open(_cache);

        if (std::error_code ec; _keytab_path.empty() || !std::filesystem::exists(_keytab_path, ec)) {
            KGSS_THROW(errc::keytab_not_found, fmt::format("Keytab file not found: {}", _keytab_path));
        }

        scoped_environment env{_cache.configuration_path(), _cache.cache_path()};

        auto& api = _cache.api();
        const auto principal = parse_principal(_cache, _username);

        const auto keytab_name = fmt::format("FILE:{}", _keytab_path);
        krb5_keytab keytab_handle = nullptr;

        if (const auto ec = api.kt_resolve(_cache.context(), keytab_name.c_str(), &keytab_handle); ec != 0) {
            KGSS_THROW_NATIVE(errc::credential_acquisition_failed,
                              "krb5_kt_resolve failed",
                              translate_krb5_status(api, _cache.context(), ec));
        }

        unique_krb5_keytab keytab{keytab_handle, krb5_keytab_deleter{&api, _cache.context()}};
        scoped_credentials creds{api, _cache.context()};

        log::authentication::debug("Requesting initial credentials for [{}] using keytab [{}].", _username, _keytab_path);

        const auto ec = api.get_init_creds_keytab(_cache.context(), creds.get(), principal.get(), keytab.get());

        // The keytab is not needed past this point.
        keytab.reset();

        if (ec != 0) {
            throw_acquisition_error(_cache, "krb5_get_init_creds_keytab failed", ec);
        }

        creds.populated();
        store_credentials(_cache, principal.get(), creds);

        log::authentication::info("Acquired initial credentials for [{}] from keytab [{}].", _username, _keytab_path);
    } // authenticate_with_keytab

    void authenticate(credential_cache& _cache, const std::string& _username, const std::string& _secret)
    {
        if (std::string_view{_secret}.substr(0, keytab_secret_prefix.size()) == keytab_secret_prefix) {
            authenticate_with_keytab(_cache, _username, _secret.substr(keytab_secret_prefix.size()));
            return;
        }

        authenticate_with_password(_cache, _username, _secret);
    } // authenticate
} // namespace kgss
