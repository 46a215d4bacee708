#ifndef KGSS_CREDENTIAL_ACQUISITION_HPP
#define KGSS_CREDENTIAL_ACQUISITION_HPP

/// \file

#include "kgss/credential_cache.hpp"

#include <string>
#include <string_view>

namespace kgss
{
    /// Secrets starting with this prefix name a keytab file rather than a password.
    inline constexpr std::string_view keytab_secret_prefix = "keytab:";

    /// Obtains initial ticket-granting credentials for \p _username using a password and
    /// stores them in the private credential cache.
    ///
    /// Runs inside the environment scope of \p _cache.
    ///
    /// \throws kgss::exception errc::invalid_principal
    /// \throws kgss::exception errc::kdc_unreachable
    /// \throws kgss::exception errc::realm_unresolvable
    /// \throws kgss::exception errc::credential_acquisition_failed
    /// \throws kgss::exception errc::cache_init_failed
    /// \throws kgss::exception errc::cache_store_failed
    void authenticate_with_password(credential_cache& _cache,
                                    const std::string& _username,
                                    const std::string& _password);

    /// Obtains initial ticket-granting credentials for \p _username using the keys held in
    /// the keytab file at \p _keytab_path.
    ///
    /// The keytab path is checked before anything else happens.
    ///
    /// \throws kgss::exception errc::keytab_not_found
    /// \throws kgss::exception Any of the errors listed for authenticate_with_password.
    void authenticate_with_keytab(credential_cache& _cache,
                                  const std::string& _username,
                                  const std::string& _keytab_path);

    /// Calls authenticate_with_keytab when \p _secret starts with "keytab:" (the remainder
    /// being the path) and authenticate_with_password otherwise.
    void authenticate(credential_cache& _cache, const std::string& _username, const std::string& _secret);
} // namespace kgss

#endif // KGSS_CREDENTIAL_ACQUISITION_HPP
