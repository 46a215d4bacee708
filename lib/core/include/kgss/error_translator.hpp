#ifndef KGSS_ERROR_TRANSLATOR_HPP
#define KGSS_ERROR_TRANSLATOR_HPP

#include "kgss/kgss_exception.hpp"
#include "kgss/native_api.hpp"

namespace kgss
{
    /// Looks up the text of a Kerberos error code through the library context.
    ///
    /// The native message is copied and freed before returning.
    auto translate_krb5_status(native_api& _api, krb5_context _context, krb5_error_code _code)
        -> translated_status;

    /// Looks up the text of a GSSAPI major status and, when non-zero, of the minor status.
    ///
    /// Both lookups iterate until the library reports no further message fragments. The
    /// fragments of the minor status are appended to those of the major status.
    auto translate_gss_status(native_api& _api, OM_uint32 _major, OM_uint32 _minor) -> translated_status;
} // namespace kgss

#endif // KGSS_ERROR_TRANSLATOR_HPP
