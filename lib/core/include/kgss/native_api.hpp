#ifndef KGSS_NATIVE_API_HPP
#define KGSS_NATIVE_API_HPP

/// \file

#include <gssapi/gssapi.h>
#include <gssapi/gssapi_krb5.h>
#include <krb5.h>

namespace kgss
{
    /// The set of Kerberos and GSSAPI primitives used by kgss.
    ///
    /// Each member function forwards to the native primitive of the same name and has the
    /// same ownership contract: anything it allocates must be given back through the matching
    /// release function. Sessions never call the native libraries directly, which allows a
    /// different implementation to be substituted (e.g. for testing).
    ///
    /// Implementations must be usable from multiple threads.
    class native_api
    {
      public:
        native_api() = default;

        native_api(const native_api&) = delete;
        auto operator=(const native_api&) -> native_api& = delete;

        virtual ~native_api() = default;

        //
        // Kerberos
        //

        virtual auto init_context(krb5_context* _context) -> krb5_error_code = 0;
        virtual void free_context(krb5_context _context) = 0;

        virtual auto get_error_message(krb5_context _context, krb5_error_code _code) -> const char* = 0;
        virtual void free_error_message(krb5_context _context, const char* _message) = 0;

        virtual auto cc_default(krb5_context _context, krb5_ccache* _cache) -> krb5_error_code = 0;
        virtual auto cc_initialize(krb5_context _context, krb5_ccache _cache, krb5_principal _principal)
            -> krb5_error_code = 0;
        virtual auto cc_store_cred(krb5_context _context, krb5_ccache _cache, krb5_creds* _creds)
            -> krb5_error_code = 0;
        virtual auto cc_close(krb5_context _context, krb5_ccache _cache) -> krb5_error_code = 0;

        virtual auto parse_name(krb5_context _context, const char* _name, krb5_principal* _principal)
            -> krb5_error_code = 0;
        virtual void free_principal(krb5_context _context, krb5_principal _principal) = 0;

        virtual auto kt_resolve(krb5_context _context, const char* _name, krb5_keytab* _keytab)
            -> krb5_error_code = 0;
        virtual auto kt_close(krb5_context _context, krb5_keytab _keytab) -> krb5_error_code = 0;

        virtual auto get_init_creds_password(krb5_context _context,
                                             krb5_creds* _creds,
                                             krb5_principal _client,
                                             const char* _password) -> krb5_error_code = 0;

        virtual auto get_init_creds_keytab(krb5_context _context,
                                           krb5_creds* _creds,
                                           krb5_principal _client,
                                           krb5_keytab _keytab) -> krb5_error_code = 0;

        virtual void free_cred_contents(krb5_context _context, krb5_creds* _creds) = 0;

        //
        // GSSAPI
        //

        virtual auto import_name(OM_uint32* _minor,
                                 gss_buffer_t _name_buffer,
                                 gss_OID _name_type,
                                 gss_name_t* _name) -> OM_uint32 = 0;

        virtual auto release_name(OM_uint32* _minor, gss_name_t* _name) -> OM_uint32 = 0;

        virtual auto init_sec_context(OM_uint32* _minor,
                                      gss_ctx_id_t* _context,
                                      gss_name_t _target,
                                      gss_OID _mechanism,
                                      OM_uint32 _request_flags,
                                      gss_buffer_t _input_token,
                                      gss_buffer_t _output_token,
                                      OM_uint32* _return_flags) -> OM_uint32 = 0;

        virtual auto delete_sec_context(OM_uint32* _minor, gss_ctx_id_t* _context) -> OM_uint32 = 0;

        virtual auto wrap(OM_uint32* _minor,
                          gss_ctx_id_t _context,
                          int _confidentiality,
                          gss_buffer_t _input,
                          int* _confidentiality_state,
                          gss_buffer_t _output) -> OM_uint32 = 0;

        virtual auto unwrap(OM_uint32* _minor,
                            gss_ctx_id_t _context,
                            gss_buffer_t _input,
                            gss_buffer_t _output,
                            int* _confidentiality_state) -> OM_uint32 = 0;

        virtual auto release_buffer(OM_uint32* _minor, gss_buffer_t _buffer) -> OM_uint32 = 0;

        virtual auto display_status(OM_uint32* _minor,
                                    OM_uint32 _status,
                                    int _status_type,
                                    OM_uint32* _message_context,
                                    gss_buffer_t _status_string) -> OM_uint32 = 0;
    }; // class native_api

    /// Returns the implementation backed by the installed MIT Kerberos libraries.
    auto mit_native_api() -> native_api&;
} // namespace kgss

#endif // KGSS_NATIVE_API_HPP
