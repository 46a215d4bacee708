#include "kgss/native_api.hpp"

namespace
{
    class mit_api final : public kgss::native_api
    {
      public:
        auto init_context(krb5_context* _context) -> krb5_error_code override
        {
            return krb5_init_context(_context);
        }

        void free_context(krb5_context _context) override
        {
            krb5_free_context(_context);
        }

        auto get_error_message(krb5_context _context, krb5_error_code _code) -> const char* override
        {
            return krb5_get_error_message(_context, _code);
        }

        void free_error_message(krb5_context _context, const char* _message) override
        {
            krb5_free_error_message(_context, _message);
        }

        auto cc_default(krb5_context _context, krb5_ccache* _cache) -> krb5_error_code override
        {
            return krb5_cc_default(_context, _cache);
        }

        auto cc_initialize(krb5_context _context, krb5_ccache _cache, krb5_principal _principal)
            -> krb5_error_code override
        {
            return krb5_cc_initialize(_context, _cache, _principal);
        }

        auto cc_store_cred(krb5_context _context, krb5_ccache _cache, krb5_creds* _creds) -> krb5_error_code override
        {
            return krb5_cc_store_cred(_context, _cache, _creds);
        }

        auto cc_close(krb5_context _context, krb5_ccache _cache) -> krb5_error_code override
        {
            return krb5_cc_close(_context, _cache);
        }

        auto parse_name(krb5_context _context, const char* _name, krb5_principal* _principal)
            -> krb5_error_code override
        {
            return krb5_parse_name(_context, _name, _principal);
        }

        void free_principal(krb5_context _context, krb5_principal _principal) override
        {
            krb5_free_principal(_context, _principal);
        }

        auto kt_resolve(krb5_context _context, const char* _name, krb5_keytab* _keytab) -> krb5_error_code override
        {
            return krb5_kt_resolve(_context, _name, _keytab);
        }

        auto kt_close(krb5_context _context, krb5_keytab _keytab) -> krb5_error_code override
        {
            return krb5_kt_close(_context, _keytab);
        }

        auto get_init_creds_password(krb5_context _context,
                                     krb5_creds* _creds,
                                     krb5_principal _client,
                                     const char* _password) -> krb5_error_code override
        {
            return krb5_get_init_creds_password(
                _context, _creds, _client, _password, nullptr, nullptr, 0, nullptr, nullptr);
        }

        auto get_init_creds_keytab(krb5_context _context,
                                   krb5_creds* _creds,
                                   krb5_principal _client,
                                   krb5_keytab _keytab) -> krb5_error_code override
        {
            return krb5_get_init_creds_keytab(_context, _creds, _client, _keytab, 0, nullptr, nullptr);
        }

        void free_cred_contents(krb5_context _context, krb5_creds* _creds) override
        {
            krb5_free_cred_contents(_context, _creds);
        }

        auto import_name(OM_uint32* _minor, gss_buffer_t _name_buffer, gss_OID _name_type, gss_name_t* _name)
            -> OM_uint32 override
        {
            return gss_import_name(_minor, _name_buffer, _name_type, _name);
        }

        auto release_name(OM_uint32* _minor, gss_name_t* _name) -> OM_uint32 override
        {
            return gss_release_name(_minor, _name);
        }

        auto init_sec_context(OM_uint32* _minor,
                              gss_ctx_id_t* _context,
                              gss_name_t _target,
                              gss_OID _mechanism,
                              OM_uint32 _request_flags,
                              gss_buffer_t _input_token,
                              gss_buffer_t _output_token,
                              OM_uint32* _return_flags) -> OM_uint32 override
        {
            return gss_init_sec_context(_minor,
                                        GSS_C_NO_CREDENTIAL,
                                        _context,
                                        _target,
                                        _mechanism,
                                        _request_flags,
                                        0,
                                        GSS_C_NO_CHANNEL_BINDINGS,
                                        _input_token,
                                        nullptr,
                                        _output_token,
                                        _return_flags,
                                        nullptr);
        }

        auto delete_sec_context(OM_uint32* _minor, gss_ctx_id_t* _context) -> OM_uint32 override
        {
            return gss_delete_sec_context(_minor, _context, GSS_C_NO_BUFFER);
        }

        auto wrap(OM_uint32* _minor,
                  gss_ctx_id_t _context,
                  int _confidentiality,
                  gss_buffer_t _input,
                  int* _confidentiality_state,
                  gss_buffer_t _output) -> OM_uint32 override
        {
            return gss_wrap(
                _minor, _context, _confidentiality, GSS_C_QOP_DEFAULT, _input, _confidentiality_state, _output);
        }

        auto unwrap(OM_uint32* _minor,
                    gss_ctx_id_t _context,
                    gss_buffer_t _input,
                    gss_buffer_t _output,
                    int* _confidentiality_state) -> OM_uint32 override
        {
            return gss_unwrap(_minor, _context, _input, _output, _confidentiality_state, nullptr);
        }

        auto release_buffer(OM_uint32* _minor, gss_buffer_t _buffer) -> OM_uint32 override
        {
            return gss_release_buffer(_minor, _buffer);
        }

        auto display_status(OM_uint32* _minor,
                            OM_uint32 _status,
                            int _status_type,
                            OM_uint32* _message_context,
                            gss_buffer_t _status_string) -> OM_uint32 override
        {
            return gss_display_status(_minor, _status, _status_type, GSS_C_NO_OID, _message_context, _status_string);
        }
    }; // class mit_api
} // anonymous namespace

namespace kgss
{
    auto mit_native_api() -> native_api&
    {
        static mit_api api;
        return api;
    } // mit_native_api
} // namespace kgss
