#ifndef KGSS_UNIT_TESTS_FAKE_NATIVE_API_HPP
#define KGSS_UNIT_TESTS_FAKE_NATIVE_API_HPP

#include "kgss/native_api.hpp"
#include "kgss/scoped_environment.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <map>
#include <string>
#include <vector>

namespace kgss::test
{
    /// A native_api which records every call and hands out fake handles.
    ///
    /// Handles are addresses inside the fake itself and must never be dereferenced. Each
    /// kind of resource is counted so tests can verify that everything acquired is released.
    ///
    /// Negotiation is scripted through negotiation_script: round N returns the N-th major
    /// status and an output token reading "token-N". wrap() and unwrap() apply a reversible
    /// transform so protected messages can be checked byte for byte.
    class fake_native_api : public native_api
    {
      public:
        // Leading octet of every wrapped message.
        static constexpr std::uint8_t wrap_marker = 0xA5;
        static constexpr std::uint8_t wrap_mask = 0x5A;

        //
        // Scripted results
        //

        krb5_error_code init_context_result = 0;
        krb5_error_code cc_default_result = 0;
        krb5_error_code cc_initialize_result = 0;
        krb5_error_code cc_store_cred_result = 0;
        krb5_error_code cc_close_result = 0;
        krb5_error_code parse_name_result = 0;
        krb5_error_code kt_resolve_result = 0;
        krb5_error_code get_init_creds_result = 0;

        // When empty, get_error_message() returns nullptr.
        std::string error_message = "fake krb5 error";

        OM_uint32 import_name_major = GSS_S_COMPLETE;
        OM_uint32 import_name_minor = 0;

        std::vector<OM_uint32> negotiation_script{GSS_S_CONTINUE_NEEDED, GSS_S_COMPLETE};
        OM_uint32 negotiation_minor = 0;

        // When false, the final round produces an empty output token.
        bool final_round_has_token = true;

        OM_uint32 wrap_major = GSS_S_COMPLETE;
        OM_uint32 unwrap_major = GSS_S_COMPLETE;
        OM_uint32 protection_minor = 0;

        // When false, wrap() reports integrity protection only.
        bool grant_confidentiality = true;

        // Text fragments returned by display_status(), keyed by status code.
        std::map<OM_uint32, std::vector<std::string>> status_fragments;
        bool display_status_fails = false;

        //
        // Recorded state
        //

        std::map<std::string, int> calls;
        std::vector<std::string> call_sequence;

        int live_contexts = 0;
        int live_caches = 0;
        int live_principals = 0;
        int live_keytabs = 0;
        int live_names = 0;
        int live_security_contexts = 0;
        int live_buffers = 0;
        int live_error_messages = 0;
        int populated_credentials = 0;
        int freed_credentials = 0;

        std::string last_principal;
        std::string last_password;
        std::string last_keytab_name;
        std::string last_target;
        OM_uint32 last_request_flags = 0;
        int last_confidentiality_request = -1;
        std::vector<std::vector<std::uint8_t>> negotiation_inputs;

        // Value of KRB5_CONFIG observed when the named primitive was called.
        std::map<std::string, std::string> observed_config;

        // True if the named primitive was called while the calling thread held the
        // environment scope.
        std::map<std::string, bool> called_in_scope;

        auto call_count(const std::string& _name) const -> int
        {
            const auto iter = calls.find(_name);
            return iter == std::end(calls) ? 0 : iter->second;
        }

        // Position of the first call to _name in call_sequence, or -1.
        auto first_call_index(const std::string& _name) const -> int
        {
            for (std::size_t i = 0; i < call_sequence.size(); ++i) {
                if (call_sequence[i] == _name) {
                    return static_cast<int>(i);
                }
            }

            return -1;
        }

        auto leaked_resources() const noexcept -> int
        {
            return live_contexts + live_caches + live_principals + live_keytabs + live_names +
                   live_security_contexts + live_buffers + live_error_messages +
                   (populated_credentials - freed_credentials);
        }

        // Produces what wrap() would produce for _message. Used to build peer tokens.
        static auto protect(const std::vector<std::uint8_t>& _message) -> std::vector<std::uint8_t>
        {
            std::vector<std::uint8_t> out{wrap_marker};

            for (auto b : _message) {
                out.push_back(static_cast<std::uint8_t>(b ^ wrap_mask));
            }

            return out;
        }

        static auto unprotect(const std::vector<std::uint8_t>& _message) -> std::vector<std::uint8_t>
        {
            std::vector<std::uint8_t> out;

            for (std::size_t i = 1; i < _message.size(); ++i) {
                out.push_back(static_cast<std::uint8_t>(_message[i] ^ wrap_mask));
            }

            return out;
        }

        //
        // Kerberos
        //

        auto init_context(krb5_context* _context) -> krb5_error_code override
        {
            record("init_context");

            if (init_context_result != 0) {
                return init_context_result;
            }

            *_context = handle<krb5_context>(context_tag_);
            ++live_contexts;
            return 0;
        }

        void free_context(krb5_context _context) override
        {
            record("free_context");

            if (_context) {
                --live_contexts;
            }
        }

        auto get_error_message(krb5_context, krb5_error_code _code) -> const char* override
        {
            record("get_error_message");

            if (error_message.empty()) {
                return nullptr;
            }

            const auto text = fmt::format("{} {}", error_message, _code);
            auto* message = new char[text.size() + 1]; // NOLINT(cppcoreguidelines-owning-memory)
            std::memcpy(message, text.c_str(), text.size() + 1);
            ++live_error_messages;
            return message;
        }

        void free_error_message(krb5_context, const char* _message) override
        {
            record("free_error_message");
            delete[] _message; // NOLINT(cppcoreguidelines-owning-memory)
            --live_error_messages;
        }

        auto cc_default(krb5_context, krb5_ccache* _cache) -> krb5_error_code override
        {
            record("cc_default");

            if (cc_default_result != 0) {
                return cc_default_result;
            }

            *_cache = handle<krb5_ccache>(cache_tag_);
            ++live_caches;
            return 0;
        }

        auto cc_initialize(krb5_context, krb5_ccache, krb5_principal) -> krb5_error_code override
        {
            record("cc_initialize");
            return cc_initialize_result;
        }

        auto cc_store_cred(krb5_context, krb5_ccache, krb5_creds*) -> krb5_error_code override
        {
            record("cc_store_cred");
            return cc_store_cred_result;
        }

        auto cc_close(krb5_context, krb5_ccache _cache) -> krb5_error_code override
        {
            record("cc_close");

            if (_cache) {
                --live_caches;
            }

            return cc_close_result;
        }

        auto parse_name(krb5_context, const char* _name, krb5_principal* _principal) -> krb5_error_code override
        {
            record("parse_name");
            last_principal = _name;

            if (parse_name_result != 0) {
                return parse_name_result;
            }

            *_principal = handle<krb5_principal>(principal_tag_);
            ++live_principals;
            return 0;
        }

        void free_principal(krb5_context, krb5_principal _principal) override
        {
            record("free_principal");

            if (_principal) {
                --live_principals;
            }
        }

        auto kt_resolve(krb5_context, const char* _name, krb5_keytab* _keytab) -> krb5_error_code override
        {
            record("kt_resolve");
            last_keytab_name = _name;

            if (kt_resolve_result != 0) {
                return kt_resolve_result;
            }

            *_keytab = handle<krb5_keytab>(keytab_tag_);
            ++live_keytabs;
            return 0;
        }

        auto kt_close(krb5_context, krb5_keytab _keytab) -> krb5_error_code override
        {
            record("kt_close");

            if (_keytab) {
                --live_keytabs;
            }

            return 0;
        }

        auto get_init_creds_password(krb5_context, krb5_creds*, krb5_principal, const char* _password)
            -> krb5_error_code override
        {
            record("get_init_creds_password");
            last_password = _password;
            return acquire();
        }

        auto get_init_creds_keytab(krb5_context, krb5_creds*, krb5_principal, krb5_keytab _keytab)
            -> krb5_error_code override
        {
            record("get_init_creds_keytab");
            keytab_open_during_acquisition = (_keytab != nullptr && live_keytabs > 0);
            return acquire();
        }

        void free_cred_contents(krb5_context, krb5_creds*) override
        {
            record("free_cred_contents");
            ++freed_credentials;
        }

        bool keytab_open_during_acquisition = false;

        //
        // GSSAPI
        //

        auto import_name(OM_uint32* _minor, gss_buffer_t _name_buffer, gss_OID, gss_name_t* _name)
            -> OM_uint32 override
        {
            record("import_name");
            last_target.assign(static_cast<const char*>(_name_buffer->value), _name_buffer->length);
            *_minor = import_name_minor;

            if (import_name_major != GSS_S_COMPLETE) {
                return import_name_major;
            }

            *_name = handle<gss_name_t>(name_tag_);
            ++live_names;
            return GSS_S_COMPLETE;
        }

        auto release_name(OM_uint32* _minor, gss_name_t* _name) -> OM_uint32 override
        {
            record("release_name");
            *_minor = 0;

            if (*_name != GSS_C_NO_NAME) {
                --live_names;
                *_name = GSS_C_NO_NAME;
            }

            return GSS_S_COMPLETE;
        }

        auto init_sec_context(OM_uint32* _minor,
                              gss_ctx_id_t* _context,
                              gss_name_t,
                              gss_OID,
                              OM_uint32 _request_flags,
                              gss_buffer_t _input_token,
                              gss_buffer_t _output_token,
                              OM_uint32* _return_flags) -> OM_uint32 override
        {
            record("init_sec_context");
            last_request_flags = _request_flags;
            *_return_flags = _request_flags;
            *_minor = negotiation_minor;

            if (_input_token != GSS_C_NO_BUFFER) {
                const auto* first = static_cast<const std::uint8_t*>(_input_token->value);
                negotiation_inputs.emplace_back(first, first + _input_token->length); // NOLINT
            }

            if (*_context == GSS_C_NO_CONTEXT) {
                *_context = handle<gss_ctx_id_t>(security_context_tag_);
                ++live_security_contexts;
            }

            const auto round = negotiation_round_++;
            const auto major = round < negotiation_script.size() ? negotiation_script[round] : GSS_S_FAILURE;

            if (major == GSS_S_COMPLETE && !final_round_has_token) {
                return major;
            }

            if (major == GSS_S_COMPLETE || major == GSS_S_CONTINUE_NEEDED) {
                fill(_output_token, fmt::format("token-{}", round + 1));
            }

            return major;
        }

        auto delete_sec_context(OM_uint32* _minor, gss_ctx_id_t* _context) -> OM_uint32 override
        {
            record("delete_sec_context");
            *_minor = 0;

            if (*_context != GSS_C_NO_CONTEXT) {
                --live_security_contexts;
                *_context = GSS_C_NO_CONTEXT;
            }

            return GSS_S_COMPLETE;
        }

        auto wrap(OM_uint32* _minor,
                  gss_ctx_id_t,
                  int _confidentiality,
                  gss_buffer_t _input,
                  int* _confidentiality_state,
                  gss_buffer_t _output) -> OM_uint32 override
        {
            record("wrap");
            last_confidentiality_request = _confidentiality;
            *_minor = protection_minor;

            if (wrap_major != GSS_S_COMPLETE) {
                return wrap_major;
            }

            *_confidentiality_state = (_confidentiality != 0 && grant_confidentiality) ? 1 : 0;
            fill(_output, protect(to_vector(_input)));
            return GSS_S_COMPLETE;
        }

        auto unwrap(OM_uint32* _minor,
                    gss_ctx_id_t,
                    gss_buffer_t _input,
                    gss_buffer_t _output,
                    int* _confidentiality_state) -> OM_uint32 override
        {
            record("unwrap");
            *_minor = protection_minor;

            const auto input = to_vector(_input);

            if (unwrap_major != GSS_S_COMPLETE) {
                return unwrap_major;
            }

            if (input.empty() || input[0] != wrap_marker) {
                return GSS_S_DEFECTIVE_TOKEN;
            }

            *_confidentiality_state = 1;
            fill(_output, unprotect(input));
            return GSS_S_COMPLETE;
        }

        auto release_buffer(OM_uint32* _minor, gss_buffer_t _buffer) -> OM_uint32 override
        {
            record("release_buffer");
            *_minor = 0;

            if (_buffer->value) {
                std::free(_buffer->value); // NOLINT(cppcoreguidelines-no-malloc)
                --live_buffers;
            }

            _buffer->value = nullptr;
            _buffer->length = 0;
            return GSS_S_COMPLETE;
        }

        auto display_status(OM_uint32* _minor,
                            OM_uint32 _status,
                            int _status_type,
                            OM_uint32* _message_context,
                            gss_buffer_t _status_string) -> OM_uint32 override
        {
            record("display_status");
            *_minor = 0;

            if (display_status_fails) {
                return GSS_S_FAILURE;
            }

            std::vector<std::string> fragments;

            if (const auto iter = status_fragments.find(_status); iter != std::end(status_fragments)) {
                fragments = iter->second;
            }
            else {
                const auto* kind = (_status_type == GSS_C_GSS_CODE) ? "major" : "minor";
                fragments.push_back(fmt::format("{} status {}", kind, _status));
            }

            const auto index = *_message_context;
            fill(_status_string, fragments.at(index));
            *_message_context = (index + 1 < fragments.size()) ? index + 1 : 0;

            return GSS_S_COMPLETE;
        }

      private:
        void record(const std::string& _name)
        {
            ++calls[_name];
            call_sequence.push_back(_name);

            // NOLINTNEXTLINE(concurrency-mt-unsafe)
            const char* config = std::getenv(scoped_environment::config_variable);
            observed_config[_name] = config ? config : "";
            called_in_scope[_name] = scoped_environment::held_by_this_thread();
        }

        auto acquire() -> krb5_error_code
        {
            if (get_init_creds_result != 0) {
                return get_init_creds_result;
            }

            ++populated_credentials;
            return 0;
        }

        template <typename Handle>
        static auto handle(char& _tag) -> Handle
        {
            return reinterpret_cast<Handle>(&_tag); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
        }

        static auto to_vector(gss_buffer_t _buffer) -> std::vector<std::uint8_t>
        {
            if (_buffer == GSS_C_NO_BUFFER || _buffer->length == 0) {
                return {};
            }

            const auto* first = static_cast<const std::uint8_t*>(_buffer->value);
            return {first, first + _buffer->length}; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }

        void fill(gss_buffer_t _buffer, const std::string& _data)
        {
            fill(_buffer, std::vector<std::uint8_t>(std::begin(_data), std::end(_data)));
        }

        void fill(gss_buffer_t _buffer, const std::vector<std::uint8_t>& _data)
        {
            if (_data.empty()) {
                _buffer->value = nullptr;
                _buffer->length = 0;
                return;
            }

            _buffer->value = std::malloc(_data.size()); // NOLINT(cppcoreguidelines-no-malloc)
            std::memcpy(_buffer->value, _data.data(), _data.size());
            _buffer->length = _data.size();
            ++live_buffers;
        }

        std::size_t negotiation_round_ = 0;

        char context_tag_{};
        char cache_tag_{};
        char principal_tag_{};
        char keytab_tag_{};
        char name_tag_{};
        char security_context_tag_{};
    }; // class fake_native_api
} // namespace kgss::test

#endif // KGSS_UNIT_TESTS_FAKE_NATIVE_API_HPP
