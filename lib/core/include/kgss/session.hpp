#ifndef KGSS_SESSION_HPP
#define KGSS_SESSION_HPP

/// \file

#include "kgss/credential_cache.hpp"
#include "kgss/native_api.hpp"
#include "kgss/security_context.hpp"
#include "kgss/session_configuration.hpp"

#include <memory>
#include <optional>
#include <string>

namespace kgss
{
    /// An isolated Kerberos client identity and the security context negotiated with it.
    ///
    /// Each session provisions its own Kerberos configuration file and credential cache, so
    /// sessions for different principals, realms or KDCs can coexist in one process. Every
    /// operation reading the process-wide Kerberos environment (construction, authentication,
    /// negotiation) runs inside a kgss::scoped_environment and is therefore serialized
    /// against the same operations of every other session.
    ///
    /// A session is not meant to be used from multiple threads at the same time.
    ///
    /// \code{.cpp}
    /// kgss::session session{"kdc.example.com", "EXAMPLE.COM"};
    /// session.authenticate_with_password("alice@EXAMPLE.COM", password);
    ///
    /// auto result = session.step("HTTP@service.example.com");
    /// while (!result.completed) {
    ///     result = session.step("HTTP@service.example.com", send_to_peer(result.output));
    /// }
    ///
    /// auto protected_message = session.wrap(message);
    /// \endcode
    class session
    {
      public:
        /// \throws kgss::exception errc::config_write_failed
        /// \throws kgss::exception errc::context_init_failed
        /// \throws kgss::exception errc::cache_open_failed
        session(const std::string& _kdc_host, const std::string& _realm, native_api& _api = mit_native_api());

        explicit session(const session_configuration& _config, native_api& _api = mit_native_api());

        session(const session&) = delete;
        auto operator=(const session&) -> session& = delete;

        session(session&&) noexcept = default;
        auto operator=(session&&) noexcept -> session& = default;

        ~session();

        void authenticate_with_password(const std::string& _username, const std::string& _password);

        void authenticate_with_keytab(const std::string& _username, const std::string& _keytab_path);

        /// Dispatches on the "keytab:" prefix. See kgss::authenticate.
        void authenticate(const std::string& _username, const std::string& _secret);

        /// Runs one negotiation round. See security_context::step.
        auto step(const std::string& _target_service, const std::optional<bytes>& _input_token = std::nullopt)
            -> step_result;

        /// Protects \p _message as configured by protection_options::confidentiality.
        auto wrap(const bytes& _message) const -> bytes;

        auto wrap(const bytes& _message, bool _confidentiality) const -> bytes;

        auto unwrap(const bytes& _message) const -> bytes;

        /// Deletes the security context, closes the credential cache, frees the library
        /// context and removes both private files.
        ///
        /// Every step runs whether or not the previous ones did anything. Calling this
        /// function more than once has no effect. Called by the destructor.
        void close() noexcept;

        auto is_open() const noexcept -> bool { return cache_ && cache_->is_open(); }

        auto state() const noexcept -> negotiation_state { return context_.state(); }

        auto established() const noexcept -> bool { return context_.established(); }

        auto configuration() const noexcept -> const session_configuration& { return config_; }

        auto configuration_path() const -> std::string;

        auto cache_path() const -> std::string;

      private:
        auto open_cache() const -> credential_cache&;

        session_configuration config_;
        std::unique_ptr<credential_cache> cache_;
        security_context context_;
    }; // class session
} // namespace kgss

#endif // KGSS_SESSION_HPP
