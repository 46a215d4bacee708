#ifndef KGSS_SECURITY_CONTEXT_HPP
#define KGSS_SECURITY_CONTEXT_HPP

/// \file

#include "kgss/native_handles.hpp"
#include "kgss/session_configuration.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace kgss
{
    enum class negotiation_state
    {
        uninitialized,
        negotiating,
        established
    }; // enum class negotiation_state

    auto to_string(negotiation_state _state) noexcept -> std::string_view;

    struct step_result
    {
        // The token to send to the peer. May be empty once negotiation is complete.
        bytes output;

        // True if the security context is established. No further rounds may be run.
        bool completed = false;
    }; // struct step_result

    /// The initiator side of a Kerberos V5 GSSAPI security context.
    ///
    /// Negotiation is driven one round at a time through step(). The caller feeds back the
    /// peer's most recent token until a round reports completion.
    ///
    /// step() reads the default credential cache, so it must run inside the environment scope
    /// of the session holding the credentials.
    class security_context
    {
      public:
        explicit security_context(native_api& _api, negotiation_options _options = {});

        security_context(const security_context&) = delete;
        auto operator=(const security_context&) -> security_context& = delete;

        // The source is left uninitialized. It no longer owns a native context.
        security_context(security_context&& _other) noexcept;
        auto operator=(security_context&& _other) noexcept -> security_context&;

        ~security_context() = default;

        /// Runs one negotiation round against \p _target_service (e.g. "HTTP@host.example.com").
        ///
        /// \param[in] _target_service A host-based service name.
        /// \param[in] _input_token    The peer's last token. Absent on the first round.
        ///
        /// \throws kgss::exception errc::context_already_established
        /// \throws kgss::exception errc::name_import_failed
        /// \throws kgss::exception errc::negotiation_failed The context should be abandoned.
        auto step(const std::string& _target_service, const std::optional<bytes>& _input_token = std::nullopt)
            -> step_result;

        auto state() const noexcept -> negotiation_state { return state_; }

        auto established() const noexcept -> bool { return state_ == negotiation_state::established; }

        auto handle() const noexcept -> gss_ctx_id_t { return context_.get(); }

        auto api() const noexcept -> native_api& { return *api_; }

        /// Deletes the native context (if any) and returns to the uninitialized state.
        void reset() noexcept;

      private:
        native_api* api_;
        negotiation_options options_;
        negotiation_state state_;
        unique_gss_context context_;
    }; // class security_context
} // namespace kgss

#endif // KGSS_SECURITY_CONTEXT_HPP
