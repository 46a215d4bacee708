#ifndef KGSS_SASL_GSSAPI_HPP
#define KGSS_SASL_GSSAPI_HPP

/// \file
///
/// The client side of the SASL GSSAPI mechanism (RFC 4752) built on top of kgss::session.

#include "kgss/session.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace kgss::sasl_gssapi
{
    // Security layer bits of the first octet of the server's offer.
    inline constexpr std::uint8_t no_security_layer = 0x01;
    inline constexpr std::uint8_t integrity_layer = 0x02;
    inline constexpr std::uint8_t confidentiality_layer = 0x04;

    struct security_layer_offer
    {
        std::uint8_t layers = 0;
        std::uint32_t max_message_size = 0;
    }; // struct security_layer_offer

    /// Unwraps and decodes the 4-octet offer sent by the server once the security context
    /// is established.
    ///
    /// \throws kgss::exception errc::invalid_input if the unwrapped token is shorter than 4 octets.
    /// \throws kgss::exception Any error raised by session::unwrap.
    auto parse_offer(const session& _session, const bytes& _wrapped_offer) -> security_layer_offer;

    /// Builds the wrapped reply selecting "no security layer" with a maximum message size of
    /// zero, followed by \p _authorization_id.
    ///
    /// \throws kgss::exception errc::sasl_security_layer_rejected if the server does not offer
    ///                         "no security layer".
    auto make_response(const session& _session,
                       const security_layer_offer& _offer,
                       const std::string& _authorization_id = {}) -> bytes;

    /// Sends a token to the server and returns the server's reply.
    using transport = std::function<bytes(const bytes&)>;

    /// Runs a complete client exchange: negotiation rounds until the context is established,
    /// then the security layer exchange.
    ///
    /// The session must already hold credentials.
    class authenticator
    {
      public:
        authenticator(session& _session, std::string _service, std::string _authorization_id = {});

        void run(const transport& _send);

      private:
        session* session_;
        std::string service_;
        std::string authorization_id_;
    }; // class authenticator
} // namespace kgss::sasl_gssapi

#endif // KGSS_SASL_GSSAPI_HPP
