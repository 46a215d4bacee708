#include "kgss/sasl_gssapi.hpp"

#include "kgss/kgss_exception.hpp"
#include "kgss/kgss_logger.hpp"

#include <fmt/format.h>

namespace kgss::sasl_gssapi
{
    auto parse_offer(const session& _session, const bytes& _wrapped_offer) -> security_layer_offer
    {
        const auto offer = _session.unwrap(_wrapped_offer);

        if (offer.size() < 4) {
            KGSS_THROW(errc::invalid_input,
                       fmt::format("SASL GSSAPI security layer offer is too short. [size={}]", offer.size()));
        }

        security_layer_offer result;
        result.layers = offer[0];
        result.max_message_size = (static_cast<std::uint32_t>(offer[1]) << 16) |
                                  (static_cast<std::uint32_t>(offer[2]) << 8) | static_cast<std::uint32_t>(offer[3]);

        return result;
    } // parse_offer

    auto make_response(const session& _session,
                       const security_layer_offer& _offer,
                       const std::string& _authorization_id) -> bytes
    {
        if ((_offer.layers & no_security_layer) == 0) {
            KGSS_THROW(errc::sasl_security_layer_rejected,
                       fmt::format("Server does not offer the \"no security layer\" option. [layers={:#04x}]",
                                   _offer.layers));
        }

        bytes response{no_security_layer, 0, 0, 0};
        response.insert(std::end(response), std::begin(_authorization_id), std::end(_authorization_id));

        // Without a security layer the reply only needs integrity protection.
        return _session.wrap(response, false);
    } // make_response

    authenticator::authenticator(session& _session, std::string _service, std::string _authorization_id)
        : session_{&_session}
        , service_{std::move(_service)}
        , authorization_id_{std::move(_authorization_id)}
    {
    } // authenticator

    void authenticator::run(const transport& _send)
    {
        auto result = session_->step(service_);

        while (!result.completed) {
            auto reply = _send(result.output);

            if (reply.empty()) {
                KGSS_THROW(errc::negotiation_failed,
                           "Server ended the SASL GSSAPI exchange before the security context was established.");
            }

            result = session_->step(service_, reply);
        }

        // The final token (possibly empty) still goes to the server, which answers with its
        // security layer offer.
        const auto reply = _send(result.output);

        if (reply.empty()) {
            log::negotiation::debug("Server ended the SASL GSSAPI exchange without a security layer offer.");
            return;
        }

        const auto offer = parse_offer(*session_, reply);

        log::negotiation::debug("Received SASL GSSAPI security layer offer. [layers={:#04x}, max_message_size={}]",
                                offer.layers,
                                offer.max_message_size);

        _send(make_response(*session_, offer, authorization_id_));
    } // authenticator::run
} // namespace kgss::sasl_gssapi
