#include "kgss/message_protection.hpp"

#include "kgss/error_translator.hpp"
#include "kgss/kgss_exception.hpp"
#include "kgss/kgss_logger.hpp"

#include <fmt/format.h>

namespace
{
    void require_established(const kgss::security_context& _context, const char* _operation)
    {
        if (!_context.established()) {
            KGSS_THROW(kgss::errc::context_not_established,
                       fmt::format("Cannot {} a message before the security context is established. [state={}]",
                                   _operation,
                                   kgss::to_string(_context.state())));
        }
    } // require_established
} // anonymous namespace

namespace kgss
{
    auto wrap(const security_context& _context, const bytes& _message, bool _confidentiality) -> bytes
    {
        require_established(_context, "wrap");

        auto& api = _context.api();
        auto input = make_input_buffer(_message);
        gss_output_buffer output{api};
        OM_uint32 minor{};
        int confidentiality_state{};

        if (const auto major = api.wrap(
                &minor, _context.handle(), _confidentiality ? 1 : 0, &input, &confidentiality_state, output.get());
            major != GSS_S_COMPLETE)
        {
            KGSS_THROW_NATIVE(errc::protection_failed, "gss_wrap failed", translate_gss_status(api, major, minor));
        }

        if (_confidentiality && confidentiality_state == 0) {
            log::protection::warn("Confidentiality was requested but the message is only integrity protected.");
        }

        log::protection::trace("Wrapped {} bytes into {} bytes.", _message.size(), output.get()->length);

        return output.to_bytes();
    } // wrap

    auto unwrap(const security_context& _context, const bytes& _message) -> bytes
    {
        require_established(_context, "unwrap");

        auto& api = _context.api();
        auto input = make_input_buffer(_message);
        gss_output_buffer output{api};
        OM_uint32 minor{};
        int confidentiality_state{};

        if (const auto major = api.unwrap(&minor, _context.handle(), &input, output.get(), &confidentiality_state);
            major != GSS_S_COMPLETE)
        {
            KGSS_THROW_NATIVE(errc::protection_failed, "gss_unwrap failed", translate_gss_status(api, major, minor));
        }

        log::protection::trace("Unwrapped {} bytes into {} bytes.", _message.size(), output.get()->length);

        return output.to_bytes();
    } // unwrap
} // namespace kgss
