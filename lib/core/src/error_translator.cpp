#include "kgss/error_translator.hpp"

#include "kgss/native_handles.hpp"

#include <optional>
#include <string>

namespace
{
    constexpr const char* unknown_error = "unknown error";

    auto display_status(kgss::native_api& _api, OM_uint32 _code, int _type) -> std::optional<std::string>
    {
        std::string text;
        OM_uint32 message_context = 0;

        do {
            OM_uint32 minor{};
            kgss::gss_output_buffer status_string{_api};

            if (_api.display_status(&minor, _code, _type, &message_context, status_string.get()) != GSS_S_COMPLETE) {
                // Keep whatever fragments were produced before the failure.
                if (text.empty()) {
                    return std::nullopt;
                }

                break;
            }

            const auto fragment = status_string.to_bytes();

            if (!text.empty()) {
                text += "; ";
            }

            text.append(std::begin(fragment), std::end(fragment));
        } while (message_context != 0);

        return text;
    } // display_status
} // anonymous namespace

namespace kgss
{
    auto translate_krb5_status(native_api& _api, krb5_context _context, krb5_error_code _code)
        -> translated_status
    {
        translated_status result;
        result.status.source = native_status::family::krb5;
        result.status.major = _code;

        if (const auto* message = _api.get_error_message(_context, _code); message) {
            result.text = message;
            _api.free_error_message(_context, message);
        }
        else {
            result.text = unknown_error;
        }

        return result;
    } // translate_krb5_status

    auto translate_gss_status(native_api& _api, OM_uint32 _major, OM_uint32 _minor) -> translated_status
    {
        translated_status result;
        result.status.source = native_status::family::gss;
        result.status.major = _major;
        result.status.minor = _minor;

        auto major_text = display_status(_api, _major, GSS_C_GSS_CODE);

        if (!major_text) {
            result.text = unknown_error;
            return result;
        }

        result.text = std::move(*major_text);

        if (_minor != 0) {
            if (auto minor_text = display_status(_api, _minor, GSS_C_MECH_CODE); minor_text) {
                result.text += ": ";
                result.text += *minor_text;
            }
        }

        return result;
    } // translate_gss_status
} // namespace kgss
