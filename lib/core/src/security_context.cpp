#include "kgss/security_context.hpp"

#include "kgss/error_translator.hpp"
#include "kgss/kgss_exception.hpp"
#include "kgss/kgss_logger.hpp"

#include <fmt/format.h>

#include <utility>

namespace
{
    auto import_target_name(kgss::native_api& _api, const std::string& _target_service) -> kgss::unique_gss_name
    {
        gss_buffer_desc name_buffer{};
        name_buffer.length = _target_service.size();
        name_buffer.value = const_cast<char*>(_target_service.data()); // NOLINT(cppcoreguidelines-pro-type-const-cast)

        OM_uint32 minor{};
        gss_name_t name = GSS_C_NO_NAME;

        if (const auto major = _api.import_name(&minor, &name_buffer, GSS_C_NT_HOSTBASED_SERVICE, &name);
            major != GSS_S_COMPLETE)
        {
            KGSS_THROW_NATIVE(kgss::errc::name_import_failed,
                              "gss_import_name failed",
                              kgss::translate_gss_status(_api, major, minor));
        }

        return {name, kgss::gss_name_deleter{&_api}};
    } // import_target_name
} // anonymous namespace

namespace kgss
{
    auto to_string(negotiation_state _state) noexcept -> std::string_view
    {
        switch (_state) {
            case negotiation_state::uninitialized: return "uninitialized";
            case negotiation_state::negotiating:   return "negotiating";
            case negotiation_state::established:   return "established";
        }

        return "unknown";
    } // to_string

    security_context::security_context(native_api& _api, negotiation_options _options)
        : api_{&_api}
        , options_{_options}
        , state_{negotiation_state::uninitialized}
        , context_{GSS_C_NO_CONTEXT, gss_context_deleter{&_api}}
    {
    } // security_context

    security_context::security_context(security_context&& _other) noexcept
        : api_{_other.api_}
        , options_{_other.options_}
        , state_{std::exchange(_other.state_, negotiation_state::uninitialized)}
        , context_{std::move(_other.context_)}
    {
    } // security_context

    auto security_context::operator=(security_context&& _other) noexcept -> security_context&
    {
        if (this != &_other) {
            context_ = std::move(_other.context_);
            api_ = _other.api_;
            options_ = _other.options_;
            state_ = std::exchange(_other.state_, negotiation_state::uninitialized);
        }

        return *this;
    } // operator=

    auto security_context::step(const std::string& _target_service, const std::optional<bytes>& _input_token)
        -> step_result
    {
        if (established()) {
            KGSS_THROW(errc::context_already_established,
                       "The security context is already established. No further rounds are allowed.");
        }

        auto target = import_target_name(*api_, _target_service);

        gss_buffer_desc input{};
        if (_input_token) {
            input = make_input_buffer(*_input_token);
        }

        gss_output_buffer output{*api_};
        OM_uint32 minor{};
        OM_uint32 returned_flags{};

        // The library allocates or extends the context in place. Hand it the raw handle and
        // take ownership of whatever it leaves behind, whatever the outcome.
        gss_ctx_id_t handle = context_.release();
        state_ = negotiation_state::negotiating;

        const auto major = api_->init_sec_context(&minor,
                                                  &handle,
                                                  target.get(),
                                                  gss_mech_krb5,
                                                  options_.request_flags(),
                                                  _input_token ? &input : GSS_C_NO_BUFFER,
                                                  output.get(),
                                                  &returned_flags);

        context_.reset(handle);
        target.reset();

        if (major != GSS_S_COMPLETE && major != GSS_S_CONTINUE_NEEDED) {
            KGSS_THROW_NATIVE(errc::negotiation_failed,
                              "gss_init_sec_context failed",
                              translate_gss_status(*api_, major, minor));
        }

        step_result result;
        result.output = output.to_bytes();
        result.completed = (major == GSS_S_COMPLETE);

        if (result.completed) {
            state_ = negotiation_state::established;
            log::negotiation::info("Security context established with [{}].", _target_service);
        }

        log::negotiation::debug("Negotiation round with [{}] produced a {} byte token. [completed={}, flags={:#x}]",
                                _target_service,
                                result.output.size(),
                                result.completed,
                                returned_flags);

        return result;
    } // security_context::step

    void security_context::reset() noexcept
    {
        context_.reset();
        state_ = negotiation_state::uninitialized;
    } // security_context::reset
} // namespace kgss
