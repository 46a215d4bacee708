#include "kgss/native_handles.hpp"

#include "kgss/kgss_logger.hpp"

#include <cstring>

namespace kgss
{
    void krb5_context_deleter::operator()(krb5_context _context) const noexcept
    {
        api->free_context(_context);
    } // krb5_context_deleter::operator()

    void krb5_ccache_deleter::operator()(krb5_ccache _cache) const noexcept
    {
        if (const auto ec = api->cc_close(context, _cache); ec != 0) {
            log::session::warn("krb5_cc_close failed while releasing the credential cache. [error_code={}]", ec);
        }
    } // krb5_ccache_deleter::operator()

    void krb5_principal_deleter::operator()(krb5_principal _principal) const noexcept
    {
        api->free_principal(context, _principal);
    } // krb5_principal_deleter::operator()

    void krb5_keytab_deleter::operator()(krb5_keytab _keytab) const noexcept
    {
        if (const auto ec = api->kt_close(context, _keytab); ec != 0) {
            log::authentication::warn("krb5_kt_close failed while releasing a keytab. [error_code={}]", ec);
        }
    } // krb5_keytab_deleter::operator()

    void gss_name_deleter::operator()(gss_name_t _name) const noexcept
    {
        OM_uint32 minor{};
        if (const auto major = api->release_name(&minor, &_name); major != GSS_S_COMPLETE) {
            log::negotiation::warn("gss_release_name failed. [major_status={}, minor_status={}]", major, minor);
        }
    } // gss_name_deleter::operator()

    void gss_context_deleter::operator()(gss_ctx_id_t _context) const noexcept
    {
        OM_uint32 minor{};
        if (const auto major = api->delete_sec_context(&minor, &_context); major != GSS_S_COMPLETE) {
            log::negotiation::warn("gss_delete_sec_context failed. [major_status={}, minor_status={}]", major, minor);
        }
    } // gss_context_deleter::operator()

    scoped_credentials::scoped_credentials(native_api& _api, krb5_context _context) noexcept
        : api_{&_api}
        , context_{_context}
        , creds_{}
        , populated_{false}
    {
        std::memset(&creds_, 0, sizeof(creds_));
    } // scoped_credentials

    scoped_credentials::~scoped_credentials()
    {
        if (populated_) {
            api_->free_cred_contents(context_, &creds_);
        }
    } // ~scoped_credentials

    gss_output_buffer::gss_output_buffer(native_api& _api) noexcept
        : api_{&_api}
        , buffer_{}
    {
        buffer_.length = 0;
        buffer_.value = nullptr;
    } // gss_output_buffer

    gss_output_buffer::~gss_output_buffer()
    {
        release();
    } // ~gss_output_buffer

    auto gss_output_buffer::to_bytes() const -> bytes
    {
        if (empty()) {
            return {};
        }

        const auto* first = static_cast<const std::uint8_t*>(buffer_.value);
        return {first, first + buffer_.length}; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    } // gss_output_buffer::to_bytes

    void gss_output_buffer::release() noexcept
    {
        if (!buffer_.value) {
            buffer_.length = 0;
            return;
        }

        OM_uint32 minor{};
        if (const auto major = api_->release_buffer(&minor, &buffer_); major != GSS_S_COMPLETE) {
            log::protection::warn("gss_release_buffer failed. [major_status={}, minor_status={}]", major, minor);
        }

        buffer_.length = 0;
        buffer_.value = nullptr;
    } // gss_output_buffer::release
} // namespace kgss
