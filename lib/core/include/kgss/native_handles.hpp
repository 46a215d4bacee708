#ifndef KGSS_NATIVE_HANDLES_HPP
#define KGSS_NATIVE_HANDLES_HPP

/// \file
///
/// Owning wrappers for the opaque handles produced by the native libraries.
///
/// Every wrapper releases its handle exactly once, through the primitive matching the one
/// that produced it. Wrappers are move-only.

#include "kgss/native_api.hpp"

#include <cstdint>
#include <memory>
#include <type_traits>
#include <vector>

namespace kgss
{
    using bytes = std::vector<std::uint8_t>;

    struct krb5_context_deleter
    {
        native_api* api{};

        void operator()(krb5_context _context) const noexcept;
    }; // struct krb5_context_deleter

    struct krb5_ccache_deleter
    {
        native_api* api{};
        krb5_context context{};

        void operator()(krb5_ccache _cache) const noexcept;
    }; // struct krb5_ccache_deleter

    struct krb5_principal_deleter
    {
        native_api* api{};
        krb5_context context{};

        void operator()(krb5_principal _principal) const noexcept;
    }; // struct krb5_principal_deleter

    struct krb5_keytab_deleter
    {
        native_api* api{};
        krb5_context context{};

        void operator()(krb5_keytab _keytab) const noexcept;
    }; // struct krb5_keytab_deleter

    struct gss_name_deleter
    {
        native_api* api{};

        void operator()(gss_name_t _name) const noexcept;
    }; // struct gss_name_deleter

    struct gss_context_deleter
    {
        native_api* api{};

        void operator()(gss_ctx_id_t _context) const noexcept;
    }; // struct gss_context_deleter

    template <typename Handle, typename Deleter>
    using unique_handle = std::unique_ptr<std::remove_pointer_t<Handle>, Deleter>;

    // clang-format off
    using unique_krb5_context   = unique_handle<krb5_context, krb5_context_deleter>;
    using unique_krb5_ccache    = unique_handle<krb5_ccache, krb5_ccache_deleter>;
    using unique_krb5_principal = unique_handle<krb5_principal, krb5_principal_deleter>;
    using unique_krb5_keytab    = unique_handle<krb5_keytab, krb5_keytab_deleter>;
    using unique_gss_name       = unique_handle<gss_name_t, gss_name_deleter>;
    using unique_gss_context    = unique_handle<gss_ctx_id_t, gss_context_deleter>;
    // clang-format on

    /// Ticket material returned by an initial credentials request.
    ///
    /// The contents are released on destruction once populate() has been called.
    class scoped_credentials
    {
      public:
        scoped_credentials(native_api& _api, krb5_context _context) noexcept;

        scoped_credentials(const scoped_credentials&) = delete;
        auto operator=(const scoped_credentials&) -> scoped_credentials& = delete;

        ~scoped_credentials();

        auto get() noexcept -> krb5_creds* { return &creds_; }

        // Marks the contents as owned. Must be called after the native library filled them in.
        void populated() noexcept { populated_ = true; }

        auto is_populated() const noexcept -> bool { return populated_; }

      private:
        native_api* api_;
        krb5_context context_;
        krb5_creds creds_;
        bool populated_;
    }; // class scoped_credentials

    /// An output buffer whose memory is allocated by the GSSAPI library.
    class gss_output_buffer
    {
      public:
        explicit gss_output_buffer(native_api& _api) noexcept;

        gss_output_buffer(const gss_output_buffer&) = delete;
        auto operator=(const gss_output_buffer&) -> gss_output_buffer& = delete;

        ~gss_output_buffer();

        auto get() noexcept -> gss_buffer_t { return &buffer_; }

        auto empty() const noexcept -> bool { return buffer_.length == 0 || !buffer_.value; }

        // Copies the native bytes into memory owned by the caller.
        auto to_bytes() const -> bytes;

        // Returns the native memory early. Safe to call more than once.
        void release() noexcept;

      private:
        native_api* api_;
        gss_buffer_desc buffer_;
    }; // class gss_output_buffer

    /// Describes caller-owned memory to the GSSAPI library without copying it.
    inline auto make_input_buffer(const bytes& _data) noexcept -> gss_buffer_desc
    {
        gss_buffer_desc buffer{};
        buffer.length = _data.size();
        buffer.value = const_cast<std::uint8_t*>(_data.data()); // NOLINT(cppcoreguidelines-pro-type-const-cast)
        return buffer;
    } // make_input_buffer
} // namespace kgss

#endif // KGSS_NATIVE_HANDLES_HPP
