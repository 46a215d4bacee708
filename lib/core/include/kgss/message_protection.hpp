#ifndef KGSS_MESSAGE_PROTECTION_HPP
#define KGSS_MESSAGE_PROTECTION_HPP

/// \file

#include "kgss/security_context.hpp"

namespace kgss
{
    /// Applies integrity and, when \p _confidentiality is true, confidentiality protection to
    /// \p _message using an established security context.
    ///
    /// \throws kgss::exception errc::context_not_established No native call is made.
    /// \throws kgss::exception errc::protection_failed
    auto wrap(const security_context& _context, const bytes& _message, bool _confidentiality = true) -> bytes;

    /// Removes the protection applied by the peer's wrap.
    ///
    /// \throws kgss::exception errc::context_not_established No native call is made.
    /// \throws kgss::exception errc::protection_failed
    auto unwrap(const security_context& _context, const bytes& _message) -> bytes;
} // namespace kgss

#endif // KGSS_MESSAGE_PROTECTION_HPP
