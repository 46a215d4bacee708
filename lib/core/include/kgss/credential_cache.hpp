#ifndef KGSS_CREDENTIAL_CACHE_HPP
#define KGSS_CREDENTIAL_CACHE_HPP

/// \file

#include "kgss/native_handles.hpp"
#include "kgss/session_configuration.hpp"

#include <string>

namespace kgss
{
    /// Owns the private Kerberos configuration file, the private credential cache file and the
    /// native handles opened against them.
    ///
    /// Both files are named after a random identifier generated on construction and live in
    /// the configured temporary directory. They are removed by close().
    class credential_cache
    {
      public:
        /// Writes the configuration file, opens a library context and a handle to the default
        /// credential cache (which resolves to the private cache file).
        ///
        /// On failure, every file already written is removed before the exception propagates.
        ///
        /// \throws kgss::exception errc::config_write_failed
        /// \throws kgss::exception errc::context_init_failed
        /// \throws kgss::exception errc::cache_open_failed
        credential_cache(native_api& _api, const session_configuration& _config);

        credential_cache(const credential_cache&) = delete;
        auto operator=(const credential_cache&) -> credential_cache& = delete;

        ~credential_cache();

        /// Closes the cache handle, frees the library context and removes both files.
        ///
        /// File removal is best-effort. Calling this function more than once has no effect.
        void close() noexcept;

        auto is_open() const noexcept -> bool { return static_cast<bool>(context_); }

        auto configuration_path() const noexcept -> const std::string& { return config_path_; }
        auto cache_path() const noexcept -> const std::string& { return cache_path_; }

        auto api() const noexcept -> native_api& { return *api_; }
        auto context() const noexcept -> krb5_context { return context_.get(); }
        auto cache() const noexcept -> krb5_ccache { return cache_.get(); }

      private:
        native_api* api_;
        std::string config_path_;
        std::string cache_path_;
        unique_krb5_context context_;
        unique_krb5_ccache cache_;
    }; // class credential_cache

    /// Removes a file, ignoring errors. Returns true if a file was removed.
    auto remove_file_quietly(const std::string& _path) noexcept -> bool;
} // namespace kgss

#endif // KGSS_CREDENTIAL_CACHE_HPP
