#ifndef KGSS_SCOPED_ENVIRONMENT_HPP
#define KGSS_SCOPED_ENVIRONMENT_HPP

/// \file

#include <mutex>
#include <optional>
#include <string>

namespace kgss
{
    /// Temporarily points the Kerberos libraries at a session's private files.
    ///
    /// The Kerberos libraries read their configuration file location (KRB5_CONFIG) and their
    /// default credential cache (KRB5CCNAME) from the process environment. Construction
    /// captures both variables, replaces them with the given paths and holds a process-wide
    /// lock. Destruction restores the captured values (unsetting variables which did not exist)
    /// and releases the lock.
    ///
    /// Only one instance may exist at a time across the whole process. Constructing a second
    /// instance from another thread blocks until the first is destroyed. Constructing a second
    /// instance from the thread which already holds one throws.
    ///
    /// No other code in kgss reads or writes these two variables.
    class scoped_environment
    {
      public:
        static constexpr const char* config_variable = "KRB5_CONFIG";
        static constexpr const char* cache_variable = "KRB5CCNAME";

        /// \throws kgss::exception errc::environment_scope_reentered if the calling thread
        ///                         already holds a scope.
        /// \throws kgss::exception errc::environment_update_failed if a variable cannot be set.
        scoped_environment(const std::string& _config_path, const std::string& _cache_path);

        scoped_environment(const scoped_environment&) = delete;
        auto operator=(const scoped_environment&) -> scoped_environment& = delete;

        ~scoped_environment();

        /// Returns true if the calling thread currently holds a scope.
        static auto held_by_this_thread() noexcept -> bool;

      private:
        void restore() noexcept;

        std::unique_lock<std::mutex> lock_;
        std::optional<std::string> previous_config_;
        std::optional<std::string> previous_cache_;
    }; // class scoped_environment
} // namespace kgss

#endif // KGSS_SCOPED_ENVIRONMENT_HPP
