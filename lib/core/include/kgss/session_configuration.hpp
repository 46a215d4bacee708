#ifndef KGSS_SESSION_CONFIGURATION_HPP
#define KGSS_SESSION_CONFIGURATION_HPP

/// \file

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <string>

namespace kgss
{
    /// Security context request flags sent on every negotiation round.
    ///
    /// All flags are off by default, so no flags are requested unless a deployment asks
    /// for them.
    struct negotiation_options
    {
        bool mutual_authentication = false;
        bool confidentiality = false;
        bool integrity = false;
        bool delegate_credentials = false;

        // Converts the options into GSS_C_*_FLAG bits.
        auto request_flags() const noexcept -> unsigned int;
    }; // struct negotiation_options

    struct protection_options
    {
        // When false, wrap() requests integrity protection only.
        bool confidentiality = true;
    }; // struct protection_options

    /// Everything needed to provision one session.
    ///
    /// Example document accepted by from_json():
    /// \code{.js}
    /// {
    ///     "kdc_host": "kdc.example.com",
    ///     "realm": "EXAMPLE.COM",
    ///     "temporary_directory": "/tmp",
    ///     "file_prefix": "kgss-krb5-",
    ///     "negotiation": {"mutual_authentication": true},
    ///     "protection": {"confidentiality": true},
    ///     "log_level": {"negotiation": "debug"}
    /// }
    /// \endcode
    struct session_configuration
    {
        std::string kdc_host;
        std::string realm;
        std::filesystem::path temporary_directory;
        std::string file_prefix = "kgss-krb5-";
        negotiation_options negotiation;
        protection_options protection;
        std::map<std::string, std::string> log_level;

        /// Builds a configuration carrying only the KDC and realm. Every other member keeps
        /// its default value; the temporary directory is the platform's.
        static auto make(std::string _kdc_host, std::string _realm) -> session_configuration;

        /// \throws kgss::exception errc::invalid_configuration
        static auto from_json(const nlohmann::json& _doc) -> session_configuration;

        /// \throws kgss::exception errc::invalid_configuration
        static auto load(const std::filesystem::path& _path) -> session_configuration;

        /// Renders the Kerberos configuration file for this session.
        auto render_krb5_config(const std::string& _cache_path) const -> std::string;

        /// Applies the log_level member to the kgss log categories.
        void apply_log_levels() const;
    }; // struct session_configuration
} // namespace kgss

#endif // KGSS_SESSION_CONFIGURATION_HPP
