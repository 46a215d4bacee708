#include "kgss/session_configuration.hpp"

#include "kgss/kgss_exception.hpp"
#include "kgss/kgss_logger.hpp"
#include "kgss/native_api.hpp"

#include <fmt/format.h>

#include <fstream>
#include <system_error>

namespace
{
    template <typename T>
    auto get_optional(const nlohmann::json& _doc, const char* _key, T& _value) -> void
    {
        if (const auto iter = _doc.find(_key); iter != std::end(_doc)) {
            _value = iter->template get<T>();
        }
    } // get_optional

    auto get_required_string(const nlohmann::json& _doc, const char* _key) -> std::string
    {
        const auto iter = _doc.find(_key);

        if (iter == std::end(_doc)) {
            KGSS_THROW(kgss::errc::invalid_configuration,
                       fmt::format("session_configuration: missing required property [{}].", _key));
        }

        auto value = iter->get<std::string>();

        if (value.empty()) {
            KGSS_THROW(kgss::errc::invalid_configuration,
                       fmt::format("session_configuration: property [{}] must not be empty.", _key));
        }

        return value;
    } // get_required_string

    // Returns the object stored under _key, or nullptr if the key is absent.
    auto find_section(const nlohmann::json& _doc, const char* _key) -> const nlohmann::json*
    {
        const auto iter = _doc.find(_key);

        if (iter == std::end(_doc)) {
            return nullptr;
        }

        if (!iter->is_object()) {
            KGSS_THROW(kgss::errc::invalid_configuration,
                       fmt::format("session_configuration: property [{}] must be a JSON object.", _key));
        }

        return &*iter;
    } // find_section

    auto default_temporary_directory() -> std::filesystem::path
    {
        std::error_code ec;
        auto path = std::filesystem::temp_directory_path(ec);

        if (ec) {
            return "/tmp";
        }

        return path;
    } // default_temporary_directory
} // anonymous namespace

namespace kgss
{
    auto negotiation_options::request_flags() const noexcept -> unsigned int
    {
        OM_uint32 flags = 0;

        // clang-format off
        if (mutual_authentication) { flags |= GSS_C_MUTUAL_FLAG; }
        if (confidentiality)       { flags |= GSS_C_CONF_FLAG; }
        if (integrity)             { flags |= GSS_C_INTEG_FLAG; }
        if (delegate_credentials)  { flags |= GSS_C_DELEG_FLAG; }
        // clang-format on

        return flags;
    } // negotiation_options::request_flags

    auto session_configuration::make(std::string _kdc_host, std::string _realm) -> session_configuration
    {
        session_configuration config;
        config.kdc_host = std::move(_kdc_host);
        config.realm = std::move(_realm);
        config.temporary_directory = default_temporary_directory();
        return config;
    } // session_configuration::make

    auto session_configuration::from_json(const nlohmann::json& _doc) -> session_configuration
    {
        if (!_doc.is_object()) {
            KGSS_THROW(errc::invalid_configuration, "session_configuration: document must be a JSON object.");
        }

        try {
            auto config = make(get_required_string(_doc, "kdc_host"), get_required_string(_doc, "realm"));

            if (const auto iter = _doc.find("temporary_directory"); iter != std::end(_doc)) {
                config.temporary_directory = iter->get<std::string>();
            }

            get_optional(_doc, "file_prefix", config.file_prefix);

            if (const auto* section = find_section(_doc, "negotiation"); section) {
                get_optional(*section, "mutual_authentication", config.negotiation.mutual_authentication);
                get_optional(*section, "confidentiality", config.negotiation.confidentiality);
                get_optional(*section, "integrity", config.negotiation.integrity);
                get_optional(*section, "delegate_credentials", config.negotiation.delegate_credentials);
            }

            if (const auto* section = find_section(_doc, "protection"); section) {
                get_optional(*section, "confidentiality", config.protection.confidentiality);
            }

            if (const auto* section = find_section(_doc, "log_level"); section) {
                config.log_level = section->get<std::map<std::string, std::string>>();
            }

            return config;
        }
        catch (const nlohmann::json::exception& e) {
            KGSS_THROW(errc::invalid_configuration,
                       fmt::format("session_configuration: invalid property type. [{}]", e.what()));
        }
    } // session_configuration::from_json

    auto session_configuration::load(const std::filesystem::path& _path) -> session_configuration
    {
        std::ifstream in{_path};

        if (!in) {
            KGSS_THROW(errc::invalid_configuration,
                       fmt::format("session_configuration: could not open [{}].", _path.string()));
        }

        try {
            log::configuration::debug("Loading session configuration from [{}].", _path.string());
            return from_json(nlohmann::json::parse(in));
        }
        catch (const nlohmann::json::parse_error& e) {
            KGSS_THROW(errc::invalid_configuration,
                       fmt::format("session_configuration: could not parse [{}]. [{}]", _path.string(), e.what()));
        }
    } // session_configuration::load

    auto session_configuration::render_krb5_config(const std::string& _cache_path) const -> std::string
    {
        constexpr const char* format = "[libdefaults]\n"
                                       "  default_realm = {0}\n"
                                       "  default_ccache_name = FILE:{2}\n"
                                       "\n"
                                       "[realms]\n"
                                       "  {0} = {{\n"
                                       "    kdc = {1}\n"
                                       "  }}\n";

        return fmt::format(format, realm, kdc_host, _cache_path);
    } // session_configuration::render_krb5_config

    void session_configuration::apply_log_levels() const
    {
        for (const auto& [category, level] : log_level) {
            if (!log::set_level(category, log::to_level(level))) {
                log::configuration::warn("Ignoring log level for unknown category [{}].", category);
            }
        }
    } // session_configuration::apply_log_levels
} // namespace kgss
