#include "kgss/session.hpp"

#include "kgss/credential_acquisition.hpp"
#include "kgss/kgss_exception.hpp"
#include "kgss/kgss_logger.hpp"
#include "kgss/message_protection.hpp"
#include "kgss/scoped_environment.hpp"

namespace kgss
{
    session::session(const std::string& _kdc_host, const std::string& _realm, native_api& _api)
        : session{session_configuration::make(_kdc_host, _realm), _api}
    {
    } // session

    session::session(const session_configuration& _config, native_api& _api)
        : config_{_config}
        , cache_{std::make_unique<credential_cache>(_api, _config)}
        , context_{_api, _config.negotiation}
    {
        log::session::info("Session created for realm [{}] using KDC [{}].", config_.realm, config_.kdc_host);
    } // session

    session::~session()
    {
        close();
    } // ~session

    void session::authenticate_with_password(const std::string& _username, const std::string& _password)
    {
        kgss::authenticate_with_password(open_cache(), _username, _password);
    } // authenticate_with_password

    void session::authenticate_with_keytab(const std::string& _username, const std::string& _keytab_path)
    {
        kgss::authenticate_with_keytab(open_cache(), _username, _keytab_path);
    } // authenticate_with_keytab

    void session::authenticate(const std::string& _username, const std::string& _secret)
    {
        kgss::authenticate(open_cache(), _username, _secret);
    } // authenticate

    auto session::step(const std::string& _target_service, const std::optional<bytes>& _input_token) -> step_result
    {
        const auto& cache = open_cache();

        scoped_environment env{cache.configuration_path(), cache.cache_path()};

        try {
            return context_.step(_target_service, _input_token);
        }
        catch (kgss::exception& e) {
            if (e.code() == errc::negotiation_failed) {
                log::negotiation::error("Negotiation with [{}] failed. The session should be discarded. [{}]",
                                        _target_service,
                                        e.what());
            }

            throw;
        }
    } // step

    auto session::wrap(const bytes& _message) const -> bytes
    {
        return wrap(_message, config_.protection.confidentiality);
    } // wrap

    auto session::wrap(const bytes& _message, bool _confidentiality) const -> bytes
    {
        return kgss::wrap(context_, _message, _confidentiality);
    } // wrap

    auto session::unwrap(const bytes& _message) const -> bytes
    {
        return kgss::unwrap(context_, _message);
    } // unwrap

    void session::close() noexcept
    {
        context_.reset();

        if (cache_) {
            cache_->close();
        }
    } // close

    auto session::configuration_path() const -> std::string
    {
        return cache_ ? cache_->configuration_path() : std::string{};
    } // configuration_path

    auto session::cache_path() const -> std::string
    {
        return cache_ ? cache_->cache_path() : std::string{};
    } // cache_path

    auto session::open_cache() const -> credential_cache&
    {
        if (!is_open()) {
            KGSS_THROW(errc::invalid_input, "The session has already been closed.");
        }

        return *cache_;
    } // open_cache
} // namespace kgss
