#include "kgss/credential_cache.hpp"

#include "kgss/at_scope_exit.hpp"
#include "kgss/error_translator.hpp"
#include "kgss/kgss_exception.hpp"
#include "kgss/kgss_logger.hpp"
#include "kgss/scoped_environment.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace
{
    auto generate_session_id() -> std::string
    {
        return to_string(boost::uuids::random_generator{}());
    } // generate_session_id

    auto write_private_file(const std::string& _path, const std::string& _contents) -> bool
    {
        {
            std::ofstream out{_path, std::ios::out | std::ios::trunc};

            if (!out) {
                return false;
            }

            out << _contents;
            out.flush();

            if (!out) {
                return false;
            }
        }

        std::error_code ec;
        fs::permissions(_path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);

        return !ec;
    } // write_private_file
} // anonymous namespace

namespace kgss
{
    credential_cache::credential_cache(native_api& _api, const session_configuration& _config)
        : api_{&_api}
        , config_path_{}
        , cache_path_{}
        , context_{nullptr, krb5_context_deleter{&_api}}
        , cache_{nullptr, krb5_ccache_deleter{&_api, nullptr}}
    {
        const auto id = generate_session_id();
        const auto directory = _config.temporary_directory.empty() ? fs::temp_directory_path()
                                                                   : _config.temporary_directory;

        config_path_ = (directory / fmt::format("{}{}.conf", _config.file_prefix, id)).string();
        cache_path_ = (directory / fmt::format("{}{}.cache", _config.file_prefix, id)).string();

        if (!write_private_file(config_path_, _config.render_krb5_config(cache_path_))) {
            remove_file_quietly(config_path_);
            KGSS_THROW(errc::config_write_failed,
                       fmt::format("Failed to write Kerberos config [{}].", config_path_));
        }

        log::session::debug("Wrote Kerberos configuration [{}] for realm [{}].", config_path_, _config.realm);

        // Construction is all-or-nothing. No file outlives a failed constructor.
        at_scope_exit remove_files{[this] {
            remove_file_quietly(config_path_);
            remove_file_quietly(cache_path_);
        }};

        scoped_environment env{config_path_, cache_path_};

        krb5_context context = nullptr;

        if (const auto ec = api_->init_context(&context); ec != 0) {
            // The library context does not exist, so the lookup falls back to the shared
            // error tables.
            KGSS_THROW_NATIVE(errc::context_init_failed,
                              "krb5_init_context failed",
                              translate_krb5_status(*api_, nullptr, ec));
        }

        context_.reset(context);

        krb5_ccache cache = nullptr;

        if (const auto ec = api_->cc_default(context_.get(), &cache); ec != 0) {
            auto translated = translate_krb5_status(*api_, context_.get(), ec);
            context_.reset();
            KGSS_THROW_NATIVE(errc::cache_open_failed, "krb5_cc_default failed", translated);
        }

        cache_ = unique_krb5_ccache{cache, krb5_ccache_deleter{api_, context_.get()}};

        remove_files.release();
    } // credential_cache

    credential_cache::~credential_cache()
    {
        close();
    } // ~credential_cache

    void credential_cache::close() noexcept
    {
        // The cache handle depends on the library context, so it goes first.
        cache_.reset();
        context_.reset();

        const auto removed_config = remove_file_quietly(config_path_);
        const auto removed_cache = remove_file_quietly(cache_path_);

        if (removed_config || removed_cache) {
            log::session::debug("Removed private Kerberos files [{}] and [{}].", config_path_, cache_path_);
        }
    } // credential_cache::close

    auto remove_file_quietly(const std::string& _path) noexcept -> bool
    {
        if (_path.empty()) {
            return false;
        }

        std::error_code ec;
        return fs::remove(_path, ec);
    } // remove_file_quietly
} // namespace kgss
