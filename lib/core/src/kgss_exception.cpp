#include "kgss/kgss_exception.hpp"

#include <fmt/format.h>

namespace
{
    auto format_native_message(const std::string& _prefix, const kgss::translated_status& _translated)
        -> std::string
    {
        using family = kgss::native_status::family;

        const auto& status = _translated.status;

        switch (status.source) {
            case family::krb5:
                return fmt::format("{}: {}. (error code {})", _prefix, _translated.text, status.major);

            case family::gss:
                return fmt::format(
                    "{}: {}. (error code {} - {})", _prefix, _translated.text, status.major, status.minor);

            case family::none:
                break;
        }

        return fmt::format("{}: {}.", _prefix, _translated.text);
    } // format_native_message
} // anonymous namespace

namespace kgss
{
    exception::exception(errc _code,
                         const std::string& _message,
                         const std::string& _file_name,
                         std::uint32_t _line_number,
                         const std::string& _function_name)
        : std::exception{}
        , code_{_code}
        , native_{}
        , message_stack_{_message}
        , line_number_{_line_number}
        , function_name_{_function_name}
        , file_name_{_file_name}
    {
    } // exception

    exception::exception(errc _code,
                         const std::string& _prefix,
                         const translated_status& _translated,
                         const std::string& _file_name,
                         std::uint32_t _line_number,
                         const std::string& _function_name)
        : exception{_code, format_native_message(_prefix, _translated), _file_name, _line_number, _function_name}
    {
        native_ = _translated.status;
    } // exception

    auto exception::what() const noexcept -> const char*
    {
        assemble_full_display_what();
        return what_.c_str();
    } // what

    auto exception::client_display_what() const noexcept -> const char*
    {
        assemble_client_display_what();
        return what_.c_str();
    } // client_display_what

    void exception::assemble_full_display_what() const noexcept
    {
        try {
            // The first entry is the primary message. Later entries were added while
            // the exception travelled up the stack and read outermost-last.
            std::string what;

            for (auto iter = message_stack_.rbegin(); iter != message_stack_.rend(); ++iter) {
                if (!what.empty()) {
                    what += " <- ";
                }

                what += *iter;
            }

            what_ = std::move(what);
        }
        catch (const std::exception&) {
            what_.clear();
        }
    } // assemble_full_display_what

    void exception::assemble_client_display_what() const noexcept
    {
        try {
            auto what = fmt::format("{}:", to_string(code_));

            for (const auto& entry : message_stack_) {
                what += fmt::format(" {}", entry);
            }

            what_ = std::move(what);
        }
        catch (const std::exception&) {
            what_.clear();
        }
    } // assemble_client_display_what
} // namespace kgss
