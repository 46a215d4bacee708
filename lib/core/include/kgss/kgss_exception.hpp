#ifndef KGSS_EXCEPTION_HPP
#define KGSS_EXCEPTION_HPP

#include "kgss/system_error.hpp"

#include <cstdint>
#include <exception>
#include <string>
#include <system_error>
#include <vector>

namespace kgss
{
    /// Identifies which native subsystem produced a failure and the raw code(s) it reported.
    struct native_status
    {
        enum class family
        {
            none,
            krb5,
            gss
        };

        family source = family::none;

        // krb5_error_code for family::krb5, the GSSAPI major status for family::gss.
        std::int64_t major = 0;

        // The GSSAPI minor (mechanism) status. Always zero for family::krb5.
        std::int64_t minor = 0;
    }; // struct native_status

    /// The human-readable text of a native status along with the raw codes.
    struct translated_status
    {
        std::string text;
        native_status status;
    }; // struct translated_status

    class exception : public std::exception
    {
      public:
        exception(errc _code,
                  const std::string& _message,
                  const std::string& _file_name,
                  std::uint32_t _line_number,
                  const std::string& _function_name);

        exception(errc _code,
                  const std::string& _prefix,
                  const translated_status& _translated,
                  const std::string& _file_name,
                  std::uint32_t _line_number,
                  const std::string& _function_name);

        exception(const exception&) = default;
        auto operator=(const exception&) -> exception& = default;

        ~exception() override = default;

        // Full diagnostic message: prefix, native text and raw code(s).
        auto what() const noexcept -> const char* override;

        // Symbolic error name followed by the message stack.
        auto client_display_what() const noexcept -> const char*;

        // accessors
        auto code() const noexcept -> errc { return code_; }
        auto error_code() const noexcept -> std::error_code { return make_error_code(code_); }
        auto native() const noexcept -> const native_status& { return native_; }
        auto message_stack() const -> std::vector<std::string> { return message_stack_; }
        auto file_name() const -> std::string { return file_name_; }
        auto line_number() const noexcept -> std::uint32_t { return line_number_; }
        auto function_name() const -> std::string { return function_name_; }

        // mutators
        void add_message(const std::string& _m) { message_stack_.push_back(_m); }

      private:
        void assemble_full_display_what() const noexcept;
        void assemble_client_display_what() const noexcept;

        errc code_;
        native_status native_;
        std::vector<std::string> message_stack_;
        std::uint32_t line_number_;
        std::string function_name_;
        std::string file_name_;
        mutable std::string what_;
    }; // class exception
} // namespace kgss

#define KGSS_THROW(_code, _msg) (throw kgss::exception(_code, _msg, __FILE__, __LINE__, __PRETTY_FUNCTION__))
#define KGSS_THROW_NATIVE(_code, _prefix, _translated) \
    (throw kgss::exception(_code, _prefix, _translated, __FILE__, __LINE__, __PRETTY_FUNCTION__))
#define KGSS_RE_THROW(_msg, _excp) \
    _excp.add_message(_msg);       \
    throw _excp;

#endif // KGSS_EXCEPTION_HPP
