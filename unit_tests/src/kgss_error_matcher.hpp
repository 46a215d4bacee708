#ifndef KGSS_UNIT_TESTS_KGSS_ERROR_MATCHER_HPP
#define KGSS_UNIT_TESTS_KGSS_ERROR_MATCHER_HPP

#include "kgss/kgss_exception.hpp"

#include <catch2/catch.hpp>

#include <fmt/format.h>

#include <string>

// Matches a kgss::exception carrying a specific error code.
class kgss_error_matcher : public Catch::MatcherBase<kgss::exception>
{
  public:
    explicit kgss_error_matcher(kgss::errc _expected)
        : expected_{_expected}
    {
    }

    auto match(const kgss::exception& _e) const -> bool override
    {
        return _e.code() == expected_;
    }

    auto describe() const -> std::string override
    {
        return fmt::format("carries error code {}", kgss::to_string(expected_));
    }

  private:
    kgss::errc expected_;
}; // class kgss_error_matcher

inline auto has_error_code(kgss::errc _expected) -> kgss_error_matcher
{
    return kgss_error_matcher{_expected};
}

#endif // KGSS_UNIT_TESTS_KGSS_ERROR_MATCHER_HPP
