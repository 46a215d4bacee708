#ifndef KGSS_UNIT_TESTS_TEST_UTILITIES_HPP
#define KGSS_UNIT_TESTS_TEST_UTILITIES_HPP

#include "kgss/session_configuration.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace kgss::test
{
    // Directory holding every file written by the unit tests.
    inline auto scratch_directory() -> std::filesystem::path
    {
        auto dir = std::filesystem::temp_directory_path() / "kgss-unit-tests";
        std::filesystem::create_directories(dir);
        return dir;
    }

    // A configuration writing into the scratch directory under a prefix unique to the caller.
    inline auto make_configuration(const std::string& _file_prefix) -> session_configuration
    {
        auto config = session_configuration::make("kdc.example.com", "EXAMPLE.COM");
        config.temporary_directory = scratch_directory();
        config.file_prefix = _file_prefix;
        return config;
    }

    inline auto count_files_with_prefix(const std::filesystem::path& _dir, std::string_view _prefix) -> int
    {
        int count = 0;

        for (const auto& entry : std::filesystem::directory_iterator{_dir}) {
            if (entry.path().filename().string().rfind(_prefix, 0) == 0) {
                ++count;
            }
        }

        return count;
    }
} // namespace kgss::test

#endif // KGSS_UNIT_TESTS_TEST_UTILITIES_HPP
