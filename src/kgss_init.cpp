#include <kgss/kgss_exception.hpp>
#include <kgss/kgss_logger.hpp>
#include <kgss/session.hpp>
#include <kgss/session_configuration.hpp>

#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <iostream>
#include <optional>
#include <string>

// clang-format off
namespace po = boost::program_options;
// clang-format on

auto print_usage(const po::options_description& _desc) -> void;
auto load_configuration(const po::variables_map& _vm) -> std::optional<kgss::session_configuration>;
auto print_token(const kgss::bytes& _token) -> void;

// kgss-init return codes:
//  0 - success
//  1 - a Kerberos/GSSAPI operation failed
//  2 - invalid command line arguments or configuration
int main(int argc, char** argv)
{
    po::options_description desc{""};
    // clang-format off
    desc.add_options()
        ("help,h", "Display help")
        ("kdc,k", po::value<std::string>(), "KDC host (optionally host:port)")
        ("realm,r", po::value<std::string>(), "Kerberos realm")
        ("config,c", po::value<std::string>(), "JSON session configuration file (replaces --kdc and --realm)")
        ("principal,p", po::value<std::string>(), "Client principal, e.g. alice@EXAMPLE.COM")
        ("keytab,t", po::value<std::string>(), "Acquire credentials using this keytab file")
        ("password-stdin", po::bool_switch(), "Read the password from the first line of stdin")
        ("service,s", po::value<std::string>(), "Run the first negotiation round against this service, e.g. HTTP@host")
        ("log-level,l", po::value<std::string>(), "Log level applied to every category (trace|debug|info|warn|error|critical)");
    // clang-format on

    po::variables_map vm;

    try {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    }
    catch (const po::error& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        print_usage(desc);
        return 2;
    }

    if (vm.count("help")) {
        print_usage(desc);
        return 0;
    }

    if (!vm.count("principal")) {
        fmt::print(stderr, "Error: --principal is required.\n");
        return 2;
    }

    if (vm.count("keytab") && vm["password-stdin"].as<bool>()) {
        fmt::print(stderr, "Incompatible options: --keytab and --password-stdin cannot be used together\n");
        return 2;
    }

    if (!vm.count("keytab") && !vm["password-stdin"].as<bool>()) {
        fmt::print(stderr, "Error: one of --keytab or --password-stdin is required.\n");
        return 2;
    }

    kgss::log::init();

    std::optional<kgss::session_configuration> config;

    try {
        config = load_configuration(vm);
    }
    catch (const kgss::exception& e) {
        fmt::print(stderr, "{}\n", e.client_display_what());
        return 2;
    }

    if (!config) {
        fmt::print(stderr, "Error: either --config or both --kdc and --realm are required.\n");
        return 2;
    }

    if (vm.count("log-level")) {
        const auto level = kgss::log::to_level(vm["log-level"].as<std::string>());
        for (const auto* category : {"session", "authentication", "negotiation", "protection", "configuration"}) {
            kgss::log::set_level(category, level);
        }
    }
    else {
        config->apply_log_levels();
    }

    const auto& principal = vm["principal"].as<std::string>();

    try {
        kgss::session session{*config};

        if (vm.count("keytab")) {
            session.authenticate_with_keytab(principal, vm["keytab"].as<std::string>());
        }
        else {
            std::string password;
            std::getline(std::cin, password);
            session.authenticate_with_password(principal, password);
        }

        fmt::print("Acquired initial credentials for [{}].\n", principal);

        if (vm.count("service")) {
            const auto& service = vm["service"].as<std::string>();
            const auto result = session.step(service);

            fmt::print("Negotiation with [{}]: {} byte token, {}.\n",
                       service,
                       result.output.size(),
                       result.completed ? "complete" : "continue needed");
            print_token(result.output);
        }
    }
    catch (const kgss::exception& e) {
        fmt::print(stderr, "{}\n", e.client_display_what());
        return 1;
    }

    return 0;
}

auto print_usage(const po::options_description& _desc) -> void
{
    std::cout << "Usage: kgss-init [OPTION]...\n"
                 "Acquires Kerberos credentials for a principal inside a private credential cache\n"
                 "and optionally starts a GSSAPI security context with a service.\n"
                 "\n"
                 "Example:\n"
                 "  echo \"$PASSWORD\" | kgss-init -k kdc.example.com -r EXAMPLE.COM -p alice@EXAMPLE.COM --password-stdin\n"
                 "\n"
              << _desc << '\n';
}

auto load_configuration(const po::variables_map& _vm) -> std::optional<kgss::session_configuration>
{
    if (_vm.count("config")) {
        return kgss::session_configuration::load(_vm["config"].as<std::string>());
    }

    if (_vm.count("kdc") && _vm.count("realm")) {
        return kgss::session_configuration::make(_vm["kdc"].as<std::string>(), _vm["realm"].as<std::string>());
    }

    return std::nullopt;
}

auto print_token(const kgss::bytes& _token) -> void
{
    constexpr std::size_t bytes_per_line = 16;

    for (std::size_t i = 0; i < _token.size(); ++i) {
        fmt::print("{:02x}{}", _token[i], (i % bytes_per_line == bytes_per_line - 1) ? "\n" : " ");
    }

    if (_token.size() % bytes_per_line != 0) {
        fmt::print("\n");
    }
}
