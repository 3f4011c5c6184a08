#include "commands.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "http_client.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.install_desc") << std::endl;
    std::cerr << get_string("info.audit_desc") << std::endl;
    std::cerr << get_string("info.check_desc") << std::endl;
}

template<typename T>
std::optional<T> optional_value(const cxxopts::ParseResult& result, const std::string& key) {
    if (result.count(key)) {
        return result[key].as<T>();
    }
    return std::nullopt;
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("version", get_string("help.version"))
            ("f,force", get_string("help.force"), cxxopts::value<bool>()->default_value("false"))
            ("U,upgrade", get_string("help.upgrade"), cxxopts::value<bool>()->default_value("false"))
            ("r,requirement", get_string("help.requirement"), cxxopts::value<std::string>())
            ("i,index-url", get_string("help.index_url"), cxxopts::value<std::string>())
            ("extra-index-url", get_string("help.extra_index_url"), cxxopts::value<std::string>())
            ("trusted-host", get_string("help.trusted_host"), cxxopts::value<std::string>())
            ("no-deps", get_string("help.no_deps"), cxxopts::value<bool>()->default_value("false"))
            ("pip", get_string("help.pip"), cxxopts::value<std::string>()->default_value("pip"))
            ("url", get_string("help.url"), cxxopts::value<std::string>())
            ("command", "", cxxopts::value<std::string>())
            ("packages", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "packages"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result.count("version")) {
            std::cout << string_format("info.version", std::string(PIPWALL_VERSION)) << std::endl;
            return 0;
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        const std::string& command = result["command"].as<std::string>();
        const std::vector<std::string> packages = result.count("packages")
            ? result["packages"].as<std::vector<std::string>>()
            : std::vector<std::string>{};

        const FirewallConfig config = load_firewall_config(optional_value<std::string>(result, "url"));
        CurlHttpClient http;

        if (command == "install") {
            InstallOptions install;
            install.packages = packages;
            install.requirement_file = optional_value<std::string>(result, "requirement");
            install.force = result["force"].as<bool>();
            install.upgrade = result["upgrade"].as<bool>();
            install.no_deps = result["no-deps"].as<bool>();
            install.index_url = optional_value<std::string>(result, "index-url");
            install.extra_index_url = optional_value<std::string>(result, "extra-index-url");
            install.trusted_host = optional_value<std::string>(result, "trusted-host");
            install.pip_executable = result["pip"].as<std::string>();
            return install_packages(install, http, config);
        } else if (command == "audit") {
            if (packages.size() != 1) {
                print_usage(options);
                throw PipwallException(get_string("error.invalid_arg_count"));
            }
            return audit_package(packages[0], http, config);
        } else if (command == "check") {
            if (!packages.empty()) {
                print_usage(options);
                throw PipwallException(get_string("error.invalid_arg_count"));
            }
            return check_firewall(http, config);
        } else {
            print_usage(options);
            return 1;
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const PipwallException& e) {
        log_error(string_format("error.pipwall_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }
}
