#include "commands.hpp"
#include "blocked_info.hpp"
#include "connectivity_probe.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "package_ref.hpp"
#include "process.hpp"
#include "utils.hpp"

#include <iostream>

namespace {

void show_blocked_panel(const std::string& package, const std::string& version,
                        const std::string& reason, const std::string& audit_url) {
    log_error(get_string("info.blocked_title"));
    log_error(string_format("info.blocked_package", package));
    log_error(string_format("info.blocked_version", version));
    log_error(string_format("info.blocked_reason", reason));
    log_error(string_format("info.blocked_details", audit_url));
}

std::vector<std::string> collect_package_specs(const InstallOptions& options) {
    if (options.requirement_file) {
        return parse_requirements_file(*options.requirement_file);
    }
    return options.packages;
}

} // namespace

bool validate_packages(const std::vector<std::string>& package_specs, ValidationClient& client) {
    for (const auto& spec : package_specs) {
        const PackageReference ref = parse_package_spec(spec);

        log_info(string_format("info.checking_package", spec));
        ValidationResult result = client.validate(ref.name, ref.version);

        if (!result.allowed()) {
            show_blocked_panel(ref.name, ref.version.value_or(get_string("info.latest_version")),
                               result.reason, result.details.audit_url);
            return false;
        }
        log_info(string_format("info.package_passed", spec));
    }
    return true;
}

std::vector<std::string> build_pip_args(const InstallOptions& options) {
    std::vector<std::string> args = {options.pip_executable, "install"};

    if (options.requirement_file) {
        args.push_back("-r");
        args.push_back(*options.requirement_file);
    } else {
        args.insert(args.end(), options.packages.begin(), options.packages.end());
    }

    if (options.upgrade) args.push_back("--upgrade");
    if (options.index_url) {
        args.push_back("--index-url");
        args.push_back(*options.index_url);
    }
    if (options.extra_index_url) {
        args.push_back("--extra-index-url");
        args.push_back(*options.extra_index_url);
    }
    if (options.trusted_host) {
        args.push_back("--trusted-host");
        args.push_back(*options.trusted_host);
    }
    if (options.no_deps) args.push_back("--no-deps");
    return args;
}

void report_blocked_packages(const BlockedPackageReport& report) {
    log_error(string_format("error.firewall_blocked_count", report.count));
    for (const auto& pkg : report.packages) {
        log_error(string_format("info.blocked_entry", pkg.name, pkg.version));
    }
    const auto& first = report.packages.front();
    log_info(string_format("info.audit_hint", first.name + "==" + first.version));
}

int install_packages(const InstallOptions& options, HttpClient& http, const FirewallConfig& config) {
    const std::vector<std::string> specs = collect_package_specs(options);
    if (specs.empty()) {
        throw PipwallException(get_string("error.no_packages"));
    }

    if (options.force) {
        log_warning(get_string("warning.skipping_validation"));
    } else {
        ValidationClient client(http, config);
        if (!validate_packages(specs, client)) {
            log_error(get_string("error.install_aborted"));
            return 1;
        }
    }

    log_info(string_format("info.installing", join(specs, ", ")));

    InstallOutputMonitor monitor(std::cout);
    const int exit_code = run_monitored(build_pip_args(options), monitor);

    if (auto report = monitor.finalize(exit_code)) {
        report_blocked_packages(*report);
    }
    return exit_code;
}

int audit_package(const std::string& package_spec, HttpClient& http, const FirewallConfig& config) {
    const PackageReference ref = parse_package_spec(package_spec);

    BlockedInfoResolver resolver(http, config);
    log_info(string_format("info.checking_package", ref.name));
    const BlockedInfo info = resolver.get_blocked_info(ref.name);
    const std::string audit_url = config.base_url + "/blocked/" + ref.name;

    switch (info.status) {
        case BlockedStatus::BLOCKED: {
            std::string reason = join(info.reasons, "; ");
            if (reason.empty()) reason = get_string("info.no_specific_reason");
            show_blocked_panel(ref.name, string_format("info.blocked_version_count", info.blocked_version_count),
                               reason, audit_url);
            if (!info.blocked_versions_list.empty()) {
                log_info(string_format("info.blocked_versions", join(info.blocked_versions_list, ", ")));
            }
            return 0;
        }
        case BlockedStatus::ALLOWED:
            log_info(string_format("info.package_allowed", ref.name));
            log_info(get_string("info.no_versions_blocked"));
            return 0;
        case BlockedStatus::ERROR:
            log_error(string_format("error.audit_failed", info.error));
            return 1;
        case BlockedStatus::UNKNOWN:
            break;
    }
    log_warning(string_format("warning.package_status", std::string(to_string(info.status)), info.error));
    return 1;
}

int check_firewall(HttpClient& http, const FirewallConfig& config) {
    ConnectivityProbe probe(http, config);
    log_info(get_string("info.checking_connectivity"));

    if (probe.check_connectivity()) {
        log_info(string_format("info.firewall_reachable", config.base_url));
        return 0;
    }
    log_error(string_format("error.firewall_unreachable", config.base_url));
    log_info(get_string("info.start_firewall_hint"));
    return 1;
}
