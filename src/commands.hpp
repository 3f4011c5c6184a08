#pragma once

#include "config.hpp"
#include "http_client.hpp"
#include "output_monitor.hpp"
#include "validation_client.hpp"

#include <optional>
#include <string>
#include <vector>

struct InstallOptions {
    std::vector<std::string> packages;
    std::optional<std::string> requirement_file;
    bool force = false;
    bool upgrade = false;
    bool no_deps = false;
    std::optional<std::string> index_url;
    std::optional<std::string> extra_index_url;
    std::optional<std::string> trusted_host;
    std::string pip_executable = "pip";
};

// Validates specifiers one by one, stopping at the first block. Returns true if all passed.
bool validate_packages(const std::vector<std::string>& package_specs, ValidationClient& client);

std::vector<std::string> build_pip_args(const InstallOptions& options);
void report_blocked_packages(const BlockedPackageReport& report);

// Each returns the process exit code. All firewall traffic goes through `http`.
int install_packages(const InstallOptions& options, HttpClient& http, const FirewallConfig& config);
int audit_package(const std::string& package_spec, HttpClient& http, const FirewallConfig& config);
int check_firewall(HttpClient& http, const FirewallConfig& config);
