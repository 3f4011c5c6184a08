#include "localization.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <iostream>
#include <fstream>
#include <unordered_map>
#include <cstdlib>
#include <string>

namespace {
    // Built-in English strings; <L10N_DIR>/<lang>.txt overrides them key by key.
    const std::unordered_map<std::string, std::string> default_strings = {
        {"info.log_prefix", "==> "},
        {"warning.prefix", "Warning:"},
        {"error.prefix", "Error:"},

        {"info.usage", "<command> [options] [packages...]"},
        {"info.commands", "Commands:"},
        {"info.install_desc", "  install <pkg...> | -r <file>   Validate packages against the firewall, then run pip install"},
        {"info.audit_desc", "  audit <pkg>                    Show whether a package is blocked and why"},
        {"info.check_desc", "  check [--url <url>]            Check that the firewall is reachable"},
        {"info.version", "pipwall version {}"},
        {"help.help", "Show this help message"},
        {"help.version", "Show version"},
        {"help.force", "Skip security validation (use with caution)"},
        {"help.upgrade", "Upgrade package to the newest available version"},
        {"help.requirement", "Install from the given requirements file"},
        {"help.index_url", "Base URL of the Python Package Index"},
        {"help.extra_index_url", "Extra URLs of package indexes to use in addition to --index-url"},
        {"help.trusted_host", "Mark this host as trusted"},
        {"help.no_deps", "Don't install package dependencies"},
        {"help.pip", "pip executable to run"},
        {"help.url", "Firewall API URL (defaults to PIPWALL_FIREWALL_URL or http://127.0.0.1:8000)"},

        {"reason.passed", "passed validation"},
        {"reason.not_found", "package not found in index"},
        {"reason.blocked_by_policy", "blocked by firewall policy"},
        {"reason.version_blocked", "version {} is blocked"},
        {"reason.connection_error", "connection error: cannot connect to firewall at {}"},
        {"reason.timeout", "timeout: firewall did not answer within {} ms"},
        {"reason.transport_error", "connection error: {}"},
        {"reason.unexpected_status", "unexpected response from firewall: {}"},
        {"reason.detail_unavailable", "could not verify blocked versions: {}"},
        {"reason.validation_error", "validation error: {}"},

        {"info.checking_package", "Checking {}..."},
        {"info.package_passed", "{} passed security validation"},
        {"info.latest_version", "latest"},
        {"info.blocked_title", "Installation blocked"},
        {"info.blocked_package", "  Package: {}"},
        {"info.blocked_version", "  Version: {}"},
        {"info.blocked_reason", "  Reason:  {}"},
        {"info.blocked_details", "  For details: curl {}"},
        {"info.blocked_version_count", "{} version(s)"},
        {"info.blocked_versions", "Blocked versions: {}"},
        {"info.blocked_entry", "  x {}=={}"},
        {"info.no_specific_reason", "No specific reason provided"},
        {"info.package_allowed", "Package '{}' is allowed"},
        {"info.no_versions_blocked", "No versions are currently blocked by the firewall"},
        {"info.installing", "Installing {}"},
        {"info.audit_hint", "For details, run: pipwall audit {}"},
        {"info.checking_connectivity", "Checking firewall connectivity..."},
        {"info.firewall_reachable", "Firewall is reachable at {}"},
        {"info.start_firewall_hint", "Make sure the package firewall is running"},

        {"warning.skipping_validation", "Skipping security validation (--force flag used)"},
        {"warning.package_status", "Package status: {} ({})"},
        {"warning.empty_firewall_conf", "{} has no firewall URL, ignoring it"},
        {"warning.l10n_fallback", "Could not open localization file for {}, falling back to English."},

        {"error.cmd_parse_error", "Command line parse error: {}"},
        {"error.pipwall_error", "{}"},
        {"error.unexpected_error", "Unexpected error: {}"},
        {"error.invalid_arg_count", "Invalid number of arguments"},
        {"error.invalid_firewall_url", "Invalid firewall URL: '{}'"},
        {"error.no_packages", "No packages specified. Use 'pipwall install <package>' or '-r requirements.txt'"},
        {"error.install_aborted", "Installation aborted due to security policy violations"},
        {"error.firewall_blocked_count", "Firewall blocked {} package(s)"},
        {"error.firewall_unreachable", "Firewall is not reachable at {}"},
        {"error.audit_failed", "Error checking package: {}"},
        {"error.empty_package_name", "Invalid package specifier '{}': empty package name"},
        {"error.requirements_not_found", "Requirements file not found: {}"},
        {"error.curl_init_failed", "Failed to initialize HTTP client"},
        {"error.cannot_connect", "Cannot connect to firewall at {}"},
        {"error.request_timeout", "Request to {} timed out"},
        {"error.request_failed", "Request to {} failed: {}"},
        {"error.unexpected_status", "Unexpected status code: {}"},
        {"error.malformed_response", "Malformed response from {}: {}"},
        {"error.invalid_json", "body is not valid JSON"},
        {"error.json_not_object", "body is not a JSON object"},
        {"error.negative_count", "blocked_versions is negative"},
        {"error.empty_command", "No command to execute"},
        {"error.pipe_failed", "Failed to create pipe: {}"},
        {"error.fork_failed", "Failed to start process: {}"},
        {"error.exec_failed", "Failed to execute {}: {}"},
        {"error.read_output_failed", "Failed to read process output: {}"},
        {"error.wait_failed", "Failed to wait for process: {}"},
    };

    std::unordered_map<std::string, std::string> translations(default_strings);
    std::unordered_map<std::string, std::string> missing_key_placeholders;
}

void load_strings(const std::string& lang) {
    std::ifstream file(L10N_DIR / (lang + ".txt"));
    if (!file.is_open()) {
        if (lang != "en") {
            log_warning(string_format("warning.l10n_fallback", lang));
        }
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            translations[key] = value;
        }
    }
}

void init_localization() {
    translations = default_strings;
    const char* lang_env = getenv("LANG");
    std::string lang = "en";
    if (lang_env && std::string(lang_env).find("zh") == 0) {
        lang = "zh";
    }
    load_strings(lang);
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
