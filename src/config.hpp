#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

// Global variables for paths (initially set to defaults, but can be modified)
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path FIREWALL_CONF;
extern std::filesystem::path L10N_DIR;

inline constexpr const char* DEFAULT_FIREWALL_URL = "http://127.0.0.1:8000";
inline constexpr const char* FIREWALL_URL_ENV = "PIPWALL_FIREWALL_URL";

// Resolved once per invocation and handed to every firewall component.
struct FirewallConfig {
    std::string base_url = DEFAULT_FIREWALL_URL;
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds probe_timeout{5000};
};

// Functions
void set_config_dir(const std::string& config_dir);
std::string normalize_base_url(std::string url);
std::optional<std::string> read_firewall_conf();

// Precedence: explicit override, then PIPWALL_FIREWALL_URL, then firewall.conf, then the default.
FirewallConfig load_firewall_config(const std::optional<std::string>& url_override = std::nullopt);
