#include "config.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

fs::path CONFIG_DIR = PIPWALL_CONF_DIR;
fs::path FIREWALL_CONF = fs::path(PIPWALL_CONF_DIR) / "firewall.conf";
fs::path L10N_DIR = PIPWALL_L10N_DIR;

void set_config_dir(const std::string& config_dir) {
    CONFIG_DIR = fs::path(config_dir).lexically_normal();
    if (CONFIG_DIR.empty()) CONFIG_DIR = PIPWALL_CONF_DIR;
    FIREWALL_CONF = CONFIG_DIR / "firewall.conf";
}

std::string normalize_base_url(std::string url) {
    url = trim(url);
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::optional<std::string> read_firewall_conf() {
    std::ifstream conf(FIREWALL_CONF);
    if (!conf.is_open()) {
        return std::nullopt;
    }
    std::string line;
    while (std::getline(conf, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        return line;
    }
    log_warning(string_format("warning.empty_firewall_conf", FIREWALL_CONF.string()));
    return std::nullopt;
}

FirewallConfig load_firewall_config(const std::optional<std::string>& url_override) {
    FirewallConfig config;

    std::string url;
    if (url_override && !trim(*url_override).empty()) {
        url = *url_override;
    } else if (const char* env = std::getenv(FIREWALL_URL_ENV); env && *env) {
        url = env;
    } else if (auto from_file = read_firewall_conf()) {
        url = *from_file;
    } else {
        url = DEFAULT_FIREWALL_URL;
    }

    config.base_url = normalize_base_url(url);
    if (config.base_url.empty()) {
        throw PipwallException(string_format("error.invalid_firewall_url", url));
    }
    return config;
}
