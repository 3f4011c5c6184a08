#pragma once

#include "config.hpp"
#include "http_client.hpp"

class ConnectivityProbe {
public:
    ConnectivityProbe(HttpClient& http, const FirewallConfig& config);

    // True when the firewall answers 200 or 404 on its index root. Never throws.
    bool check_connectivity();

private:
    HttpClient& http_;
    const FirewallConfig& config_;
};
