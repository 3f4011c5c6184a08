#include "connectivity_probe.hpp"

#include <exception>

ConnectivityProbe::ConnectivityProbe(HttpClient& http, const FirewallConfig& config)
    : http_(http), config_(config) {}

bool ConnectivityProbe::check_connectivity() {
    try {
        HttpOutcome outcome = http_.get(config_.base_url + "/simple/", config_.probe_timeout);
        if (const auto* response = std::get_if<HttpResponse>(&outcome)) {
            return response->status == 200 || response->status == 404;
        }
        return false;
    } catch (const std::exception&) {
        return false;
    }
}
