#include "blocked_info.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <utility>

using json = nlohmann::json;

bool BlockedInfo::has_wildcard() const {
    return std::find(blocked_versions_list.begin(), blocked_versions_list.end(), WILDCARD_VERSION)
        != blocked_versions_list.end();
}

bool BlockedInfo::blocks_version(const std::string& version) const {
    if (status != BlockedStatus::BLOCKED) return false;
    return has_wildcard()
        || std::find(blocked_versions_list.begin(), blocked_versions_list.end(), version) != blocked_versions_list.end();
}

std::string_view to_string(BlockedStatus status) {
    switch (status) {
        case BlockedStatus::BLOCKED: return "blocked";
        case BlockedStatus::ALLOWED: return "allowed";
        case BlockedStatus::UNKNOWN: return "unknown";
        case BlockedStatus::ERROR: return "error";
    }
    return "unknown";
}

BlockedInfoResolver::BlockedInfoResolver(HttpClient& http, const FirewallConfig& config)
    : http_(http), config_(config) {}

BlockedInfo BlockedInfoResolver::get_blocked_info(const std::string& package_name) {
    BlockedInfo info;
    info.package = to_lower(package_name);
    const std::string url = config_.base_url + "/blocked/" + info.package;

    HttpOutcome outcome = http_.get(url, config_.request_timeout);

    if (const auto* failure = std::get_if<TransportError>(&outcome)) {
        info.status = BlockedStatus::ERROR;
        switch (failure->kind) {
            case TransportErrorKind::CONNECT:
                info.error_kind = BlockedErrorKind::CONNECTION_ERROR;
                info.error = string_format("error.cannot_connect", config_.base_url);
                break;
            case TransportErrorKind::TIMEOUT:
                info.error_kind = BlockedErrorKind::TIMEOUT;
                info.error = string_format("error.request_timeout", url);
                break;
            case TransportErrorKind::OTHER:
                info.error_kind = BlockedErrorKind::CONNECTION_ERROR;
                info.error = string_format("error.request_failed", url, failure->message);
                break;
        }
        return info;
    }

    auto& response = std::get<HttpResponse>(outcome);
    switch (response.status) {
        case 404:
            info.status = BlockedStatus::ALLOWED;
            return info;
        case 200:
            return parse_detail_body(std::move(info), std::move(response.body), url);
        default:
            info.status = BlockedStatus::UNKNOWN;
            info.error_kind = BlockedErrorKind::UNEXPECTED_STATUS;
            info.status_code = response.status;
            info.error = string_format("error.unexpected_status", response.status);
            return info;
    }
}

BlockedInfo BlockedInfoResolver::parse_detail_body(BlockedInfo info, std::string body, const std::string& url) const {
    auto malformed = [&](const std::string& what) {
        info.status = BlockedStatus::ERROR;
        info.error_kind = BlockedErrorKind::MALFORMED_RESPONSE;
        info.error = string_format("error.malformed_response", url, what);
        return info;
    };

    json data = json::parse(body, nullptr, false);
    if (data.is_discarded()) {
        return malformed(get_string("error.invalid_json"));
    }
    if (!data.is_object()) {
        return malformed(get_string("error.json_not_object"));
    }

    try {
        if (auto it = data.find("blocked_versions"); it != data.end() && !it->is_null()) {
            info.blocked_version_count = it->get<long>();
        }
        if (auto it = data.find("blocked_versions_list"); it != data.end() && !it->is_null()) {
            info.blocked_versions_list = it->get<std::vector<std::string>>();
        }
        if (auto it = data.find("reasons"); it != data.end() && !it->is_null()) {
            info.reasons = it->get<std::vector<std::string>>();
        }
    } catch (const json::exception& e) {
        return malformed(e.what());
    }

    if (info.blocked_version_count < 0) {
        return malformed(get_string("error.negative_count"));
    }

    info.raw_response = std::move(body);
    info.blocked_version_count = std::max<long>(info.blocked_version_count,
                                                static_cast<long>(info.blocked_versions_list.size()));

    // A detail record that blocks nothing is not a block
    info.status = info.blocked_version_count > 0 || info.has_wildcard()
        ? BlockedStatus::BLOCKED
        : BlockedStatus::ALLOWED;
    return info;
}
