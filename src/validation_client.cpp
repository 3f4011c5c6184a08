#include "validation_client.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace {

ValidationResult allow(std::string reason, ValidationDetails details) {
    return {ValidationStatus::ALLOW, std::move(reason), std::move(details)};
}

ValidationResult block(FailureKind kind, std::string reason, ValidationDetails details) {
    details.failure = kind;
    return {ValidationStatus::BLOCK, std::move(reason), std::move(details)};
}

FailureKind failure_from(BlockedErrorKind kind) {
    switch (kind) {
        case BlockedErrorKind::TIMEOUT: return FailureKind::TIMEOUT;
        case BlockedErrorKind::UNEXPECTED_STATUS: return FailureKind::UNEXPECTED_STATUS;
        case BlockedErrorKind::MALFORMED_RESPONSE: return FailureKind::MALFORMED_RESPONSE;
        case BlockedErrorKind::CONNECTION_ERROR:
        case BlockedErrorKind::NONE:
            break;
    }
    return FailureKind::CONNECTION_ERROR;
}

} // namespace

ValidationClient::ValidationClient(HttpClient& http, const FirewallConfig& config)
    : http_(http), config_(config), resolver_(http, config) {}

std::string ValidationClient::audit_url(const std::string& package_name) const {
    return config_.base_url + "/blocked/" + to_lower(package_name);
}

ValidationResult ValidationClient::validate(const std::string& package_name, const std::optional<std::string>& version) {
    try {
        return validate_unchecked(package_name, version);
    } catch (const std::exception& e) {
        ValidationDetails details;
        details.package = to_lower(package_name);
        details.audit_url = audit_url(package_name);
        return block(FailureKind::CONNECTION_ERROR, string_format("reason.validation_error", e.what()), std::move(details));
    }
}

ValidationResult ValidationClient::validate_unchecked(const std::string& package_name, const std::optional<std::string>& version) {
    ValidationDetails details;
    details.package = to_lower(package_name);
    details.audit_url = audit_url(details.package);

    const std::string url = config_.base_url + "/simple/" + details.package + "/";
    HttpOutcome outcome = http_.get(url, config_.request_timeout);

    if (const auto* failure = std::get_if<TransportError>(&outcome)) {
        switch (failure->kind) {
            case TransportErrorKind::CONNECT:
                return block(FailureKind::CONNECTION_ERROR,
                             string_format("reason.connection_error", config_.base_url), std::move(details));
            case TransportErrorKind::TIMEOUT:
                return block(FailureKind::TIMEOUT,
                             string_format("reason.timeout", config_.request_timeout.count()), std::move(details));
            case TransportErrorKind::OTHER:
                break;
        }
        return block(FailureKind::CONNECTION_ERROR,
                     string_format("reason.transport_error", failure->message), std::move(details));
    }

    const long status = std::get<HttpResponse>(outcome).status;
    details.status_code = status;

    switch (status) {
        case 403: {
            BlockedInfo info = resolver_.get_blocked_info(details.package);
            std::string reason = join(info.reasons, "; ");
            if (reason.empty()) {
                reason = get_string("reason.blocked_by_policy");
            }
            details.blocked_info = std::move(info);
            return block(FailureKind::BLOCKED, std::move(reason), std::move(details));
        }
        case 404:
            return block(FailureKind::NOT_FOUND, get_string("reason.not_found"), std::move(details));
        case 200:
            if (version) {
                return check_version(std::move(details), *version);
            }
            return allow(get_string("reason.passed"), std::move(details));
        default:
            return block(FailureKind::UNEXPECTED_STATUS,
                         string_format("reason.unexpected_status", status), std::move(details));
    }
}

ValidationResult ValidationClient::check_version(ValidationDetails details, const std::string& version) {
    BlockedInfo info = resolver_.get_blocked_info(details.package);

    if (info.status == BlockedStatus::ERROR || info.status == BlockedStatus::UNKNOWN) {
        // Cannot prove the pinned version is clean
        const FailureKind kind = failure_from(info.error_kind);
        std::string reason = string_format("reason.detail_unavailable", info.error);
        details.blocked_info = std::move(info);
        return block(kind, std::move(reason), std::move(details));
    }

    if (info.blocks_version(version)) {
        auto it = std::find_if(info.reasons.begin(), info.reasons.end(),
                               [&](const std::string& r) { return r.find(version) != std::string::npos; });
        std::string reason = it != info.reasons.end() && !it->empty()
            ? *it
            : string_format("reason.version_blocked", version);
        details.blocked_info = std::move(info);
        return block(FailureKind::BLOCKED, std::move(reason), std::move(details));
    }

    details.blocked_info = std::move(info);
    return allow(get_string("reason.passed"), std::move(details));
}
