#pragma once

#include "blocked_info.hpp"
#include "config.hpp"
#include "http_client.hpp"

#include <optional>
#include <string>

enum class ValidationStatus {
    ALLOW,
    BLOCK
};

enum class FailureKind {
    NOT_FOUND,
    BLOCKED,
    CONNECTION_ERROR,
    TIMEOUT,
    UNEXPECTED_STATUS,
    MALFORMED_RESPONSE
};

struct ValidationDetails {
    std::string package;
    std::string audit_url;
    std::optional<FailureKind> failure;
    std::optional<long> status_code;
    std::optional<BlockedInfo> blocked_info;
};

struct ValidationResult {
    ValidationStatus status = ValidationStatus::BLOCK;
    std::string reason;
    ValidationDetails details;

    bool allowed() const { return status == ValidationStatus::ALLOW; }
};

// Fail-closed verdicts: anything that is not a positive answer from the firewall is a block.
class ValidationClient {
public:
    ValidationClient(HttpClient& http, const FirewallConfig& config);

    // Never throws.
    ValidationResult validate(const std::string& package_name, const std::optional<std::string>& version = std::nullopt);

    std::string audit_url(const std::string& package_name) const;

private:
    ValidationResult validate_unchecked(const std::string& package_name, const std::optional<std::string>& version);
    ValidationResult check_version(ValidationDetails details, const std::string& version);

    HttpClient& http_;
    const FirewallConfig& config_;
    BlockedInfoResolver resolver_;
};
