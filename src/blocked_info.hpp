#pragma once

#include "config.hpp"
#include "http_client.hpp"

#include <string>
#include <string_view>
#include <vector>

enum class BlockedStatus {
    BLOCKED,
    ALLOWED,
    UNKNOWN,
    ERROR
};

enum class BlockedErrorKind {
    NONE,
    CONNECTION_ERROR,
    TIMEOUT,
    UNEXPECTED_STATUS,
    MALFORMED_RESPONSE
};

inline constexpr std::string_view WILDCARD_VERSION = "*";

struct BlockedInfo {
    std::string package;
    BlockedStatus status = BlockedStatus::UNKNOWN;
    long blocked_version_count = 0;
    std::vector<std::string> blocked_versions_list;
    std::vector<std::string> reasons;
    std::string raw_response;

    // Only meaningful for UNKNOWN and ERROR
    BlockedErrorKind error_kind = BlockedErrorKind::NONE;
    long status_code = 0;
    std::string error;

    bool has_wildcard() const;
    bool blocks_version(const std::string& version) const;
};

std::string_view to_string(BlockedStatus status);

// Asks the firewall's detail endpoint why a package is blocked. Never throws.
class BlockedInfoResolver {
public:
    BlockedInfoResolver(HttpClient& http, const FirewallConfig& config);

    BlockedInfo get_blocked_info(const std::string& package_name);

private:
    BlockedInfo parse_detail_body(BlockedInfo info, std::string body, const std::string& url) const;

    HttpClient& http_;
    const FirewallConfig& config_;
};
