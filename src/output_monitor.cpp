#include "output_monitor.hpp"
#include "utils.hpp"

#include <array>
#include <regex>
#include <string_view>

namespace {

constexpr std::array<std::string_view, 2> BLOCK_MARKERS = {
    "HTTP error 403",
    "403 Client Error: Forbidden",
};

} // namespace

bool BlockedPackageSet::insert(BlockedPackageRecord record) {
    if (!seen_.emplace(record.name, record.version).second) {
        return false;
    }
    ordered_.push_back(std::move(record));
    return true;
}

bool BlockedPackageSet::contains(const BlockedPackageRecord& record) const {
    return seen_.count({record.name, record.version}) > 0;
}

bool is_block_signal(const std::string& line) {
    for (const auto marker : BLOCK_MARKERS) {
        if (line.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::optional<BlockedPackageRecord> extract_blocked_package(const std::string& line) {
    // Group 1: Name
    // Group 2: Version, digits and dots with an optional alphanumeric tail
    // Names with a digit-led hyphenated segment can mis-split; kept as is so no detection is lost.
    static const std::regex package_url_regex(R"(/packages/([a-zA-Z0-9_-]+)-([\d\.]+[a-zA-Z0-9\.]*))");
    std::smatch match;
    if (std::regex_search(line, match, package_url_regex)) {
        return BlockedPackageRecord{to_lower(match[1].str()), match[2].str()};
    }
    return std::nullopt;
}

InstallOutputMonitor::InstallOutputMonitor(std::ostream& out) : out_(out) {}

void InstallOutputMonitor::observe(const std::string& line) {
    out_ << line << '\n' << std::flush;

    if (!is_block_signal(line)) return;
    ++signal_count_;
    if (auto record = extract_blocked_package(line)) {
        blocked_.insert(std::move(*record));
    }
}

std::optional<BlockedPackageReport> InstallOutputMonitor::finalize(int exit_code) const {
    if (blocked_.empty() || exit_code == 0) {
        return std::nullopt;
    }
    return BlockedPackageReport{blocked_.records(), blocked_.size()};
}
