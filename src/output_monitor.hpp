#pragma once

#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

struct BlockedPackageRecord {
    std::string name;    // lower-cased
    std::string version; // as extracted

    bool operator==(const BlockedPackageRecord&) const = default;
};

// Insertion-ordered set keyed by (name, version).
class BlockedPackageSet {
public:
    // Returns false if the record was already present.
    bool insert(BlockedPackageRecord record);
    bool contains(const BlockedPackageRecord& record) const;

    const std::vector<BlockedPackageRecord>& records() const { return ordered_; }
    size_t size() const { return ordered_.size(); }
    bool empty() const { return ordered_.empty(); }

private:
    std::vector<BlockedPackageRecord> ordered_;
    std::set<std::pair<std::string, std::string>> seen_;
};

struct BlockedPackageReport {
    std::vector<BlockedPackageRecord> packages;
    size_t count = 0;
};

bool is_block_signal(const std::string& line);

// Pulls "name-version" out of a ".../packages/<name>-<version>-..." URL on the line.
std::optional<BlockedPackageRecord> extract_blocked_package(const std::string& line);

// Forwards installer output line by line and watches it for firewall 403s.
class InstallOutputMonitor {
public:
    explicit InstallOutputMonitor(std::ostream& out);

    void observe(const std::string& line);

    // Report only if something was blocked and the installer actually failed.
    std::optional<BlockedPackageReport> finalize(int exit_code) const;

    const BlockedPackageSet& blocked() const { return blocked_; }
    size_t signal_count() const { return signal_count_; }

private:
    std::ostream& out_;
    BlockedPackageSet blocked_;
    size_t signal_count_ = 0;
};
