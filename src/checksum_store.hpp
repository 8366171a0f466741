#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

struct ChecksumRecord {
    std::string checksum; // hex md5
    uint64_t length = 0;
    std::chrono::steady_clock::time_point expires_at;
};

// Expiring file_id -> checksum map shared by every registry connection.
// One mutex covers the whole map. Expiry is lazy: a record is treated as
// gone once now > expires_at and is erased when a lookup observes that.
class ChecksumStore {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    ChecksumStore();
    explicit ChecksumStore(Clock clock);

    // Last write wins.
    void register_checksum(const std::string& file_id,
                           std::chrono::seconds ttl,
                           uint64_t length,
                           const std::string& checksum);

    std::optional<ChecksumRecord> lookup(const std::string& file_id);

    // Drops every expired record; returns how many were removed.
    std::size_t sweep_expired();

    std::size_t size();

private:
    bool expired(const ChecksumRecord& record,
                 std::chrono::steady_clock::time_point now) const {
        return now > record.expires_at;
    }

    Clock clock_;
    std::mutex m_;
    std::unordered_map<std::string, ChecksumRecord> map_; // file_id -> record
};
