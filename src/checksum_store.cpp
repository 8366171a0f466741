#include "checksum_store.hpp"

ChecksumStore::ChecksumStore()
: ChecksumStore([](){ return std::chrono::steady_clock::now(); })
{
}

ChecksumStore::ChecksumStore(Clock clock)
: clock_(std::move(clock))
{
}

void ChecksumStore::register_checksum(const std::string& file_id,
                                      std::chrono::seconds ttl,
                                      uint64_t length,
                                      const std::string& checksum){
    ChecksumRecord rec;
    rec.checksum = checksum;
    rec.length = length;
    std::lock_guard lg(m_);
    rec.expires_at = clock_() + ttl;
    map_[file_id] = std::move(rec);
}

std::optional<ChecksumRecord> ChecksumStore::lookup(const std::string& file_id){
    std::lock_guard lg(m_);
    auto it = map_.find(file_id);
    if(it == map_.end()) return std::nullopt;
    if(expired(it->second, clock_())) {
        map_.erase(it);
        return std::nullopt;
    }
    return it->second;
}

std::size_t ChecksumStore::sweep_expired(){
    std::lock_guard lg(m_);
    auto now = clock_();
    std::size_t removed = 0;
    for(auto it = map_.begin(); it != map_.end();) {
        if(expired(it->second, now)) {
            it = map_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t ChecksumStore::size(){
    std::lock_guard lg(m_);
    return map_.size();
}
