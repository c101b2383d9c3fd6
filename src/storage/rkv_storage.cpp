#include "storage/rkv_storage.hpp"
#include <limits>

namespace rkv {

namespace {

// now + ttl，溢出时截断到int64边界
TimestampMs addTtl(TimestampMs now, int64_t ttl_ms) {
    if (ttl_ms > 0 && now > std::numeric_limits<TimestampMs>::max() - ttl_ms) {
        return std::numeric_limits<TimestampMs>::max();
    }
    if (ttl_ms < 0 && now < std::numeric_limits<TimestampMs>::min() - ttl_ms) {
        return std::numeric_limits<TimestampMs>::min();
    }
    return now + ttl_ms;
}

} // namespace

void StorageEngine::set(const Key& key, const Value& value, std::optional<int64_t> ttl_ms) {
    TimestampMs expire_at = addTtl(Utils::getCurrentTimeMs(), ttl_ms.value_or(DEFAULT_TTL_MS));
    StoredEntry entry(value, expire_at);

    auto lock = wlock();
    data_.insert_or_assign(key, std::move(entry));
}

std::optional<Value> StorageEngine::get(const Key& key) const {
    auto lock = rlock();
    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    if (it->second.isExpired(Utils::getCurrentTimeMs())) {
        return std::nullopt;
    }
    return it->second.value;
}

size_t StorageEngine::size() const {
    auto lock = rlock();
    return data_.size();
}

} // namespace rkv
