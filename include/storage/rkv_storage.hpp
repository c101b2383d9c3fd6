#pragma once

#include "../rkv_core.hpp"
#include <optional>
#include <shared_mutex>
#include <mutex>
#include <unordered_map>

namespace rkv {

// 存储条目：值和绝对过期时间
struct StoredEntry {
    Value value;
    TimestampMs expire_at;

    StoredEntry() : expire_at(0) {}
    StoredEntry(const Value& v, TimestampMs expire) : value(v), expire_at(expire) {}

    bool isExpired(TimestampMs now) const {
        return now >= expire_at;
    }
};

// 存储引擎：带惰性过期的并发哈希表
// 读操作持有共享锁互不阻塞，写操作持有独占锁
// 过期键只在访问时判定，不会被主动删除，直到被下一次SET覆盖
class StorageEngine {
public:
    // 未指定TTL时的默认有效期：一年
    static constexpr int64_t DEFAULT_TTL_MS = 365LL * 24 * 60 * 60 * 1000;

    StorageEngine() = default;
    StorageEngine(const StorageEngine&) = delete;
    StorageEngine& operator=(const StorageEngine&) = delete;

    // 插入或覆盖，ttl_ms为空时使用默认有效期
    void set(const Key& key, const Value& value, std::optional<int64_t> ttl_ms = std::nullopt);

    // 获取未过期的值
    std::optional<Value> get(const Key& key) const;

    // 物理行数（包含已过期但未被覆盖的行）
    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<Key, StoredEntry> data_;

    std::unique_lock<std::shared_mutex> wlock() const {
        return std::unique_lock<std::shared_mutex>(mutex_);
    }

    std::shared_lock<std::shared_mutex> rlock() const {
        return std::shared_lock<std::shared_mutex>(mutex_);
    }
};

} // namespace rkv
