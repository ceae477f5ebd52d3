#pragma once

#include <atomic>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace uvm::store {

// A mutex whose held state can be observed without acquiring it.
class ResourceMutex {
public:
    void lock();
    void unlock();
    bool try_lock();

    [[nodiscard]] bool locked() const { return held_.load(std::memory_order_acquire); }

private:
    std::mutex mutex_;
    std::atomic<bool> held_{false};
};

// Per-resource mutexes, bounded by LRU eviction.
//
// An entry is busy while its mutex is held or while a caller still owns a
// handle returned by get(), locked or not. Busy entries are never evicted or
// discarded. After get() returns, size() <= max_size() + the number of busy
// entries, so a handle kept without locking counts against the bound just as
// a held lock does.
class BoundedLockMap {
public:
    static constexpr std::size_t kDefaultMaxSize = 1024;

    explicit BoundedLockMap(std::size_t maxSize = kDefaultMaxSize);

    BoundedLockMap(const BoundedLockMap&) = delete;
    BoundedLockMap& operator=(const BoundedLockMap&) = delete;

    // Returns the mutex for key, creating it if absent, and marks it most recently used.
    std::shared_ptr<ResourceMutex> get(const std::string& key);

    // Drops the entry for key unless it is busy. Returns whether it was removed.
    bool discard(const std::string& key);

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t max_size() const { return maxSize_; }

private:
    struct Slot {
        std::string key;
        std::shared_ptr<ResourceMutex> mutex;
    };
    using Order = std::list<Slot>;

    static bool busy(const Slot& slot);
    void evict_locked(const std::string& keep);

    std::size_t maxSize_;
    mutable std::mutex bookkeeping_;
    // Front is least recently used.
    Order order_;
    std::unordered_map<std::string, Order::iterator> index_;
};

}  // namespace uvm::store
