#include "uvm/store/lock_map.hpp"

#include "uvm/logging.hpp"

#include <QString>

#include <stdexcept>

namespace uvm::store {

void ResourceMutex::lock() {
    mutex_.lock();
    held_.store(true, std::memory_order_release);
}

void ResourceMutex::unlock() {
    held_.store(false, std::memory_order_release);
    mutex_.unlock();
}

bool ResourceMutex::try_lock() {
    if (!mutex_.try_lock()) {
        return false;
    }
    held_.store(true, std::memory_order_release);
    return true;
}

BoundedLockMap::BoundedLockMap(std::size_t maxSize) : maxSize_(maxSize) {
    if (maxSize < 1) {
        throw std::invalid_argument("BoundedLockMap max size must be at least 1");
    }
}

bool BoundedLockMap::busy(const Slot& slot) {
    // The map holds one reference; any other is a caller that may be about to lock.
    return slot.mutex->locked() || slot.mutex.use_count() > 1;
}

std::shared_ptr<ResourceMutex> BoundedLockMap::get(const std::string& key) {
    std::lock_guard guard(bookkeeping_);

    std::shared_ptr<ResourceMutex> mutex;
    if (const auto it = index_.find(key); it != index_.end()) {
        order_.splice(order_.end(), order_, it->second);
        mutex = it->second->mutex;
    } else {
        order_.push_back({key, std::make_shared<ResourceMutex>()});
        index_.emplace(key, std::prev(order_.end()));
        mutex = order_.back().mutex;
    }
    // Entries released since the last call may now be evictable.
    evict_locked(key);
    return mutex;
}

void BoundedLockMap::evict_locked(const std::string& keep) {
    auto it = order_.begin();
    while (order_.size() > maxSize_ && it != order_.end()) {
        if (it->key == keep || busy(*it)) {
            ++it;
            continue;
        }
        qCDebug(lcUvmStore).noquote() << "evicting idle lock" << QString::fromStdString(it->key);
        index_.erase(it->key);
        it = order_.erase(it);
    }
}

bool BoundedLockMap::discard(const std::string& key) {
    std::lock_guard guard(bookkeeping_);

    const auto it = index_.find(key);
    if (it == index_.end() || busy(*it->second)) {
        return false;
    }
    order_.erase(it->second);
    index_.erase(it);
    return true;
}

bool BoundedLockMap::contains(const std::string& key) const {
    std::lock_guard guard(bookkeeping_);
    return index_.contains(key);
}

std::size_t BoundedLockMap::size() const {
    std::lock_guard guard(bookkeeping_);
    return order_.size();
}

}  // namespace uvm::store
