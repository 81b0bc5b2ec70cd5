// === Lock Table ==============================================================
//
// Hands out one mutex per key so callers can serialize work on a single
// gateway or device without blocking unrelated keys. Entries live only while
// some guard holds or waits on them, so the table stays as small as the set
// of keys under contention.

#pragma once

#include <map>
#include <memory>
#include <mutex>

namespace device_pool {

template <typename Key>
class LockTable final {
  public:
    /** @brief Mutex dedicated to @p key; created on first use. */
    [[nodiscard]] std::shared_ptr<std::mutex> mutex_for(const Key& key) {
        std::scoped_lock lock(mutex_);
        auto& entry = map_mutexes_[key];
        if (entry == nullptr) {
            entry = std::make_shared<std::mutex>();
        }
        return entry;
    }

    /**
     * @brief Drop the entry for @p key once nobody outside the table references it.
     *
     * Copies are only handed out under the table mutex, so a use count of one
     * seen here cannot grow before the erase.
     */
    void release(const Key& key) {
        std::scoped_lock lock(mutex_);
        const auto iterator_entry = map_mutexes_.find(key);
        if (iterator_entry != map_mutexes_.end() && iterator_entry->second.use_count() == 1) {
            map_mutexes_.erase(iterator_entry);
        }
    }

    [[nodiscard]] std::size_t size() const {
        std::scoped_lock lock(mutex_);
        return map_mutexes_.size();
    }

  private:
    mutable std::mutex mutex_;
    std::map<Key, std::shared_ptr<std::mutex>> map_mutexes_;
};

/** @brief RAII guard holding the per-key mutex for the guard's scope. */
template <typename Key>
class KeyedLock final {
  public:
    KeyedLock(LockTable<Key>& table, const Key& key)
        : table_(table),
          key_(key),
          mutex_(table.mutex_for(key)),
          lock_(*mutex_) {}

    ~KeyedLock() {
        lock_.unlock();
        mutex_.reset();
        table_.release(key_);
    }

    KeyedLock(const KeyedLock&) = delete;
    KeyedLock& operator=(const KeyedLock&) = delete;

  private:
    LockTable<Key>& table_;
    Key key_;
    std::shared_ptr<std::mutex> mutex_;
    std::unique_lock<std::mutex> lock_;
};

}  // namespace device_pool
