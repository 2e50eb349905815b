#ifndef CHUNKVAULT_LOCK_TABLE_H
#define CHUNKVAULT_LOCK_TABLE_H

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace chunkvault {

/**
 * @brief One mutex per live key, created on demand.
 *
 * acquire() hands out a Lease that pins the key's mutex; the entry is
 * erased when the last lease for it goes away, so the table only holds keys
 * somebody is using or waiting on. Distinct keys never share a mutex.
 *
 * Lock through the lease and declare the lock after it:
 * @code
 *   auto lease = table.acquire(key);
 *   std::lock_guard<std::mutex> lock(lease.mutex());
 * @endcode
 */
template <typename Mutex> class LockTable {
  struct Slot {
    Mutex mutex;
    std::size_t holders{0};
  };
  using Map = std::map<std::string, Slot, std::less<>>;

public:
  class Lease {
  public:
    Lease(Lease &&other) noexcept : table_(other.table_), slot_(other.slot_) {
      other.table_ = nullptr;
    }
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;
    Lease &operator=(Lease &&) = delete;
    ~Lease() {
      if (table_)
        table_->release(slot_);
    }

    Mutex &mutex() const { return slot_->second.mutex; }

  private:
    friend class LockTable;
    Lease(LockTable *table, typename Map::iterator slot)
        : table_(table), slot_(slot) {}

    LockTable *table_;
    typename Map::iterator slot_;
  };

  LockTable() = default;
  LockTable(const LockTable &) = delete;
  LockTable &operator=(const LockTable &) = delete;

  Lease acquire(std::string_view key) {
    std::lock_guard<std::mutex> guard(guard_);
    auto it = slots_.find(key);
    if (it == slots_.end())
      it = slots_.try_emplace(std::string(key)).first;
    ++it->second.holders;
    return Lease(this, it);
  }

  /// Leases currently outstanding for @p key.
  std::size_t holders(std::string_view key) const {
    std::lock_guard<std::mutex> guard(guard_);
    auto it = slots_.find(key);
    return it == slots_.end() ? 0 : it->second.holders;
  }

  /// Number of keys with at least one outstanding lease.
  std::size_t size() const {
    std::lock_guard<std::mutex> guard(guard_);
    return slots_.size();
  }

private:
  void release(typename Map::iterator slot) noexcept {
    std::lock_guard<std::mutex> guard(guard_);
    if (--slot->second.holders == 0)
      slots_.erase(slot);
  }

  mutable std::mutex guard_;
  Map slots_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_LOCK_TABLE_H
