#ifndef CHUNKVAULT_QUOTA_ACCOUNTANT_H
#define CHUNKVAULT_QUOTA_ACCOUNTANT_H

#include "chunkvault/collaborators.h"
#include "chunkvault/errors.h"
#include "chunkvault/types.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace chunkvault {

/**
 * @brief Per-tenant byte accounting with two-phase reservations.
 *
 * Every tenant has its own mutex guarding `used` (committed bytes) and
 * `pending` (reserved, not yet committed). A positive reservation is granted
 * only while used + pending + delta stays within the ledger limit, so the
 * committed total can never exceed the ceiling no matter how many writers
 * race. Negative deltas are always granted and applied on commit.
 * Operations for different tenants never contend beyond the short lookup of
 * the tenant's account.
 */
class QuotaAccountant {
public:
  /**
   * @brief Outstanding reservation. Rolls back on destruction unless
   * committed, so an abandoned or failed write never leaks quota.
   */
  class Reservation {
  public:
    Reservation() = default;
    Reservation(Reservation &&other) noexcept;
    Reservation &operator=(Reservation &&other) noexcept;
    Reservation(const Reservation &) = delete;
    Reservation &operator=(const Reservation &) = delete;
    ~Reservation();

    /// Make the delta visible in usedBytes. No-op if already finished.
    void commit();
    /// Return the reserved bytes. No-op if already finished.
    void rollback() noexcept;

    std::int64_t delta() const { return delta_; }
    bool active() const { return owner_ != nullptr; }

  private:
    friend class QuotaAccountant;
    Reservation(QuotaAccountant *owner, TenantId tenant, std::int64_t delta)
        : owner_(owner), tenant_(std::move(tenant)), delta_(delta) {}

    QuotaAccountant *owner_{nullptr};
    TenantId tenant_;
    std::int64_t delta_{0};
  };

  explicit QuotaAccountant(const QuotaLedger &ledger);

  QuotaAccountant(const QuotaAccountant &) = delete;
  QuotaAccountant &operator=(const QuotaAccountant &) = delete;

  /// QuotaExceeded when a positive delta would breach the ceiling.
  Result<Reservation> reserve(const TenantId &tenant, std::int64_t delta);

  /// Immediately return bytes (swept chunks, deleted artifacts).
  void release(const TenantId &tenant, std::uint64_t bytes);

  TenantUsage usage(const TenantId &tenant) const;

  /// Replace the committed total after a storage rescan.
  void resetUsage(const TenantId &tenant, std::uint64_t usedBytes);

  std::vector<TenantId> knownTenants() const;

private:
  struct TenantAccount {
    std::mutex mutex;
    std::uint64_t used{0};
    std::uint64_t pending{0};
  };

  TenantAccount &account(const TenantId &tenant) const;
  TenantAccount *findAccount(const TenantId &tenant) const;
  void finish(const TenantId &tenant, std::int64_t delta, bool commit) noexcept;
  void publish(const TenantId &tenant, std::uint64_t used) const;

  const QuotaLedger &ledger_;
  mutable std::mutex accountsMutex_;
  mutable std::unordered_map<TenantId, std::unique_ptr<TenantAccount>>
      accounts_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_QUOTA_ACCOUNTANT_H
