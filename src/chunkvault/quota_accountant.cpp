#include "chunkvault/quota_accountant.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>

namespace chunkvault {

QuotaAccountant::Reservation::Reservation(Reservation &&other) noexcept
    : owner_(other.owner_), tenant_(std::move(other.tenant_)),
      delta_(other.delta_) {
  other.owner_ = nullptr;
}

QuotaAccountant::Reservation &
QuotaAccountant::Reservation::operator=(Reservation &&other) noexcept {
  if (this != &other) {
    rollback();
    owner_ = other.owner_;
    tenant_ = std::move(other.tenant_);
    delta_ = other.delta_;
    other.owner_ = nullptr;
  }
  return *this;
}

QuotaAccountant::Reservation::~Reservation() { rollback(); }

void QuotaAccountant::Reservation::commit() {
  if (!owner_)
    return;
  owner_->finish(tenant_, delta_, true);
  owner_ = nullptr;
}

void QuotaAccountant::Reservation::rollback() noexcept {
  if (!owner_)
    return;
  owner_->finish(tenant_, delta_, false);
  owner_ = nullptr;
}

QuotaAccountant::QuotaAccountant(const QuotaLedger &ledger) : ledger_(ledger) {}

QuotaAccountant::TenantAccount &
QuotaAccountant::account(const TenantId &tenant) const {
  std::lock_guard<std::mutex> lock(accountsMutex_);
  auto &slot = accounts_[tenant];
  if (!slot)
    slot = std::make_unique<TenantAccount>();
  return *slot;
}

QuotaAccountant::TenantAccount *
QuotaAccountant::findAccount(const TenantId &tenant) const {
  std::lock_guard<std::mutex> lock(accountsMutex_);
  auto it = accounts_.find(tenant);
  return it == accounts_.end() ? nullptr : it->second.get();
}

Result<QuotaAccountant::Reservation>
QuotaAccountant::reserve(const TenantId &tenant, std::int64_t delta) {
  auto &acct = account(tenant);
  if (delta <= 0) {
    return Reservation(this, tenant, delta);
  }

  const std::uint64_t limit = ledger_.limitFor(tenant);
  const auto want = static_cast<std::uint64_t>(delta);
  std::lock_guard<std::mutex> lock(acct.mutex);
  const std::uint64_t committedAndPending = acct.used + acct.pending;
  if (committedAndPending > limit || want > limit - committedAndPending) {
    return makeError(ErrorCode::QuotaExceeded,
                     "quota exceeded: " + std::to_string(acct.used) +
                         " used, " + std::to_string(acct.pending) +
                         " pending, " + std::to_string(want) +
                         " requested, limit " + std::to_string(limit));
  }
  acct.pending += want;
  return Reservation(this, tenant, delta);
}

void QuotaAccountant::finish(const TenantId &tenant, std::int64_t delta,
                             bool commit) noexcept {
  auto &acct = account(tenant);
  std::uint64_t used = 0;
  {
    std::lock_guard<std::mutex> lock(acct.mutex);
    if (delta > 0) {
      const auto amount = static_cast<std::uint64_t>(delta);
      acct.pending -= std::min(acct.pending, amount);
      if (commit)
        acct.used += amount;
    } else if (delta < 0 && commit) {
      // Negate in unsigned space so INT64_MIN cannot overflow.
      const std::uint64_t amount = 0 - static_cast<std::uint64_t>(delta);
      acct.used -= std::min(acct.used, amount);
    }
    used = acct.used;
  }
  if (commit)
    publish(tenant, used);
}

void QuotaAccountant::release(const TenantId &tenant, std::uint64_t bytes) {
  if (bytes == 0)
    return;
  auto &acct = account(tenant);
  std::uint64_t used = 0;
  {
    std::lock_guard<std::mutex> lock(acct.mutex);
    if (bytes > acct.used) {
      Logger::getInstance().log(
          LogLevel::WARN, "Quota release larger than committed usage",
          {{"tenant", tenant},
           {"released", std::to_string(bytes)},
           {"used", std::to_string(acct.used)}});
    }
    acct.used -= std::min(acct.used, bytes);
    used = acct.used;
  }
  publish(tenant, used);
}

TenantUsage QuotaAccountant::usage(const TenantId &tenant) const {
  TenantUsage out;
  out.quotaBytes = ledger_.limitFor(tenant);
  // Reading never creates an account.
  if (auto *acct = findAccount(tenant)) {
    std::lock_guard<std::mutex> lock(acct->mutex);
    out.usedBytes = acct->used;
  }
  return out;
}

void QuotaAccountant::resetUsage(const TenantId &tenant,
                                 std::uint64_t usedBytes) {
  auto &acct = account(tenant);
  {
    std::lock_guard<std::mutex> lock(acct.mutex);
    acct.used = usedBytes;
  }
  publish(tenant, usedBytes);
}

std::vector<TenantId> QuotaAccountant::knownTenants() const {
  std::lock_guard<std::mutex> lock(accountsMutex_);
  std::vector<TenantId> out;
  out.reserve(accounts_.size());
  for (const auto &kv : accounts_)
    out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

void QuotaAccountant::publish(const TenantId &tenant,
                              std::uint64_t used) const {
  MetricsRegistry::instance().setGauge("chunkvault_tenant_used_bytes",
                                       static_cast<double>(used),
                                       {{"tenant", tenant}});
}

} // namespace chunkvault
