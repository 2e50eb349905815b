#ifndef CHUNKVAULT_COLLABORATORS_H
#define CHUNKVAULT_COLLABORATORS_H

#include "chunkvault/config.h"
#include "chunkvault/types.h"

#include <cstdint>
#include <map>
#include <optional>

namespace chunkvault {

/// Yields the tenant of the authenticated request, if any.
class IdentityProvider {
public:
  virtual ~IdentityProvider() = default;
  virtual std::optional<TenantId> currentTenant() const = 0;
};

/// Fixed identity, used by the ctl binary and tests.
class StaticIdentity : public IdentityProvider {
public:
  StaticIdentity() = default;
  explicit StaticIdentity(TenantId tenant) : tenant_(std::move(tenant)) {}
  std::optional<TenantId> currentTenant() const override { return tenant_; }

private:
  std::optional<TenantId> tenant_;
};

/// Source of per-tenant byte ceilings.
class QuotaLedger {
public:
  virtual ~QuotaLedger() = default;
  virtual std::uint64_t limitFor(const TenantId &tenant) const = 0;
};

/// Ceilings from Config: `quotas` overrides, else `default_quota_bytes`.
class ConfigQuotaLedger : public QuotaLedger {
public:
  explicit ConfigQuotaLedger(const Config &config)
      : defaultLimit_(config.defaultQuotaBytes), overrides_(config.quotas) {}

  std::uint64_t limitFor(const TenantId &tenant) const override {
    auto it = overrides_.find(tenant);
    return it == overrides_.end() ? defaultLimit_ : it->second;
  }

private:
  std::uint64_t defaultLimit_;
  std::map<std::string, std::uint64_t> overrides_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_COLLABORATORS_H
