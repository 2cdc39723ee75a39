#pragma once

#include "core/CallContext.hpp"
#include "core/Error.hpp"
#include "core/Principal.hpp"
#include "registry/DomainTypes.hpp"

#include <optional>

namespace DR {

struct ClaimDecision {
    // The caller holds the reservation, which the claim must delete.
    bool consumesReservation = false;
};

/**
 * @brief Decides whether a caller may perform a mutating action on a key.
 *
 * Pure decision functions over the current record and reservation; nothing is
 * read from or written to storage here. The validity boundaries differ per
 * action and are kept exactly:
 * - a claim is blocked while `validUntil >= now`,
 * - a revoke by a non-owner is blocked while `validUntil > now`,
 * - a transfer is rejected once `validUntil < now`.
 */
class AuthorizationGuard {
public:
    explicit AuthorizationGuard(Principal administrator);

    [[nodiscard]] auto administrator() const -> Principal const& { return administrator_; }

    // Only the administrative identity may reserve.
    [[nodiscard]] auto authorizeAdministrator(Principal const& caller) const -> Expected<void>;
    // A key with any stored record, active or not, cannot be reserved.
    [[nodiscard]] auto authorizeReserve(std::optional<DomainRecord> const& existing) const -> Expected<void>;
    [[nodiscard]] auto authorizeClaim(CallContext const&                 ctx,
                                      std::optional<DomainRecord> const& existing,
                                      std::optional<Principal> const&    reservedFor) const -> Expected<ClaimDecision>;
    [[nodiscard]] auto authorizeRevoke(CallContext const& ctx, DomainRecord const& record) const -> Expected<void>;
    [[nodiscard]] auto authorizeTransfer(CallContext const& ctx, DomainRecord const& record) const -> Expected<void>;

private:
    Principal administrator_;
};

[[nodiscard]] inline auto isActive(DomainRecord const& record, Timestamp now) -> bool {
    return record.validUntil >= now;
}

[[nodiscard]] auto classifyDomain(std::optional<DomainRecord> const& record,
                                  bool                               reserved,
                                  Timestamp                          now) -> DomainState;

} // namespace DR
