#include "registry/AuthorizationGuard.hpp"

namespace DR {

AuthorizationGuard::AuthorizationGuard(Principal administrator)
    : administrator_(std::move(administrator)) {}

auto AuthorizationGuard::authorizeAdministrator(Principal const& caller) const -> Expected<void> {
    if (caller != administrator_)
        return std::unexpected(Error{Error::Code::CallerNotCanisterOwner, caller});
    return {};
}

auto AuthorizationGuard::authorizeReserve(std::optional<DomainRecord> const& existing) const -> Expected<void> {
    if (existing)
        return std::unexpected(Error{Error::Code::DomainAlreadyClaimed, existing->owner});
    return {};
}

auto AuthorizationGuard::authorizeClaim(CallContext const&                 ctx,
                                        std::optional<DomainRecord> const& existing,
                                        std::optional<Principal> const&    reservedFor) const -> Expected<ClaimDecision> {
    if (existing && isActive(*existing, ctx.now))
        return std::unexpected(Error{Error::Code::DomainAlreadyClaimed, existing->owner});

    ClaimDecision decision;
    if (reservedFor) {
        if (*reservedFor != ctx.caller)
            return std::unexpected(Error{Error::Code::DomainReserved, *reservedFor});
        decision.consumesReservation = true;
    }
    return decision;
}

auto AuthorizationGuard::authorizeRevoke(CallContext const& ctx, DomainRecord const& record) const -> Expected<void> {
    // The owner may give the key up at any time.
    if (record.owner == ctx.caller)
        return {};
    if (record.validUntil > ctx.now)
        return std::unexpected(Error{Error::Code::DomainStillValid, record.owner});
    return {};
}

auto AuthorizationGuard::authorizeTransfer(CallContext const& ctx, DomainRecord const& record) const -> Expected<void> {
    if (record.owner != ctx.caller)
        return std::unexpected(Error{Error::Code::CallerNotDomainOwner, ctx.caller});
    if (record.validUntil < ctx.now)
        return std::unexpected(Error{Error::Code::DomainOwnershipExpired, record.owner});
    return {};
}

auto classifyDomain(std::optional<DomainRecord> const& record, bool reserved, Timestamp now) -> DomainState {
    if (record)
        return isActive(*record, now) ? DomainState::Active : DomainState::Expired;
    return reserved ? DomainState::Reserved : DomainState::Unclaimed;
}

} // namespace DR
