#include "registry/AuthorizationGuard.hpp"

#include "RegistryTestHelper.hpp"

#include <doctest/doctest.h>

using namespace DR;
using namespace DR::Testing;

namespace {

auto recordOwnedBy(Principal owner, Timestamp validUntil) -> DomainRecord {
    return DomainRecord{.key = "alice.icp", .owner = std::move(owner), .validUntil = validUntil, .updatedAt = T0};
}

} // namespace

TEST_SUITE("registry.guard") {
    TEST_CASE("reserve is administrator only") {
        AuthorizationGuard guard(admin());
        CHECK(guard.authorizeAdministrator(admin()).has_value());
        auto denied = guard.authorizeAdministrator(alice());
        REQUIRE_FALSE(denied.has_value());
        CHECK(denied.error().code == Error::Code::CallerNotCanisterOwner);
        CHECK(denied.error().principal() == alice());
    }

    TEST_CASE("reserve checks existence, not expiry") {
        AuthorizationGuard guard(admin());
        CHECK(guard.authorizeReserve(std::nullopt).has_value());
        auto denied = guard.authorizeReserve(recordOwnedBy(bob(), 0));
        REQUIRE_FALSE(denied.has_value());
        CHECK(denied.error().code == Error::Code::DomainAlreadyClaimed);
        CHECK(denied.error().principal() == bob());
    }

    TEST_CASE("claim boundary is validUntil >= now") {
        AuthorizationGuard guard(admin());
        auto record = recordOwnedBy(bob(), T0 + 100);

        auto atExpiry = guard.authorizeClaim(at(alice(), T0 + 100), record, std::nullopt);
        REQUIRE_FALSE(atExpiry.has_value());
        CHECK(atExpiry.error().code == Error::Code::DomainAlreadyClaimed);
        CHECK(atExpiry.error().principal() == bob());

        auto after = guard.authorizeClaim(at(alice(), T0 + 101), record, std::nullopt);
        REQUIRE(after.has_value());
        CHECK_FALSE(after->consumesReservation);

        // The previous owner has no residual privilege while active either.
        CHECK_FALSE(guard.authorizeClaim(at(bob(), T0 + 50), record, std::nullopt).has_value());
    }

    TEST_CASE("reservation blocks everyone but its target") {
        AuthorizationGuard guard(admin());
        auto other = guard.authorizeClaim(at(bob(), T0), std::nullopt, alice());
        REQUIRE_FALSE(other.has_value());
        CHECK(other.error().code == Error::Code::DomainReserved);
        CHECK(other.error().principal() == alice());

        auto target = guard.authorizeClaim(at(alice(), T0), std::nullopt, alice());
        REQUIRE(target.has_value());
        CHECK(target->consumesReservation);

        auto admins = guard.authorizeClaim(at(admin(), T0), std::nullopt, alice());
        CHECK_FALSE(admins.has_value());
    }

    TEST_CASE("revoke boundary is validUntil > now for non-owners") {
        AuthorizationGuard guard(admin());
        auto record = recordOwnedBy(bob(), T0 + 100);

        CHECK(guard.authorizeRevoke(at(bob(), T0), record).has_value());

        auto early = guard.authorizeRevoke(at(alice(), T0 + 99), record);
        REQUIRE_FALSE(early.has_value());
        CHECK(early.error().code == Error::Code::DomainStillValid);
        CHECK(early.error().principal() == bob());

        CHECK(guard.authorizeRevoke(at(alice(), T0 + 100), record).has_value());
        CHECK(guard.authorizeRevoke(at(alice(), T0 + 101), record).has_value());
    }

    TEST_CASE("transfer requires the owner and validUntil >= now") {
        AuthorizationGuard guard(admin());
        auto record = recordOwnedBy(bob(), T0 + 100);

        auto stranger = guard.authorizeTransfer(at(alice(), T0), record);
        REQUIRE_FALSE(stranger.has_value());
        CHECK(stranger.error().code == Error::Code::CallerNotDomainOwner);
        CHECK(stranger.error().principal() == alice());

        CHECK(guard.authorizeTransfer(at(bob(), T0 + 100), record).has_value());

        auto expired = guard.authorizeTransfer(at(bob(), T0 + 101), record);
        REQUIRE_FALSE(expired.has_value());
        CHECK(expired.error().code == Error::Code::DomainOwnershipExpired);
        CHECK(expired.error().principal() == bob());
    }

    TEST_CASE("classify states") {
        CHECK(classifyDomain(std::nullopt, false, T0) == DomainState::Unclaimed);
        CHECK(classifyDomain(std::nullopt, true, T0) == DomainState::Reserved);
        CHECK(classifyDomain(recordOwnedBy(bob(), T0), false, T0) == DomainState::Active);
        CHECK(classifyDomain(recordOwnedBy(bob(), T0 - 1), true, T0) == DomainState::Expired);
    }

    TEST_CASE("state and event labels") {
        CHECK(domainStateToString(DomainState::Unclaimed) == "unclaimed");
        CHECK(domainStateToString(DomainState::Reserved) == "reserved");
        CHECK(domainStateToString(DomainState::Active) == "active");
        CHECK(domainStateToString(DomainState::Expired) == "expired");
        CHECK(historyEventToString(HistoryEvent::Claim) == "claim");
        CHECK(historyEventToString(HistoryEvent::Transfer) == "transfer");
        CHECK(historyEventToString(HistoryEvent::Revoke) == "revoke");
    }
}
