#pragma once

#include "core/CallContext.hpp"
#include "core/Principal.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace DR {

/**
 * @brief Current ownership of one canonical key.
 *
 * Replaced wholesale on every transition. Ownership is active while
 * `validUntil >= now`.
 */
struct DomainRecord {
    std::string key;
    Principal   owner;
    Timestamp   validUntil = 0;
    Timestamp   updatedAt  = 0;

    auto operator==(DomainRecord const&) const -> bool = default;
};

enum class HistoryEvent : std::uint8_t {
    Claim    = 0,
    Transfer = 1,
    Revoke   = 2,
};

/**
 * One ownership-affecting transition. `owner` is the record owner after the
 * transition, `actor` the caller that performed it.
 */
struct HistoryEntry {
    HistoryEvent event = HistoryEvent::Claim;
    Principal    owner;
    Principal    actor;
    Timestamp    validUntil = 0;
    Timestamp    createdAt  = 0;

    auto operator==(HistoryEntry const&) const -> bool = default;
};

enum class DomainState {
    Unclaimed,
    Reserved,
    Active,
    Expired,
};

struct ClaimPayload {
    std::string name;
    std::string extension;
    Duration    duration = 0;
};

struct ReservePayload {
    std::string name;
    std::string extension;
    Principal   wallet;
};

[[nodiscard]] inline auto historyEventToString(HistoryEvent event) -> std::string_view {
    switch (event) {
    case HistoryEvent::Claim:
        return "claim";
    case HistoryEvent::Transfer:
        return "transfer";
    case HistoryEvent::Revoke:
        return "revoke";
    }
    return "unknown";
}

[[nodiscard]] inline auto domainStateToString(DomainState state) -> std::string_view {
    switch (state) {
    case DomainState::Unclaimed:
        return "unclaimed";
    case DomainState::Reserved:
        return "reserved";
    case DomainState::Active:
        return "active";
    case DomainState::Expired:
        return "expired";
    }
    return "unknown";
}

} // namespace DR
