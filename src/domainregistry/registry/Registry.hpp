#pragma once

#include "core/CallContext.hpp"
#include "core/Error.hpp"
#include "core/RegistryOptions.hpp"
#include "registry/AuthorizationGuard.hpp"
#include "registry/DomainKey.hpp"
#include "registry/DomainTypes.hpp"
#include "registry/HistoryLedger.hpp"
#include "store/KeyValueStore.hpp"
#include "store/StableMap.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace DR {

// Per-collection visitors for Registry::visit; an empty function skips its collection.
struct RegistryVisitors {
    std::function<ScanControl(DomainRecord const&)>                                     domain;
    std::function<ScanControl(std::string_view key, Principal const&)>                  reservation;
    std::function<ScanControl(std::string_view key, std::vector<HistoryEntry> const&)> history;
};

/**
 * @brief The registry engine: name ownership, reservations and history.
 *
 * Every operation runs to completion under one registry-wide lock. Mutating
 * operations perform all validation and authorization before staging any
 * write, then commit the history append, the reservation removal and the
 * record replacement as one batch, history first. A failed call leaves the
 * store untouched.
 *
 * Errors are returned, never thrown. Faults below the registry (storage,
 * codec, allocation) surface as Error::Code::UnknownError.
 */
class Registry {
public:
    /**
     * @brief Initializes a registry in an empty store.
     * @param store   Substrate holding domains, history, reservations and the administrator.
     * @param creator The creating call; its caller becomes the administrative identity.
     * @return AlreadyInitialized if the store already holds an administrator.
     */
    [[nodiscard]] static auto create(KeyValueStore& store, CallContext const& creator, RegistryOptions options = {})
            -> Expected<std::unique_ptr<Registry>>;

    /**
     * @brief Reopens a registry previously created in `store`.
     * @return NotInitialized if the store has no administrator.
     */
    [[nodiscard]] static auto open(KeyValueStore& store, RegistryOptions options = {}) -> Expected<std::unique_ptr<Registry>>;

    Registry(Registry const&)            = delete;
    Registry& operator=(Registry const&) = delete;

    // Holds `name.extension` for `payload.wallet`. Administrator only.
    [[nodiscard]] auto reserve(CallContext const& ctx, ReservePayload const& payload) -> Expected<std::string>;
    // Takes ownership for `payload.duration` nanoseconds from `ctx.now`.
    [[nodiscard]] auto claim(CallContext const& ctx, ClaimPayload const& payload) -> Expected<std::string>;
    // Expires the record immediately; the previous owner stays recorded as owner.
    [[nodiscard]] auto revoke(CallContext const& ctx, std::string_view key) -> Expected<std::string>;
    // Hands an active record to `newOwner`, keeping its expiry.
    [[nodiscard]] auto transfer(CallContext const& ctx, std::string_view key, Principal const& newOwner) -> Expected<std::string>;

    [[nodiscard]] auto getDomain(std::string_view key) const -> Expected<DomainRecord>;
    [[nodiscard]] auto getDomainHistory(std::string_view key) const -> Expected<std::vector<HistoryEntry>>;
    [[nodiscard]] auto lookup(std::string_view key) const -> Expected<Principal>;
    // Keys, in order, whose current record is owned by `owner`, active or not.
    [[nodiscard]] auto reverseLookup(Principal const& owner) const -> Expected<std::vector<std::string>>;
    // Whether a claim by `ctx.caller` would be authorized now. DomainNotFound without a record.
    [[nodiscard]] auto getIsClaimable(CallContext const& ctx, std::string_view key) const -> Expected<bool>;
    // DomainNotFound when the key holds no reservation.
    [[nodiscard]] auto getReservation(std::string_view key) const -> Expected<Principal>;
    [[nodiscard]] auto getDomainState(CallContext const& ctx, std::string_view key) const -> Expected<DomainState>;

    [[nodiscard]] auto getCanisterOwner() const -> Principal const&;
    [[nodiscard]] auto getCaller(CallContext const& ctx) const -> Principal;
    [[nodiscard]] auto options() const -> RegistryOptions const& { return options_; }

    // Snapshot iteration in key order. Visitors run under the registry lock and must not call back into it.
    [[nodiscard]] auto forEachDomain(std::function<ScanControl(DomainRecord const&)> const& visitor) const -> Expected<void>;
    [[nodiscard]] auto forEachReservation(std::function<ScanControl(std::string_view key, Principal const&)> const& visitor) const
            -> Expected<void>;
    [[nodiscard]] auto forEachHistory(
            std::function<ScanControl(std::string_view key, std::vector<HistoryEntry> const&)> const& visitor) const -> Expected<void>;

    // Visits domains, then reservations, then history under one lock hold, so all three agree.
    [[nodiscard]] auto visit(RegistryVisitors const& visitors) const -> Expected<void>;

private:
    struct ConstructionTag {
        explicit ConstructionTag() = default;
    };

public:
    Registry(ConstructionTag, KeyValueStore& store, Principal administrator, RegistryOptions options);

private:

    template <typename T, typename Fn>
    auto guarded(std::string_view operation, Fn&& fn) const -> Expected<T>;

    [[nodiscard]] auto loadRecord(std::string const& key) const -> Expected<std::optional<DomainRecord>>;
    [[nodiscard]] auto loadExistingRecord(std::string const& key) const -> Expected<DomainRecord>;
    [[nodiscard]] auto commitTransition(std::string_view          operation,
                                        DomainRecord const&       record,
                                        HistoryEntry const&       entry,
                                        bool                      consumeReservation) -> Expected<void>;

    KeyValueStore*          store_;
    RegistryOptions         options_;
    AuthorizationGuard      guard_;
    StableMap<DomainRecord> domains_;
    StableMap<Principal>    reservations_;
    HistoryLedger           history_;
    mutable std::mutex      mutex_;
};

} // namespace DR
