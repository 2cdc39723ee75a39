#include "registry/Registry.hpp"

#include "log/TaggedLogger.hpp"

#include <exception>
#include <limits>
#include <utility>

namespace DR {

namespace {

constexpr std::string_view MetaCollection   = "meta";
constexpr std::string_view AdministratorKey = "administrator";

// Errors raised below the registry are not part of its error vocabulary.
auto toRegistryError(Error error) -> Error {
    switch (error.code) {
    case Error::Code::InvalidError:
    case Error::Code::MalformedInput:
    case Error::Code::NotFound:
    case Error::Code::InvalidConfiguration:
        return Error{Error::Code::UnknownError, describeError(error)};
    default:
        return error;
    }
}

} // namespace

Registry::Registry(ConstructionTag, KeyValueStore& store, Principal administrator, RegistryOptions options)
    : store_(&store)
    , options_(std::move(options))
    , guard_(std::move(administrator))
    , domains_(store, "domains")
    , reservations_(store, "reserved")
    , history_(store) {}

auto Registry::create(KeyValueStore& store, CallContext const& creator, RegistryOptions options)
        -> Expected<std::unique_ptr<Registry>> {
    if (auto valid = validateOptions(options); !valid)
        return std::unexpected(valid.error());

    StableMap<Principal> meta(store, MetaCollection);
    auto                 existing = meta.get(AdministratorKey);
    if (!existing)
        return std::unexpected(toRegistryError(existing.error()));
    if (existing->has_value())
        return std::unexpected(Error{Error::Code::AlreadyInitialized, **existing});

    if (auto stored = meta.insert(AdministratorKey, creator.caller); !stored)
        return std::unexpected(toRegistryError(stored.error()));

    dr_log("Registry created; administrator " + creator.caller.text, "Registry");
    return std::make_unique<Registry>(ConstructionTag{}, store, creator.caller, std::move(options));
}

auto Registry::open(KeyValueStore& store, RegistryOptions options) -> Expected<std::unique_ptr<Registry>> {
    if (auto valid = validateOptions(options); !valid)
        return std::unexpected(valid.error());

    StableMap<Principal> meta(store, MetaCollection);
    auto                 existing = meta.get(AdministratorKey);
    if (!existing)
        return std::unexpected(toRegistryError(existing.error()));
    if (!existing->has_value())
        return std::unexpected(Error{Error::Code::NotInitialized, "Store holds no registry administrator"});

    dr_log("Registry opened; administrator " + (*existing)->text, "Registry");
    return std::make_unique<Registry>(ConstructionTag{}, store, std::move(**existing), std::move(options));
}

template <typename T, typename Fn>
auto Registry::guarded(std::string_view operation, Fn&& fn) const -> Expected<T> {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        Expected<T> result = std::forward<Fn>(fn)();
        if (!result) {
            auto error = toRegistryError(std::move(result.error()));
            dr_log(std::string(operation) + " failed: " + describeError(error), "Registry");
            return std::unexpected(std::move(error));
        }
        return result;
    } catch (std::exception const& e) {
        dr_log(std::string(operation) + " raised: " + e.what(), "Registry", "ERROR");
        return std::unexpected(Error{Error::Code::UnknownError, e.what()});
    }
}

auto Registry::loadRecord(std::string const& key) const -> Expected<std::optional<DomainRecord>> {
    return domains_.get(key);
}

auto Registry::loadExistingRecord(std::string const& key) const -> Expected<DomainRecord> {
    auto record = domains_.get(key);
    if (!record)
        return std::unexpected(record.error());
    if (!record->has_value())
        return std::unexpected(Error{Error::Code::DomainNotFound, key});
    return std::move(**record);
}

auto Registry::commitTransition(std::string_view    operation,
                                DomainRecord const& record,
                                HistoryEntry const& entry,
                                bool                consumeReservation) -> Expected<void> {
    std::vector<Mutation> batch;
    batch.reserve(3);

    auto historyMutation = history_.stageAppend(record.key, entry);
    if (!historyMutation)
        return std::unexpected(historyMutation.error());
    batch.push_back(std::move(historyMutation.value()));

    if (consumeReservation)
        batch.push_back(reservations_.stageRemove(record.key));

    auto recordMutation = domains_.stageInsert(record.key, record);
    if (!recordMutation)
        return std::unexpected(recordMutation.error());
    batch.push_back(std::move(recordMutation.value()));

    if (auto applied = store_->apply(batch); !applied) {
        dr_log(std::string(operation) + " " + record.key + " failed to commit: " + describeError(applied.error()),
               "Registry", "ERROR");
        return applied;
    }

    dr_log(std::string(operation) + " " + record.key + " owner=" + record.owner.text + " actor=" + entry.actor.text
                   + " validUntil=" + std::to_string(record.validUntil),
           "Registry");
    return {};
}

auto Registry::reserve(CallContext const& ctx, ReservePayload const& payload) -> Expected<std::string> {
    return guarded<std::string>("reserve", [&]() -> Expected<std::string> {
        if (auto allowed = guard_.authorizeAdministrator(ctx.caller); !allowed)
            return std::unexpected(allowed.error());

        auto key = DomainKey::fromParts(payload.name, payload.extension, options_);
        if (!key)
            return std::unexpected(key.error());

        auto existing = loadRecord(key->str());
        if (!existing)
            return std::unexpected(existing.error());
        if (auto allowed = guard_.authorizeReserve(*existing); !allowed)
            return std::unexpected(allowed.error());

        if (auto stored = reservations_.insert(key->str(), payload.wallet); !stored)
            return std::unexpected(stored.error());

        dr_log("reserve " + key->str() + " for " + payload.wallet.text, "Registry");
        return key->str();
    });
}

auto Registry::claim(CallContext const& ctx, ClaimPayload const& payload) -> Expected<std::string> {
    return guarded<std::string>("claim", [&]() -> Expected<std::string> {
        if (payload.duration < options_.minDuration || payload.duration > options_.maxDuration
            || payload.duration > std::numeric_limits<Timestamp>::max() - ctx.now) {
            return std::unexpected(Error{Error::Code::InvalidDuration, payload.duration});
        }

        auto key = DomainKey::fromParts(payload.name, payload.extension, options_);
        if (!key)
            return std::unexpected(key.error());

        auto existing = loadRecord(key->str());
        if (!existing)
            return std::unexpected(existing.error());
        auto reservation = reservations_.get(key->str());
        if (!reservation)
            return std::unexpected(reservation.error());

        auto decision = guard_.authorizeClaim(ctx, *existing, *reservation);
        if (!decision)
            return std::unexpected(decision.error());

        DomainRecord record{.key        = key->str(),
                            .owner      = ctx.caller,
                            .validUntil = ctx.now + payload.duration,
                            .updatedAt  = ctx.now};
        HistoryEntry entry{.event      = HistoryEvent::Claim,
                           .owner      = ctx.caller,
                           .actor      = ctx.caller,
                           .validUntil = record.validUntil,
                           .createdAt  = ctx.now};

        if (auto committed = commitTransition("claim", record, entry, decision->consumesReservation); !committed)
            return std::unexpected(committed.error());
        return key->str();
    });
}

auto Registry::revoke(CallContext const& ctx, std::string_view keyText) -> Expected<std::string> {
    return guarded<std::string>("revoke", [&]() -> Expected<std::string> {
        auto key = DomainKey::parse(keyText, options_);
        if (!key)
            return std::unexpected(key.error());

        auto current = loadExistingRecord(key->str());
        if (!current)
            return std::unexpected(current.error());

        if (auto allowed = guard_.authorizeRevoke(ctx, *current); !allowed)
            return std::unexpected(allowed.error());

        DomainRecord record{.key = key->str(), .owner = current->owner, .validUntil = 0, .updatedAt = ctx.now};
        HistoryEntry entry{.event      = HistoryEvent::Revoke,
                           .owner      = current->owner,
                           .actor      = ctx.caller,
                           .validUntil = record.validUntil,
                           .createdAt  = ctx.now};

        if (auto committed = commitTransition("revoke", record, entry, false); !committed)
            return std::unexpected(committed.error());
        return key->str();
    });
}

auto Registry::transfer(CallContext const& ctx, std::string_view keyText, Principal const& newOwner) -> Expected<std::string> {
    return guarded<std::string>("transfer", [&]() -> Expected<std::string> {
        auto key = DomainKey::parse(keyText, options_);
        if (!key)
            return std::unexpected(key.error());

        auto current = loadExistingRecord(key->str());
        if (!current)
            return std::unexpected(current.error());

        if (auto allowed = guard_.authorizeTransfer(ctx, *current); !allowed)
            return std::unexpected(allowed.error());

        DomainRecord record{.key = key->str(), .owner = newOwner, .validUntil = current->validUntil, .updatedAt = ctx.now};
        HistoryEntry entry{.event      = HistoryEvent::Transfer,
                           .owner      = newOwner,
                           .actor      = ctx.caller,
                           .validUntil = record.validUntil,
                           .createdAt  = ctx.now};

        if (auto committed = commitTransition("transfer", record, entry, false); !committed)
            return std::unexpected(committed.error());
        return key->str();
    });
}

auto Registry::getDomain(std::string_view keyText) const -> Expected<DomainRecord> {
    return guarded<DomainRecord>("getDomain", [&]() -> Expected<DomainRecord> {
        auto key = DomainKey::parse(keyText, options_);
        if (!key)
            return std::unexpected(key.error());
        return loadExistingRecord(key->str());
    });
}

auto Registry::getDomainHistory(std::string_view keyText) const -> Expected<std::vector<HistoryEntry>> {
    return guarded<std::vector<HistoryEntry>>("getDomainHistory", [&]() -> Expected<std::vector<HistoryEntry>> {
        auto key = DomainKey::parse(keyText, options_);
        if (!key)
            return std::unexpected(key.error());
        return history_.read(key->str());
    });
}

auto Registry::lookup(std::string_view keyText) const -> Expected<Principal> {
    return guarded<Principal>("lookup", [&]() -> Expected<Principal> {
        auto key = DomainKey::parse(keyText, options_);
        if (!key)
            return std::unexpected(key.error());
        auto record = loadExistingRecord(key->str());
        if (!record)
            return std::unexpected(record.error());
        return std::move(record->owner);
    });
}

auto Registry::reverseLookup(Principal const& owner) const -> Expected<std::vector<std::string>> {
    return guarded<std::vector<std::string>>("reverseLookup", [&]() -> Expected<std::vector<std::string>> {
        std::vector<std::string> keys;
        auto scanned = domains_.forEach([&](std::string_view, DomainRecord const& record) {
            if (record.owner == owner)
                keys.push_back(record.key);
            return ScanControl::Continue;
        });
        if (!scanned)
            return std::unexpected(scanned.error());
        return keys;
    });
}

auto Registry::getIsClaimable(CallContext const& ctx, std::string_view keyText) const -> Expected<bool> {
    return guarded<bool>("getIsClaimable", [&]() -> Expected<bool> {
        auto key = DomainKey::parse(keyText, options_);
        if (!key)
            return std::unexpected(key.error());
        auto record = loadExistingRecord(key->str());
        if (!record)
            return std::unexpected(record.error());
        auto reservation = reservations_.get(key->str());
        if (!reservation)
            return std::unexpected(reservation.error());
        return guard_.authorizeClaim(ctx, *record, *reservation).has_value();
    });
}

auto Registry::getReservation(std::string_view keyText) const -> Expected<Principal> {
    return guarded<Principal>("getReservation", [&]() -> Expected<Principal> {
        auto key = DomainKey::parse(keyText, options_);
        if (!key)
            return std::unexpected(key.error());
        auto reservation = reservations_.get(key->str());
        if (!reservation)
            return std::unexpected(reservation.error());
        if (!reservation->has_value())
            return std::unexpected(Error{Error::Code::DomainNotFound, key->str()});
        return std::move(**reservation);
    });
}

auto Registry::getDomainState(CallContext const& ctx, std::string_view keyText) const -> Expected<DomainState> {
    return guarded<DomainState>("getDomainState", [&]() -> Expected<DomainState> {
        auto key = DomainKey::parse(keyText, options_);
        if (!key)
            return std::unexpected(key.error());
        auto record = loadRecord(key->str());
        if (!record)
            return std::unexpected(record.error());
        auto reserved = reservations_.contains(key->str());
        if (!reserved)
            return std::unexpected(reserved.error());
        return classifyDomain(*record, *reserved, ctx.now);
    });
}

auto Registry::getCanisterOwner() const -> Principal const& {
    return guard_.administrator();
}

auto Registry::getCaller(CallContext const& ctx) const -> Principal {
    return ctx.caller;
}

auto Registry::forEachDomain(std::function<ScanControl(DomainRecord const&)> const& visitor) const -> Expected<void> {
    return guarded<void>("forEachDomain", [&]() -> Expected<void> {
        return domains_.forEach([&](std::string_view, DomainRecord const& record) { return visitor(record); });
    });
}

auto Registry::forEachReservation(std::function<ScanControl(std::string_view key, Principal const&)> const& visitor) const
        -> Expected<void> {
    return guarded<void>("forEachReservation", [&]() -> Expected<void> { return reservations_.forEach(visitor); });
}

auto Registry::forEachHistory(
        std::function<ScanControl(std::string_view key, std::vector<HistoryEntry> const&)> const& visitor) const -> Expected<void> {
    return guarded<void>("forEachHistory", [&]() -> Expected<void> { return history_.forEach(visitor); });
}

auto Registry::visit(RegistryVisitors const& visitors) const -> Expected<void> {
    return guarded<void>("visit", [&]() -> Expected<void> {
        if (visitors.domain) {
            auto visited = domains_.forEach([&](std::string_view, DomainRecord const& record) { return visitors.domain(record); });
            if (!visited)
                return visited;
        }
        if (visitors.reservation) {
            if (auto visited = reservations_.forEach(visitors.reservation); !visited)
                return visited;
        }
        if (visitors.history)
            return history_.forEach(visitors.history);
        return {};
    });
}

} // namespace DR
