#include "registry/HistoryLedger.hpp"

#include "RegistryTestHelper.hpp"

#include <doctest/doctest.h>

using namespace DR;
using namespace DR::Testing;

namespace {

auto entry(HistoryEvent event, Principal owner, Timestamp at) -> HistoryEntry {
    return HistoryEntry{.event = event, .owner = owner, .actor = owner, .validUntil = at + OneHour, .createdAt = at};
}

} // namespace

TEST_SUITE("registry.history") {
    TEST_CASE("unknown keys have no history") {
        MemoryStore   store;
        HistoryLedger ledger(store);

        auto missing = ledger.read("alice.icp");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::DomainNotFound);
        CHECK(ledger.length("alice.icp") == std::size_t{0});
    }

    TEST_CASE("append keeps insertion order per key") {
        MemoryStore   store;
        HistoryLedger ledger(store);

        REQUIRE(ledger.append("alice.icp", entry(HistoryEvent::Claim, alice(), T0)).has_value());
        REQUIRE(ledger.append("bob.icp", entry(HistoryEvent::Claim, bob(), T0)).has_value());
        REQUIRE(ledger.append("alice.icp", entry(HistoryEvent::Revoke, alice(), T0 + 1)).has_value());

        auto sequence = ledger.read("alice.icp");
        REQUIRE(sequence.has_value());
        REQUIRE(sequence->size() == 2);
        CHECK((*sequence)[0].event == HistoryEvent::Claim);
        CHECK((*sequence)[1].event == HistoryEvent::Revoke);
        CHECK((*sequence)[1].createdAt == T0 + 1);
        CHECK(ledger.length("bob.icp") == std::size_t{1});
    }

    TEST_CASE("staged appends are invisible until applied") {
        MemoryStore   store;
        HistoryLedger ledger(store);

        auto staged = ledger.stageAppend("alice.icp", entry(HistoryEvent::Claim, alice(), T0));
        REQUIRE(staged.has_value());
        CHECK(staged->kind == Mutation::Kind::Insert);
        CHECK(staged->key == "history/alice.icp");
        CHECK(ledger.length("alice.icp") == std::size_t{0});

        REQUIRE(store.apply(std::span<Mutation const>{&staged.value(), 1}).has_value());
        CHECK(ledger.length("alice.icp") == std::size_t{1});
    }

    TEST_CASE("undecodable sequences surface as errors") {
        MemoryStore   store;
        HistoryLedger ledger(store);
        REQUIRE(store.insert("history/alice.icp", Bytes{1, 2, 3}).has_value());

        auto sequence = ledger.read("alice.icp");
        REQUIRE_FALSE(sequence.has_value());
        CHECK(sequence.error().code == Error::Code::MalformedInput);
    }
}
