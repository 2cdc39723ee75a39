#pragma once

#include "core/Error.hpp"
#include "registry/DomainTypes.hpp"
#include "store/StableMap.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace DR {

/**
 * @brief Append-only ownership history, one sequence per canonical key.
 *
 * The substrate has no append primitive, so an append reads the whole
 * sequence and writes it back. Entries are never edited or removed.
 */
class HistoryLedger {
public:
    explicit HistoryLedger(KeyValueStore& store);

    // DomainNotFound when the key never had a record.
    [[nodiscard]] auto read(std::string_view key) const -> Expected<std::vector<HistoryEntry>>;
    // Zero for a key without history.
    [[nodiscard]] auto length(std::string_view key) const -> Expected<std::size_t>;

    // Builds the rewrite of `key`'s sequence with `entry` appended, for the caller's batch.
    [[nodiscard]] auto stageAppend(std::string_view key, HistoryEntry const& entry) const -> Expected<Mutation>;
    [[nodiscard]] auto append(std::string_view key, HistoryEntry const& entry) -> Expected<void>;

    [[nodiscard]] auto forEach(std::function<ScanControl(std::string_view key, std::vector<HistoryEntry> const&)> const& visitor) const
            -> Expected<void>;

private:
    StableMap<std::vector<HistoryEntry>> sequences_;
    KeyValueStore*                       store_;
};

} // namespace DR
