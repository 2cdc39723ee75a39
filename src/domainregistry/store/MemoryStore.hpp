#pragma once

#include "store/KeyValueStore.hpp"

#include <map>
#include <mutex>

namespace DR {

/**
 * In-memory ordered store. Also the live view of a JournalStore.
 */
class MemoryStore : public KeyValueStore {
public:
    MemoryStore() = default;

    [[nodiscard]] auto get(std::string_view key) const -> Expected<std::optional<Bytes>> override;
    [[nodiscard]] auto scan(std::string_view prefix, ScanVisitor const& visitor) const -> Expected<void> override;
    [[nodiscard]] auto apply(std::span<Mutation const> batch) -> Expected<void> override;

    [[nodiscard]] auto size() const -> std::size_t;

protected:
    auto applyUnlocked(std::span<Mutation const> batch) -> void;

    using Map = std::map<std::string, Bytes, std::less<>>;

    Map                entries;
    mutable std::mutex mutex;
};

} // namespace DR
