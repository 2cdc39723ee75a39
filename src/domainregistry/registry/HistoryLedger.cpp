#include "registry/HistoryLedger.hpp"

namespace DR {

HistoryLedger::HistoryLedger(KeyValueStore& store)
    : sequences_(store, "history"), store_(&store) {}

auto HistoryLedger::read(std::string_view key) const -> Expected<std::vector<HistoryEntry>> {
    auto stored = sequences_.get(key);
    if (!stored)
        return std::unexpected(stored.error());
    if (!stored->has_value())
        return std::unexpected(Error{Error::Code::DomainNotFound, std::string(key)});
    return std::move(**stored);
}

auto HistoryLedger::length(std::string_view key) const -> Expected<std::size_t> {
    auto stored = sequences_.get(key);
    if (!stored)
        return std::unexpected(stored.error());
    return stored->has_value() ? (*stored)->size() : std::size_t{0};
}

auto HistoryLedger::stageAppend(std::string_view key, HistoryEntry const& entry) const -> Expected<Mutation> {
    auto stored = sequences_.get(key);
    if (!stored)
        return std::unexpected(stored.error());

    std::vector<HistoryEntry> sequence;
    if (stored->has_value())
        sequence = std::move(**stored);
    sequence.push_back(entry);
    return sequences_.stageInsert(key, sequence);
}

auto HistoryLedger::append(std::string_view key, HistoryEntry const& entry) -> Expected<void> {
    auto mutation = stageAppend(key, entry);
    if (!mutation)
        return std::unexpected(mutation.error());
    return store_->apply(std::span<Mutation const>{&mutation.value(), 1});
}

auto HistoryLedger::forEach(std::function<ScanControl(std::string_view key, std::vector<HistoryEntry> const&)> const& visitor) const
        -> Expected<void> {
    return sequences_.forEach(visitor);
}

} // namespace DR
