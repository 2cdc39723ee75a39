#pragma once

#include "core/Error.hpp"
#include "store/KeyValueStore.hpp"
#include "type/serialization.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace DR {

/**
 * @brief Typed view of one collection inside a KeyValueStore.
 *
 * Entries live under `<collection>/<key>`, so collections sharing a store
 * never collide and scan in key order. Values are encoded with alpaca.
 * `stage*` builds a mutation without committing it, for use in a batch.
 */
template <typename V>
class StableMap {
public:
    StableMap(KeyValueStore& store, std::string_view collection)
        : store_(&store), prefix_(std::string(collection) + "/") {}

    [[nodiscard]] auto get(std::string_view key) const -> Expected<std::optional<V>> {
        auto raw = store_->get(storageKey(key));
        if (!raw)
            return std::unexpected(raw.error());
        if (!raw->has_value())
            return std::optional<V>{};
        auto decoded = decodeValue<V>(**raw);
        if (!decoded)
            return std::unexpected(decoded.error());
        return std::optional<V>{std::move(decoded.value())};
    }

    [[nodiscard]] auto contains(std::string_view key) const -> Expected<bool> {
        return store_->contains(storageKey(key));
    }

    [[nodiscard]] auto stageInsert(std::string_view key, V const& value) const -> Expected<Mutation> {
        auto encoded = encodeValue(value);
        if (!encoded)
            return std::unexpected(encoded.error());
        return Mutation::insert(storageKey(key), std::move(encoded.value()));
    }

    [[nodiscard]] auto stageRemove(std::string_view key) const -> Mutation {
        return Mutation::remove(storageKey(key));
    }

    [[nodiscard]] auto insert(std::string_view key, V const& value) -> Expected<void> {
        auto mutation = stageInsert(key, value);
        if (!mutation)
            return std::unexpected(mutation.error());
        return store_->apply(std::span<Mutation const>{&mutation.value(), 1});
    }

    [[nodiscard]] auto remove(std::string_view key) -> Expected<void> {
        return store_->remove(storageKey(key));
    }

    // Visits entries in ascending key order; the visitor returns Stop to end early.
    [[nodiscard]] auto forEach(std::function<ScanControl(std::string_view key, V const& value)> const& visitor) const
            -> Expected<void> {
        std::optional<Error> decodeError;
        auto                 scanned = store_->scan(prefix_, [&](std::string_view fullKey, Bytes const& raw) {
            auto decoded = decodeValue<V>(raw);
            if (!decoded) {
                decodeError = Error{decoded.error().code,
                                    "Failed to decode '" + std::string(fullKey) + "': "
                                            + decoded.error().message.value_or("")};
                return ScanControl::Stop;
            }
            return visitor(fullKey.substr(prefix_.size()), *decoded);
        });
        if (!scanned)
            return scanned;
        if (decodeError)
            return std::unexpected(*decodeError);
        return {};
    }

    [[nodiscard]] auto collection() const -> std::string_view {
        return std::string_view{prefix_}.substr(0, prefix_.size() - 1);
    }

private:
    [[nodiscard]] auto storageKey(std::string_view key) const -> std::string {
        std::string full;
        full.reserve(prefix_.size() + key.size());
        full.append(prefix_);
        full.append(key);
        return full;
    }

    KeyValueStore* store_;
    std::string    prefix_;
};

} // namespace DR
