#pragma once

#include "core/Error.hpp"
#include "type/serialization.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace DR {

struct Mutation {
    enum class Kind : std::uint8_t {
        Insert = 0,
        Remove = 1,
    };

    Kind        kind = Kind::Insert;
    std::string key;
    Bytes       value;

    [[nodiscard]] static auto insert(std::string key, Bytes value) -> Mutation {
        return Mutation{Kind::Insert, std::move(key), std::move(value)};
    }
    [[nodiscard]] static auto remove(std::string key) -> Mutation {
        return Mutation{Kind::Remove, std::move(key), {}};
    }
};

enum class ScanControl {
    Continue,
    Stop,
};

using ScanVisitor = std::function<ScanControl(std::string_view key, Bytes const& value)>;

/**
 * @brief Ordered key-value store the registry persists into.
 *
 * Keys are compared bytewise. `apply` commits a batch as one unit: either every
 * mutation becomes visible (and durable, for durable stores) or none does.
 * Mutations inside a batch are applied in order. Scan visitors run under the
 * store's lock and must not call back into the store.
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    [[nodiscard]] virtual auto get(std::string_view key) const -> Expected<std::optional<Bytes>> = 0;
    [[nodiscard]] virtual auto scan(std::string_view prefix, ScanVisitor const& visitor) const -> Expected<void> = 0;
    [[nodiscard]] virtual auto apply(std::span<Mutation const> batch) -> Expected<void> = 0;

    [[nodiscard]] virtual auto contains(std::string_view key) const -> Expected<bool> {
        auto value = this->get(key);
        if (!value)
            return std::unexpected(value.error());
        return value->has_value();
    }

    [[nodiscard]] auto insert(std::string key, Bytes value) -> Expected<void> {
        Mutation const mutation = Mutation::insert(std::move(key), std::move(value));
        return this->apply(std::span<Mutation const>{&mutation, 1});
    }

    [[nodiscard]] auto remove(std::string key) -> Expected<void> {
        Mutation const mutation = Mutation::remove(std::move(key));
        return this->apply(std::span<Mutation const>{&mutation, 1});
    }
};

} // namespace DR
