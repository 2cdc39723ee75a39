#pragma once

#include "core/Error.hpp"
#include "core/RegistryOptions.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace DR {

inline constexpr char DomainKeySeparator = '.';

/**
 * @brief Canonical `name.extension` key of a registry entry.
 *
 * Only constructible through validation, so holding a DomainKey means the
 * name length and extension satisfied the registry policy.
 */
class DomainKey {
public:
    // Validates separate fields; errors: InvalidDomainNameLength, InvalidDomainExtension, InvalidDomainKey.
    [[nodiscard]] static auto fromParts(std::string_view name, std::string_view extension, RegistryOptions const& options)
            -> Expected<DomainKey>;
    // Validates a combined key by splitting at the first separator; every failure is InvalidDomainKey.
    [[nodiscard]] static auto parse(std::string_view key, RegistryOptions const& options) -> Expected<DomainKey>;

    [[nodiscard]] auto str() const -> std::string const& { return key_; }
    [[nodiscard]] auto name() const -> std::string_view { return std::string_view{key_}.substr(0, separator_); }
    [[nodiscard]] auto extension() const -> std::string_view { return std::string_view{key_}.substr(separator_ + 1); }

    auto operator==(DomainKey const& other) const -> bool { return key_ == other.key_; }

private:
    DomainKey(std::string key, std::size_t separator)
        : key_(std::move(key)), separator_(separator) {}

    std::string key_;
    std::size_t separator_ = 0;
};

// Number of Unicode code points in a UTF-8 string.
[[nodiscard]] auto nameLength(std::string_view name) -> std::size_t;

[[nodiscard]] auto isSupportedExtension(std::string_view extension, RegistryOptions const& options) -> bool;

} // namespace DR
