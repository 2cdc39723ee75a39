#pragma once
#include <compare>
#include <string>

namespace DR {

/**
 * @brief Opaque textual identity of a caller, an owner or the administrator.
 *
 * Kept an aggregate so it can be serialized directly by alpaca.
 */
struct Principal {
    std::string text;

    // Placeholder identity used when no real caller is known.
    [[nodiscard]] static auto anonymous() -> Principal { return Principal{"2vxsx-fae"}; }

    [[nodiscard]] auto isAnonymous() const -> bool { return text == "2vxsx-fae"; }

    auto operator<=>(Principal const&) const = default;
    auto operator==(Principal const&) const -> bool = default;
};

} // namespace DR
