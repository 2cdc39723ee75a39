#pragma once
#include "core/Principal.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace DR {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        CallerNotCanisterOwner,
        CallerNotDomainOwner,
        DomainNotFound,
        DomainStillValid,
        DomainAlreadyClaimed,
        DomainOwnershipExpired,
        InvalidDuration,
        InvalidDomainNameLength,
        InvalidDomainExtension,
        InvalidDomainKey,
        DomainReserved,
        AlreadyInitialized,
        NotInitialized,
        InvalidConfiguration,
        MalformedInput,
        NotFound
    };

    // Identity or number the caller needs to react to the error.
    using Subject = std::variant<std::monostate, Principal, std::uint64_t>;

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}
    Error(Code c, Principal who)
        : code(c), subject(std::move(who)) {}
    Error(Code c, std::uint64_t value)
        : code(c), subject(value) {}

    [[nodiscard]] auto principal() const -> std::optional<Principal> {
        if (auto const* who = std::get_if<Principal>(&subject))
            return *who;
        return std::nullopt;
    }

    [[nodiscard]] auto number() const -> std::optional<std::uint64_t> {
        if (auto const* value = std::get_if<std::uint64_t>(&subject))
            return *value;
        return std::nullopt;
    }

    Code                       code;
    std::optional<std::string> message;
    Subject                    subject;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::CallerNotCanisterOwner:
        return "caller_not_canister_owner";
    case Error::Code::CallerNotDomainOwner:
        return "caller_not_domain_owner";
    case Error::Code::DomainNotFound:
        return "domain_not_found";
    case Error::Code::DomainStillValid:
        return "domain_still_valid";
    case Error::Code::DomainAlreadyClaimed:
        return "domain_already_claimed";
    case Error::Code::DomainOwnershipExpired:
        return "domain_ownership_expired";
    case Error::Code::InvalidDuration:
        return "invalid_duration";
    case Error::Code::InvalidDomainNameLength:
        return "invalid_domain_name_length";
    case Error::Code::InvalidDomainExtension:
        return "invalid_domain_extension";
    case Error::Code::InvalidDomainKey:
        return "invalid_domain_key";
    case Error::Code::DomainReserved:
        return "domain_reserved";
    case Error::Code::AlreadyInitialized:
        return "already_initialized";
    case Error::Code::NotInitialized:
        return "not_initialized";
    case Error::Code::InvalidConfiguration:
        return "invalid_configuration";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::NotFound:
        return "not_found";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const  label = errorCodeToString(error.code);
    std::string detail;
    if (error.message && !error.message->empty()) {
        detail = *error.message;
    } else if (auto who = error.principal()) {
        detail = who->text;
    } else if (auto value = error.number()) {
        detail = std::to_string(*value);
    }
    if (detail.empty())
        return std::string{label};

    std::string description;
    description.reserve(label.size() + 1 + detail.size());
    description.append(label.data(), label.size());
    description.push_back(':');
    description.append(detail);
    return description;
}

} // namespace DR
