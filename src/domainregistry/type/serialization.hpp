#pragma once

#include "core/Error.hpp"

#include <alpaca/alpaca.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <limits>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace DR {

using Bytes = std::vector<std::uint8_t>;

template <typename T>
struct Wrapper {
    T obj;
};

struct Header {
    std::uint32_t size = 0;
};

// Size header for a payload; the header field is 32 bits wide.
[[nodiscard]] inline auto makeHeader(std::size_t payloadSize) -> Expected<Header> {
    if (payloadSize > std::numeric_limits<std::uint32_t>::max())
        return std::unexpected(Error{Error::Code::UnknownError, "Serialized value exceeds maximum encodable size"});
    return Header{.size = static_cast<std::uint32_t>(payloadSize)};
}

/**
 * Serialize a value with alpaca behind a size header.
 * Stored values carry the header so a truncated value is detected before
 * alpaca sees it.
 */
template <typename T>
[[nodiscard]] inline auto encodeValue(T const& obj) -> Expected<Bytes> {
    try {
        Wrapper<T> wrapper{obj};
        Bytes      payload;
        (void)alpaca::serialize<Wrapper<T>, 1>(wrapper, payload);
        auto header = makeHeader(payload.size());
        if (!header)
            return std::unexpected(header.error());

        Bytes bytes(sizeof(Header));
        std::memcpy(bytes.data(), &header.value(), sizeof(Header));
        bytes.insert(bytes.end(), payload.begin(), payload.end());
        return bytes;
    } catch (const std::exception& e) {
        return std::unexpected(Error{Error::Code::UnknownError, std::string("Serialization failed: ") + e.what()});
    }
}

template <typename T>
[[nodiscard]] inline auto decodeValue(std::span<const std::uint8_t> bytes) -> Expected<T> {
    try {
        if (bytes.size() < sizeof(Header)) {
            return std::unexpected(Error{Error::Code::MalformedInput, "Buffer too small for header"});
        }

        Header header{};
        std::memcpy(&header, bytes.data(), sizeof(header));
        if (bytes.size() != sizeof(header) + header.size) {
            return std::unexpected(Error{Error::Code::MalformedInput, "Stored value size mismatch"});
        }

        Bytes payload(bytes.begin() + sizeof(header), bytes.end());

        std::error_code ec;
        auto            wrapper = alpaca::deserialize<Wrapper<T>, 1>(payload, ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::MalformedInput, ec.message()});
        }
        return std::move(wrapper.obj);
    } catch (const std::exception& e) {
        return std::unexpected(Error{Error::Code::MalformedInput, std::string("Deserialization failed: ") + e.what()});
    }
}

} // namespace DR
