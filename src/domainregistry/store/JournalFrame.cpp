#include "store/JournalFrame.hpp"

#include <cstring>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

namespace {

using DR::Error;
using DR::Expected;
using DR::Mutation;
using DR::Storage::JournalFrame;

constexpr std::uint8_t kSnapshotFlag = 0x01;

template <typename T>
inline void appendScalar(std::vector<std::byte>& buffer, T value) {
    static_assert(std::is_trivially_copyable_v<T>, "appendScalar requires trivially copyable type");
    std::uint8_t local[sizeof(T)];
    std::memcpy(local, &value, sizeof(T));
    auto const base = reinterpret_cast<const std::byte*>(local);
    buffer.insert(buffer.end(), base, base + sizeof(T));
}

template <typename T>
inline auto readScalar(std::span<const std::byte>& bytes) -> std::optional<T> {
    if (bytes.size() < sizeof(T))
        return std::nullopt;
    T value{};
    std::memcpy(&value, bytes.data(), sizeof(T));
    bytes = bytes.subspan(sizeof(T));
    return value;
}

inline auto appendBlob(std::vector<std::byte>& buffer, void const* data, std::size_t size) -> void {
    appendScalar<std::uint32_t>(buffer, static_cast<std::uint32_t>(size));
    if (size > 0) {
        auto const* bytes = static_cast<std::byte const*>(data);
        buffer.insert(buffer.end(), bytes, bytes + size);
    }
}

inline auto readBlob(std::span<const std::byte>& bytes, std::string_view what) -> Expected<std::span<const std::byte>> {
    auto length = readScalar<std::uint32_t>(bytes);
    if (!length.has_value()) {
        return std::unexpected(
                Error{Error::Code::MalformedInput, "Journal frame truncated (" + std::string(what) + " length)"});
    }
    if (bytes.size() < *length) {
        return std::unexpected(
                Error{Error::Code::MalformedInput, "Journal frame truncated (" + std::string(what) + " bytes)"});
    }
    auto blob = bytes.subspan(0, *length);
    bytes     = bytes.subspan(*length);
    return blob;
}

inline auto makeError(std::string message) -> Error {
    return Error{Error::Code::UnknownError, std::move(message)};
}

} // namespace

namespace DR::Storage {

auto serializeFrame(JournalFrame const& frame) -> Expected<std::vector<std::byte>> {
    constexpr auto maxLength = std::numeric_limits<std::uint32_t>::max();
    if (frame.mutations.size() > maxLength)
        return std::unexpected(makeError("Journal frame holds too many mutations"));

    std::size_t reserve = 32;
    for (auto const& mutation : frame.mutations) {
        if (mutation.key.size() > maxLength)
            return std::unexpected(makeError("Journal mutation key exceeds encodable length"));
        if (mutation.value.size() > maxLength)
            return std::unexpected(makeError("Journal mutation value exceeds encodable length"));
        reserve += 9 + mutation.key.size() + mutation.value.size();
    }

    std::vector<std::byte> buffer;
    buffer.reserve(reserve);

    appendScalar<std::uint32_t>(buffer, FrameMagic);
    appendScalar<std::uint16_t>(buffer, FrameVersion);
    std::uint8_t flags = frame.snapshot ? kSnapshotFlag : 0u;
    appendScalar<std::uint8_t>(buffer, flags);
    appendScalar<std::uint8_t>(buffer, 0u); // reserved

    appendScalar<std::uint64_t>(buffer, frame.sequence);
    appendScalar<std::uint64_t>(buffer, frame.timestampMs);
    appendScalar<std::uint32_t>(buffer, static_cast<std::uint32_t>(frame.mutations.size()));

    for (auto const& mutation : frame.mutations) {
        appendScalar<std::uint8_t>(buffer, static_cast<std::uint8_t>(mutation.kind));
        appendBlob(buffer, mutation.key.data(), mutation.key.size());
        appendBlob(buffer, mutation.value.data(), mutation.value.size());
    }

    return buffer;
}

auto deserializeFrame(std::span<const std::byte> bytes) -> Expected<JournalFrame> {
    auto data  = bytes;
    auto magic = readScalar<std::uint32_t>(data);
    if (!magic.has_value() || *magic != FrameMagic) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Journal frame missing magic header"});
    }

    auto version = readScalar<std::uint16_t>(data);
    if (!version.has_value()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Journal frame missing version"});
    }
    if (*version != FrameVersion) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Unsupported journal frame version"});
    }

    auto flagByte = readScalar<std::uint8_t>(data);
    auto reserved = readScalar<std::uint8_t>(data);
    auto sequence = readScalar<std::uint64_t>(data);
    auto stamp    = readScalar<std::uint64_t>(data);
    auto count    = readScalar<std::uint32_t>(data);
    if (!flagByte || !reserved || !sequence || !stamp || !count) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Journal frame truncated (metadata)"});
    }

    JournalFrame frame;
    frame.snapshot    = (*flagByte & kSnapshotFlag) != 0;
    frame.sequence    = *sequence;
    frame.timestampMs = *stamp;

    for (std::uint32_t i = 0; i < *count; ++i) {
        auto kind = readScalar<std::uint8_t>(data);
        if (!kind.has_value()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "Journal frame truncated (mutation kind)"});
        }
        if (*kind > static_cast<std::uint8_t>(Mutation::Kind::Remove)) {
            return std::unexpected(Error{Error::Code::MalformedInput, "Unknown journal mutation kind"});
        }

        auto key = readBlob(data, "key");
        if (!key)
            return std::unexpected(key.error());
        auto value = readBlob(data, "value");
        if (!value)
            return std::unexpected(value.error());

        Mutation mutation;
        mutation.kind = static_cast<Mutation::Kind>(*kind);
        mutation.key.assign(reinterpret_cast<char const*>(key->data()), key->size());
        if (mutation.kind == Mutation::Kind::Remove && !value->empty()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "Journal remove mutation carries a value"});
        }
        auto const* valueBytes = reinterpret_cast<std::uint8_t const*>(value->data());
        mutation.value.assign(valueBytes, valueBytes + value->size());
        frame.mutations.push_back(std::move(mutation));
    }

    if (!data.empty()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "Journal frame has trailing bytes"});
    }

    return frame;
}

} // namespace DR::Storage
