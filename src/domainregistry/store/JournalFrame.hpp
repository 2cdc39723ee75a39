#pragma once

#include "core/Error.hpp"
#include "store/KeyValueStore.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace DR::Storage {

inline constexpr std::uint32_t FrameMagic   = 0x44524A46; // 'DRJF'
inline constexpr std::uint16_t FrameVersion = 1;

/**
 * One committed batch in the journal. A snapshot frame replaces the whole
 * store content and is only written by compaction.
 */
struct JournalFrame {
    std::uint64_t         sequence    = 0;
    std::uint64_t         timestampMs = 0;
    bool                  snapshot    = false;
    std::vector<Mutation> mutations;
};

[[nodiscard]] auto serializeFrame(JournalFrame const& frame) -> Expected<std::vector<std::byte>>;
[[nodiscard]] auto deserializeFrame(std::span<const std::byte> bytes) -> Expected<JournalFrame>;

} // namespace DR::Storage
