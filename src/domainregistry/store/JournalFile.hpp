#pragma once

#include "core/Error.hpp"
#include "store/JournalFrame.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <span>

namespace DR::Storage {

inline constexpr std::uint32_t JournalFileMagic   = 0x44524A4C; // 'DRJL'
inline constexpr std::uint16_t JournalFileVersion = 1;
inline constexpr std::size_t   JournalHeaderSize  = sizeof(std::uint32_t) + sizeof(std::uint16_t) + sizeof(std::uint32_t);

class JournalFileWriter {
public:
    explicit JournalFileWriter(std::filesystem::path path);
    ~JournalFileWriter();

    JournalFileWriter(JournalFileWriter const&)                = delete;
    JournalFileWriter& operator=(JournalFileWriter const&)     = delete;
    JournalFileWriter(JournalFileWriter&&) noexcept            = delete;
    JournalFileWriter& operator=(JournalFileWriter&&) noexcept = delete;

    [[nodiscard]] auto open(bool fsyncHeader = false) -> Expected<void>;
    [[nodiscard]] auto append(JournalFrame const& frame, bool fsync = false) -> Expected<void>;
    [[nodiscard]] auto flush() -> Expected<void>;

    [[nodiscard]] auto path() const -> std::filesystem::path const& { return filePath; }

private:
    [[nodiscard]] auto ensureOpened(bool fsyncHeader) -> Expected<void>;
    [[nodiscard]] auto writeHeader(bool fsync) -> Expected<void>;
    [[nodiscard]] auto validateHeader() -> Expected<void>;
    std::filesystem::path filePath;
    std::FILE*            handle = nullptr;
};

struct ReplaySummary {
    std::size_t    frames       = 0;
    std::uint64_t  lastSequence = 0;
    // Bytes up to and including the last whole frame.
    std::uintmax_t validBytes   = 0;
    // The file ends inside a frame, as left by a crash mid-append.
    bool           tornTail     = false;
};

/**
 * Replays every whole frame in order. A final frame cut short stops replay
 * and is reported through `tornTail`; a complete frame that fails to decode,
 * or whose sequence does not increase, is an error.
 */
[[nodiscard]] auto replayJournal(
        std::filesystem::path const&                           path,
        std::function<Expected<void>(JournalFrame&&)> const& onFrame) -> Expected<ReplaySummary>;

[[nodiscard]] auto compactJournal(
        std::filesystem::path const&   path,
        std::span<JournalFrame const> frames,
        bool                           fsyncTarget) -> Expected<void>;

} // namespace DR::Storage
