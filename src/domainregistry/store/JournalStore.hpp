#pragma once

#include "core/RegistryOptions.hpp"
#include "store/JournalFile.hpp"
#include "store/MemoryStore.hpp"

#include <cstdint>
#include <memory>

namespace DR {

/**
 * @brief Durable store: an in-memory ordered map backed by a write-ahead journal.
 *
 * `open()` rebuilds the map by replaying the journal. Each `apply` batch is
 * written as one frame before it becomes visible, so a crash either keeps the
 * whole batch or none of it. After `compactAfterFrames` frames the journal is
 * rewritten as one snapshot frame.
 */
class JournalStore : public MemoryStore {
public:
    explicit JournalStore(StorageOptions options);
    ~JournalStore() override;

    JournalStore(JournalStore const&)            = delete;
    JournalStore& operator=(JournalStore const&) = delete;

    // Also recovers a store poisoned by a failed write: uncommitted bytes are dropped and the journal replayed.
    [[nodiscard]] auto open() -> Expected<void>;
    [[nodiscard]] auto apply(std::span<Mutation const> batch) -> Expected<void> override;
    [[nodiscard]] auto compact() -> Expected<void>;

    [[nodiscard]] auto isOpen() const -> bool;
    [[nodiscard]] auto sequence() const -> std::uint64_t;
    // Frames written since the journal was last compacted or opened.
    [[nodiscard]] auto pendingFrames() const -> std::size_t;
    [[nodiscard]] auto options() const -> StorageOptions const& { return options_; }

private:
    [[nodiscard]] auto compactUnlocked() -> Expected<void>;

    StorageOptions                              options_;
    std::unique_ptr<Storage::JournalFileWriter> writer_;
    std::uint64_t                               sequence_      = 0;
    std::size_t                                 pendingFrames_ = 0;
    // Journal size after the last frame known to be whole on disk.
    std::uintmax_t                              committedBytes_ = 0;
    bool                                        opened_        = false;
    // Set when a failed append may have left a partial frame behind.
    bool                                        poisoned_      = false;
};

} // namespace DR
