#include "store/JournalStore.hpp"

#include "log/TaggedLogger.hpp"
#include "store/FileUtils.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>

namespace DR {

namespace {

auto nowMillis() -> std::uint64_t {
    auto const now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

} // namespace

JournalStore::JournalStore(StorageOptions options)
    : options_(std::move(options)) {}

JournalStore::~JournalStore() {
    if (writer_) {
        if (auto flushed = writer_->flush(); !flushed) {
            dr_log("Journal flush on close failed: " + describeError(flushed.error()), "Journal", "ERROR");
        }
    }
}

auto JournalStore::open() -> Expected<void> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (opened_ && !poisoned_)
        return {};
    if (poisoned_) {
        // Discard whatever the failed write left past the last committed frame, then replay from disk.
        writer_.reset();
        opened_ = false;
        std::error_code ec;
        std::filesystem::resize_file(options_.journalPath, committedBytes_, ec);
        if (ec)
            return std::unexpected(Error{Error::Code::UnknownError, "Failed to discard uncommitted journal bytes: " + ec.message()});
        dr_log("Reopening journal after a failed write", "Journal");
    }
    if (options_.journalPath.empty())
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "Journal path is not configured"});

    this->entries.clear();
    sequence_      = 0;
    pendingFrames_ = 0;

    if (Storage::fileSizeOrZero(options_.journalPath) > 0) {
        auto summary = Storage::replayJournal(options_.journalPath, [this](Storage::JournalFrame&& frame) -> Expected<void> {
            if (frame.snapshot)
                this->entries.clear();
            this->applyUnlocked(frame.mutations);
            return {};
        });
        if (!summary) {
            this->entries.clear();
            return std::unexpected(summary.error());
        }

        if (summary->tornTail) {
            if (!options_.repairTornTail) {
                this->entries.clear();
                return std::unexpected(Error{Error::Code::MalformedInput, "Journal ends inside a frame"});
            }
            std::error_code ec;
            std::filesystem::resize_file(options_.journalPath, summary->validBytes, ec);
            if (ec) {
                this->entries.clear();
                return std::unexpected(Error{Error::Code::UnknownError, "Failed to truncate torn journal tail: " + ec.message()});
            }
            dr_log("Discarded torn journal tail after " + std::to_string(summary->frames) + " frames", "Journal");
        }

        sequence_      = summary->lastSequence;
        pendingFrames_ = summary->frames;
        dr_log("Replayed " + std::to_string(summary->frames) + " journal frames from " + options_.journalPath.string(), "Journal");
    }

    auto writer = std::make_unique<Storage::JournalFileWriter>(options_.journalPath);
    if (auto opened = writer->open(options_.fsyncWrites); !opened) {
        this->entries.clear();
        return opened;
    }
    writer_         = std::move(writer);
    committedBytes_ = Storage::fileSizeOrZero(options_.journalPath);
    opened_         = true;
    poisoned_       = false;
    return {};
}

auto JournalStore::apply(std::span<Mutation const> batch) -> Expected<void> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (!opened_)
        return std::unexpected(Error{Error::Code::UnknownError, "Journal store is not open"});
    if (poisoned_)
        return std::unexpected(Error{Error::Code::UnknownError, "Journal store failed a previous write; reopen required"});
    if (batch.empty())
        return {};

    Storage::JournalFrame frame;
    frame.sequence    = sequence_ + 1;
    frame.timestampMs = nowMillis();
    frame.mutations.assign(batch.begin(), batch.end());

    if (auto appended = writer_->append(frame, options_.fsyncWrites); !appended) {
        poisoned_ = true;
        dr_log("Journal append failed: " + describeError(appended.error()), "Journal", "ERROR");
        return appended;
    }

    sequence_       = frame.sequence;
    committedBytes_ = Storage::fileSizeOrZero(options_.journalPath);
    ++pendingFrames_;
    this->applyUnlocked(batch);

    if (options_.compactAfterFrames > 0 && pendingFrames_ >= options_.compactAfterFrames) {
        if (auto compacted = compactUnlocked(); !compacted) {
            // The batch is already durable in the uncompacted journal.
            dr_log("Journal compaction failed: " + describeError(compacted.error()), "Journal", "ERROR");
        }
    }
    return {};
}

auto JournalStore::compact() -> Expected<void> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (!opened_)
        return std::unexpected(Error{Error::Code::UnknownError, "Journal store is not open"});
    return compactUnlocked();
}

auto JournalStore::compactUnlocked() -> Expected<void> {
    Storage::JournalFrame snapshot;
    snapshot.sequence    = sequence_;
    snapshot.timestampMs = nowMillis();
    snapshot.snapshot    = true;
    snapshot.mutations.reserve(this->entries.size());
    for (auto const& [key, value] : this->entries)
        snapshot.mutations.push_back(Mutation::insert(key, value));

    // The writer keeps the old file open; release it before the rename.
    if (auto flushed = writer_->flush(); !flushed)
        return flushed;
    writer_.reset();

    auto compacted = Storage::compactJournal(options_.journalPath,
                                             std::span<Storage::JournalFrame const>{&snapshot, 1},
                                             options_.fsyncWrites);

    if (compacted)
        committedBytes_ = Storage::fileSizeOrZero(options_.journalPath);

    auto writer = std::make_unique<Storage::JournalFileWriter>(options_.journalPath);
    if (auto reopened = writer->open(false); !reopened) {
        poisoned_ = true;
        return reopened;
    }
    writer_ = std::move(writer);

    if (!compacted)
        return compacted;

    dr_log("Compacted journal to " + std::to_string(snapshot.mutations.size()) + " entries at sequence "
                   + std::to_string(sequence_),
           "Journal");
    pendingFrames_ = 0;
    return {};
}

auto JournalStore::isOpen() const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex);
    return opened_;
}

auto JournalStore::sequence() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return sequence_;
}

auto JournalStore::pendingFrames() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return pendingFrames_;
}

} // namespace DR
