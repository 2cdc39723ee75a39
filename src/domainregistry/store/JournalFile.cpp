#include "store/JournalFile.hpp"

#include "store/FileUtils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <limits>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <unistd.h>

namespace {

using DR::Error;
using DR::Expected;
using DR::Storage::JournalFileMagic;
using DR::Storage::JournalFileVersion;
using DR::Storage::JournalFrame;

inline auto makeError(Error::Code code, std::string message) -> Error {
    return Error{code, std::move(message)};
}

inline auto readScalar(std::FILE* file, void* out, std::size_t size) -> Expected<void> {
    if (std::fread(out, size, 1, file) != 1) {
        if (std::feof(file))
            return std::unexpected(makeError(Error::Code::MalformedInput, "Unexpected end of journal file"));
        return std::unexpected(DR::Storage::errnoError("Failed to read journal file"));
    }
    return {};
}

inline auto writeScalar(std::FILE* file, void const* data, std::size_t size) -> Expected<void> {
    if (std::fwrite(data, size, 1, file) != 1)
        return std::unexpected(DR::Storage::errnoError("Failed to write journal file"));
    return {};
}

inline auto writeFileHeader(std::FILE* file) -> Expected<void> {
    if (auto writeMagic = writeScalar(file, &JournalFileMagic, sizeof(JournalFileMagic)); !writeMagic)
        return writeMagic;
    if (auto writeVersion = writeScalar(file, &JournalFileVersion, sizeof(JournalFileVersion)); !writeVersion)
        return writeVersion;
    std::uint32_t reserved = 0;
    return writeScalar(file, &reserved, sizeof(reserved));
}

inline auto readFileHeader(std::FILE* file) -> Expected<void> {
    std::uint32_t magic = 0;
    if (auto readMagic = readScalar(file, &magic, sizeof(magic)); !readMagic)
        return readMagic;
    if (magic != JournalFileMagic)
        return std::unexpected(makeError(Error::Code::MalformedInput, "Journal file header magic mismatch"));

    std::uint16_t version = 0;
    if (auto readVersion = readScalar(file, &version, sizeof(version)); !readVersion)
        return readVersion;
    if (version != JournalFileVersion)
        return std::unexpected(makeError(Error::Code::MalformedInput, "Unsupported journal file version"));

    std::uint32_t reserved = 0;
    if (auto readReserved = readScalar(file, &reserved, sizeof(reserved)); !readReserved)
        return readReserved;
    (void)reserved;
    return {};
}

inline auto writeFrame(std::FILE* file, JournalFrame const& frame) -> Expected<void> {
    auto serialized = DR::Storage::serializeFrame(frame);
    if (!serialized)
        return std::unexpected(serialized.error());

    if (serialized->size() > std::numeric_limits<std::uint32_t>::max())
        return std::unexpected(makeError(Error::Code::UnknownError, "Journal frame exceeds maximum encodable size"));

    std::uint32_t length = static_cast<std::uint32_t>(serialized->size());
    if (auto writeLength = writeScalar(file, &length, sizeof(length)); !writeLength)
        return writeLength;
    if (!serialized->empty()) {
        if (std::fwrite(serialized->data(), 1, serialized->size(), file) != serialized->size())
            return std::unexpected(DR::Storage::errnoError("Failed to write journal frame payload"));
    }
    return {};
}

} // namespace

namespace DR::Storage {

JournalFileWriter::JournalFileWriter(std::filesystem::path path)
    : filePath(std::move(path)) {}

JournalFileWriter::~JournalFileWriter() {
    if (handle) {
        std::fflush(handle);
        std::fclose(handle);
    }
}

auto JournalFileWriter::open(bool fsyncHeader) -> Expected<void> {
    return ensureOpened(fsyncHeader);
}

auto JournalFileWriter::append(JournalFrame const& frame, bool fsync) -> Expected<void> {
    if (auto ensure = ensureOpened(fsync); !ensure)
        return ensure;

    if (auto written = writeFrame(handle, frame); !written)
        return written;

    if (fsync)
        return fsyncFile(handle);
    if (std::fflush(handle) != 0)
        return std::unexpected(errnoError("Failed to flush journal writer"));
    return {};
}

auto JournalFileWriter::flush() -> Expected<void> {
    if (!handle)
        return {};
    if (std::fflush(handle) != 0)
        return std::unexpected(errnoError("Failed to flush journal writer"));
    return {};
}

auto JournalFileWriter::ensureOpened(bool fsyncHeader) -> Expected<void> {
    if (handle)
        return {};

    if (auto parent = ensureParentDirectory(filePath); !parent)
        return parent;

    bool needHeader = fileSizeOrZero(filePath) == 0;
    if (needHeader) {
        auto write = writeHeader(fsyncHeader);
        if (!write)
            return write;
    }

    handle = std::fopen(filePath.string().c_str(), "rb+");
    if (!handle)
        return std::unexpected(errnoError("Failed to open journal file"));

    if (!needHeader) {
        if (auto validate = validateHeader(); !validate) {
            std::fclose(handle);
            handle = nullptr;
            return validate;
        }
    }

    if (std::fseek(handle, 0, SEEK_END) != 0) {
        auto err = errnoError("Failed to seek journal file");
        std::fclose(handle);
        handle = nullptr;
        return std::unexpected(err);
    }

    return {};
}

auto JournalFileWriter::writeHeader(bool fsync) -> Expected<void> {
    auto       parent     = filePath.parent_path();
    std::FILE* headerFile = std::fopen(filePath.string().c_str(), "wb");
    if (!headerFile)
        return std::unexpected(errnoError("Failed to create journal file"));

    auto guard = std::unique_ptr<std::FILE, decltype(&std::fclose)>{headerFile, &std::fclose};

    if (auto header = writeFileHeader(headerFile); !header)
        return header;

    if (fsync) {
        if (auto sync = fsyncFile(headerFile); !sync)
            return sync;
    } else if (std::fflush(headerFile) != 0) {
        return std::unexpected(errnoError("Failed to flush journal header"));
    }

    if (std::fclose(guard.release()) != 0)
        return std::unexpected(errnoError("Failed to close journal header"));

    if (fsync && !parent.empty()) {
        if (auto dirSync = fsyncDirectory(parent); !dirSync)
            return dirSync;
    }

    return {};
}

auto JournalFileWriter::validateHeader() -> Expected<void> {
    return readFileHeader(handle);
}

auto replayJournal(
        std::filesystem::path const&                           path,
        std::function<Expected<void>(JournalFrame&&)> const& onFrame) -> Expected<ReplaySummary> {
    std::FILE* file = std::fopen(path.string().c_str(), "rb");
    if (!file) {
        if (errno == ENOENT)
            return std::unexpected(makeError(Error::Code::NotFound, "Journal file not found"));
        return std::unexpected(errnoError("Failed to open journal file for replay"));
    }

    auto guard = std::unique_ptr<std::FILE, decltype(&std::fclose)>{file, &std::fclose};

    if (auto header = readFileHeader(file); !header)
        return std::unexpected(header.error());

    auto const fileSize = fileSizeOrZero(path);

    ReplaySummary summary;
    summary.validBytes = JournalHeaderSize;

    while (true) {
        std::uint32_t length     = 0;
        auto          readLength = std::fread(&length, 1, sizeof(length), file);
        if (readLength != sizeof(length)) {
            if (std::ferror(file))
                return std::unexpected(errnoError("Failed to read journal frame length"));
            summary.tornTail = readLength != 0;
            break;
        }

        // A length running past the end of the file belongs to a frame cut short.
        auto const remaining = fileSize - std::min<std::uintmax_t>(fileSize, summary.validBytes + sizeof(length));
        if (length > remaining) {
            summary.tornTail = true;
            break;
        }

        std::vector<std::byte> buffer;
        buffer.resize(length);
        if (length > 0) {
            if (std::fread(buffer.data(), 1, length, file) != length) {
                if (std::ferror(file))
                    return std::unexpected(errnoError("Failed to read journal frame payload"));
                summary.tornTail = true;
                break;
            }
        }

        auto decoded = deserializeFrame(std::span<const std::byte>{buffer.data(), buffer.size()});
        if (!decoded)
            return std::unexpected(decoded.error());

        if (summary.frames > 0 && decoded->sequence <= summary.lastSequence) {
            return std::unexpected(makeError(Error::Code::MalformedInput, "Journal frame sequence does not increase"));
        }
        summary.lastSequence = decoded->sequence;

        if (auto callbackResult = onFrame(std::move(decoded.value())); !callbackResult)
            return std::unexpected(callbackResult.error());

        ++summary.frames;
        summary.validBytes += sizeof(length) + length;
    }

    return summary;
}

auto compactJournal(
        std::filesystem::path const&   path,
        std::span<JournalFrame const> frames,
        bool                           fsyncTarget) -> Expected<void> {
    if (auto parent = ensureParentDirectory(path); !parent)
        return parent;

    auto tempPath = path;
    tempPath += ".tmp";

    std::FILE* file = std::fopen(tempPath.string().c_str(), "wb");
    if (!file)
        return std::unexpected(errnoError("Failed to open journal temp file"));

    auto guard = std::unique_ptr<std::FILE, decltype(&std::fclose)>{file, &std::fclose};

    if (auto header = writeFileHeader(file); !header)
        return header;

    for (auto const& frame : frames) {
        if (auto written = writeFrame(file, frame); !written)
            return written;
    }

    if (fsyncTarget) {
        if (auto sync = fsyncFile(file); !sync)
            return sync;
    } else if (std::fflush(file) != 0) {
        return std::unexpected(errnoError("Failed to flush journal temp file"));
    }

    if (std::fclose(guard.release()) != 0) {
        auto err = errnoError("Failed to close journal temp file");
        std::error_code removeEc;
        std::filesystem::remove(tempPath, removeEc);
        return std::unexpected(err);
    }

    std::error_code renameEc;
    std::filesystem::rename(tempPath, path, renameEc);
    if (renameEc) {
        std::error_code removeEc;
        std::filesystem::remove(tempPath, removeEc);
        return std::unexpected(
                makeError(Error::Code::UnknownError, "Failed to replace journal file: " + renameEc.message()));
    }

    auto parent = path.parent_path();
    if (fsyncTarget && !parent.empty()) {
        if (auto dirSync = fsyncDirectory(parent); !dirSync)
            return dirSync;
    }

    return {};
}

} // namespace DR::Storage
