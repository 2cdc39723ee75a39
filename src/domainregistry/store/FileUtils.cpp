#include "store/FileUtils.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace DR::Storage {

auto errnoError(std::string_view prefix) -> Error {
    return Error{Error::Code::UnknownError, std::string(prefix) + ": " + std::strerror(errno)};
}

auto fsyncFileDescriptor(int fd) -> Expected<void> {
    if (::fsync(fd) != 0) {
        return std::unexpected(errnoError("fsync failed"));
    }
    return {};
}

auto fsyncFile(std::FILE* file) -> Expected<void> {
    if (!file)
        return {};
    if (std::fflush(file) != 0)
        return std::unexpected(errnoError("Failed to flush journal file"));
    auto fd = ::fileno(file);
    if (fd == -1)
        return std::unexpected(errnoError("Failed to acquire journal file descriptor"));
    return fsyncFileDescriptor(fd);
}

auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void> {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return std::unexpected(errnoError("open directory failed"));
    }
    auto result = fsyncFileDescriptor(fd);
    ::close(fd);
    return result;
}

auto ensureParentDirectory(std::filesystem::path const& path) -> Expected<void> {
    auto parent = path.parent_path();
    if (parent.empty())
        return {};
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return std::unexpected(
                Error{Error::Code::UnknownError, "Failed to create journal directory: " + ec.message()});
    }
    return {};
}

auto fileSizeOrZero(std::filesystem::path const& path) -> std::uintmax_t {
    std::error_code ec;
    auto            size = std::filesystem::file_size(path, ec);
    return ec ? 0 : size;
}

} // namespace DR::Storage
