#pragma once

#include "core/Error.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string_view>

namespace DR::Storage {

[[nodiscard]] auto fsyncFileDescriptor(int fd) -> Expected<void>;
[[nodiscard]] auto fsyncFile(std::FILE* file) -> Expected<void>;
[[nodiscard]] auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void>;
[[nodiscard]] auto ensureParentDirectory(std::filesystem::path const& path) -> Expected<void>;

[[nodiscard]] auto errnoError(std::string_view prefix) -> Error;

[[nodiscard]] auto fileSizeOrZero(std::filesystem::path const& path) -> std::uintmax_t;

} // namespace DR::Storage
