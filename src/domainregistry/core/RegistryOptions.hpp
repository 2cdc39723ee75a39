#pragma once

#include "core/CallContext.hpp"
#include "core/Error.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace DR {

inline constexpr Duration DefaultMinDuration = NanosPerSecond;                // 1 second
inline constexpr Duration DefaultMaxDuration = 365ULL * 24 * 3600 * NanosPerSecond; // 1 year

/**
 * @brief Naming and duration policy enforced by the registry.
 */
struct RegistryOptions {
    std::vector<std::string> supportedExtensions{"icp", "ic", "moon"};
    std::size_t              minNameLength = 3;
    std::size_t              maxNameLength = 40;
    Duration                 minDuration   = DefaultMinDuration;
    Duration                 maxDuration   = DefaultMaxDuration;
};

struct StorageOptions {
    std::filesystem::path journalPath;
    bool                  fsyncWrites        = false;
    // Rewrite the journal as a single snapshot after this many frames; 0 disables.
    std::size_t           compactAfterFrames = 1024;
    // Drop a final frame cut short by a crash instead of failing to open.
    bool                  repairTornTail     = true;
};

struct RegistryConfig {
    RegistryOptions registry;
    StorageOptions  storage;
    bool            logging = false;
};

[[nodiscard]] auto validateOptions(RegistryOptions const& options) -> Expected<void>;

[[nodiscard]] auto parseRegistryConfig(std::string_view jsonText) -> Expected<RegistryConfig>;
[[nodiscard]] auto loadRegistryConfig(std::filesystem::path const& path) -> Expected<RegistryConfig>;

// DOMAIN_REGISTRY_JOURNAL overrides the journal path, DOMAIN_REGISTRY_LOG (not "0") enables logging.
auto applyEnvironmentOverrides(RegistryConfig& config) -> void;

// Enables the tagged logger when compiled with DR_LOG_DEBUG.
auto applyLoggingConfig(RegistryConfig const& config) -> void;

} // namespace DR
