#include "core/RegistryOptions.hpp"

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace DR {

namespace {

using Json = nlohmann::json;

auto configError(std::string message) -> Error {
    return Error{Error::Code::InvalidConfiguration, std::move(message)};
}

template <typename T>
auto readUnsigned(Json const& object, char const* key, T& out) -> Expected<void> {
    auto it = object.find(key);
    if (it == object.end())
        return {};
    if (!it->is_number_unsigned())
        return std::unexpected(configError(std::string(key) + " must be a non-negative integer"));
    out = it->template get<T>();
    return {};
}

auto readBool(Json const& object, char const* key, bool& out) -> Expected<void> {
    auto it = object.find(key);
    if (it == object.end())
        return {};
    if (!it->is_boolean())
        return std::unexpected(configError(std::string(key) + " must be a boolean"));
    out = it->get<bool>();
    return {};
}

auto parseRegistrySection(Json const& section, RegistryOptions& options) -> Expected<void> {
    if (!section.is_object())
        return std::unexpected(configError("registry must be an object"));

    if (auto it = section.find("extensions"); it != section.end()) {
        if (!it->is_array())
            return std::unexpected(configError("registry.extensions must be an array of strings"));
        std::vector<std::string> extensions;
        for (auto const& value : *it) {
            if (!value.is_string())
                return std::unexpected(configError("registry.extensions must be an array of strings"));
            extensions.push_back(value.get<std::string>());
        }
        options.supportedExtensions = std::move(extensions);
    }

    if (auto r = readUnsigned(section, "min_name_length", options.minNameLength); !r)
        return r;
    if (auto r = readUnsigned(section, "max_name_length", options.maxNameLength); !r)
        return r;
    if (auto r = readUnsigned(section, "min_duration_ns", options.minDuration); !r)
        return r;
    return readUnsigned(section, "max_duration_ns", options.maxDuration);
}

auto parseStorageSection(Json const& section, StorageOptions& options) -> Expected<void> {
    if (!section.is_object())
        return std::unexpected(configError("storage must be an object"));

    if (auto it = section.find("journal_path"); it != section.end()) {
        if (!it->is_string())
            return std::unexpected(configError("storage.journal_path must be a string"));
        options.journalPath = it->get<std::string>();
    }
    if (auto r = readBool(section, "fsync", options.fsyncWrites); !r)
        return r;
    if (auto r = readUnsigned(section, "compact_after_frames", options.compactAfterFrames); !r)
        return r;
    return readBool(section, "repair_torn_tail", options.repairTornTail);
}

} // namespace

auto validateOptions(RegistryOptions const& options) -> Expected<void> {
    if (options.minNameLength == 0)
        return std::unexpected(configError("min_name_length must be at least 1"));
    if (options.minNameLength > options.maxNameLength)
        return std::unexpected(configError("min_name_length exceeds max_name_length"));
    if (options.minDuration > options.maxDuration)
        return std::unexpected(configError("min_duration_ns exceeds max_duration_ns"));
    if (options.supportedExtensions.empty())
        return std::unexpected(configError("at least one extension must be supported"));
    for (auto const& extension : options.supportedExtensions) {
        if (extension.empty())
            return std::unexpected(configError("extensions must not be empty"));
        if (extension.find('.') != std::string::npos)
            return std::unexpected(configError("extension '" + extension + "' contains the key separator"));
    }
    return {};
}

auto parseRegistryConfig(std::string_view jsonText) -> Expected<RegistryConfig> {
    auto document = Json::parse(jsonText.begin(), jsonText.end(), nullptr, false);
    if (document.is_discarded())
        return std::unexpected(configError("configuration is not valid JSON"));
    if (!document.is_object())
        return std::unexpected(configError("configuration root must be an object"));

    RegistryConfig config;
    if (auto it = document.find("registry"); it != document.end()) {
        if (auto parsed = parseRegistrySection(*it, config.registry); !parsed)
            return std::unexpected(parsed.error());
    }
    if (auto it = document.find("storage"); it != document.end()) {
        if (auto parsed = parseStorageSection(*it, config.storage); !parsed)
            return std::unexpected(parsed.error());
    }
    if (auto parsed = readBool(document, "logging", config.logging); !parsed)
        return std::unexpected(parsed.error());

    if (auto valid = validateOptions(config.registry); !valid)
        return std::unexpected(valid.error());
    return config;
}

auto loadRegistryConfig(std::filesystem::path const& path) -> Expected<RegistryConfig> {
    std::ifstream input(path, std::ios::binary);
    if (!input)
        return std::unexpected(Error{Error::Code::NotFound, "Unable to open configuration " + path.string()});
    std::ostringstream buffer;
    buffer << input.rdbuf();
    auto config = parseRegistryConfig(buffer.str());
    if (!config) {
        dr_log("Rejected configuration " + path.string() + ": " + describeError(config.error()), "Config", "ERROR");
    }
    return config;
}

auto applyEnvironmentOverrides(RegistryConfig& config) -> void {
    if (const char* journal = std::getenv("DOMAIN_REGISTRY_JOURNAL")) {
        if (*journal != '\0')
            config.storage.journalPath = journal;
    }
    if (const char* log = std::getenv("DOMAIN_REGISTRY_LOG")) {
        config.logging = std::strcmp(log, "0") != 0;
    }
}

auto applyLoggingConfig(RegistryConfig const& config) -> void {
#ifdef DR_LOG_DEBUG
    set_logging_enabled(config.logging);
#else
    (void)config;
#endif
}

} // namespace DR
