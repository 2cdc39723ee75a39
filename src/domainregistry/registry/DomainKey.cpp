#include "registry/DomainKey.hpp"

#include <algorithm>

namespace DR {

auto nameLength(std::string_view name) -> std::size_t {
    return static_cast<std::size_t>(std::count_if(name.begin(), name.end(), [](char ch) {
        // Continuation bytes look like 10xxxxxx.
        return (static_cast<unsigned char>(ch) & 0xC0) != 0x80;
    }));
}

auto isSupportedExtension(std::string_view extension, RegistryOptions const& options) -> bool {
    return std::find(options.supportedExtensions.begin(), options.supportedExtensions.end(), extension)
           != options.supportedExtensions.end();
}

auto DomainKey::fromParts(std::string_view name, std::string_view extension, RegistryOptions const& options)
        -> Expected<DomainKey> {
    auto const length = nameLength(name);
    if (length < options.minNameLength || length > options.maxNameLength)
        return std::unexpected(Error{Error::Code::InvalidDomainNameLength, static_cast<std::uint64_t>(length)});

    if (!isSupportedExtension(extension, options))
        return std::unexpected(Error{Error::Code::InvalidDomainExtension, std::string(extension)});

    std::string key;
    key.reserve(name.size() + 1 + extension.size());
    key.append(name);
    key.push_back(DomainKeySeparator);
    key.append(extension);

    // A separator inside the name would make the key split differently than it was built.
    if (name.find(DomainKeySeparator) != std::string_view::npos)
        return std::unexpected(Error{Error::Code::InvalidDomainKey, std::move(key)});

    return DomainKey{std::move(key), name.size()};
}

auto DomainKey::parse(std::string_view key, RegistryOptions const& options) -> Expected<DomainKey> {
    auto const separator = key.find(DomainKeySeparator);
    if (separator == std::string_view::npos)
        return std::unexpected(Error{Error::Code::InvalidDomainKey, std::string(key)});

    auto parsed = fromParts(key.substr(0, separator), key.substr(separator + 1), options);
    if (!parsed)
        return std::unexpected(Error{Error::Code::InvalidDomainKey, std::string(key)});
    return parsed;
}

} // namespace DR
