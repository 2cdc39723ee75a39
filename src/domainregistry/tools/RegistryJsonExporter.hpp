#pragma once

#include "core/Error.hpp"

#include <string>

namespace DR {

class Registry;

struct RegistryJsonOptions {
    bool includeHistory      = true;
    bool includeReservations = true;
    // Negative dumps on a single line.
    int  dumpIndent          = 2;
};

class RegistryJsonExporter {
public:
    static auto Export(Registry const& registry, RegistryJsonOptions const& options = RegistryJsonOptions{})
            -> Expected<std::string>;
};

} // namespace DR
