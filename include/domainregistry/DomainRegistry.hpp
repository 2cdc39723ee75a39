#pragma once

#include "core/CallContext.hpp"
#include "core/Error.hpp"
#include "core/Principal.hpp"
#include "core/RegistryOptions.hpp"
#include "registry/DomainKey.hpp"
#include "registry/DomainTypes.hpp"
#include "registry/Registry.hpp"
#include "store/JournalStore.hpp"
#include "store/KeyValueStore.hpp"
#include "store/MemoryStore.hpp"
#include "tools/RegistryJsonExporter.hpp"
