#include "tools/RegistryJsonExporter.hpp"

#include "registry/Registry.hpp"

#include <nlohmann/json.hpp>

#include <string_view>
#include <vector>

namespace DR {

namespace {

using Json = nlohmann::json;

auto historyToJson(std::vector<HistoryEntry> const& entries) -> Json {
    Json array = Json::array();
    for (auto const& entry : entries) {
        array.push_back(Json{{"event", std::string(historyEventToString(entry.event))},
                             {"owner", entry.owner.text},
                             {"actor", entry.actor.text},
                             {"valid_until", entry.validUntil},
                             {"created_at", entry.createdAt}});
    }
    return array;
}

} // namespace

auto RegistryJsonExporter::Export(Registry const& registry, RegistryJsonOptions const& options) -> Expected<std::string> {
    Json domains      = Json::object();
    Json reservations = Json::object();
    Json history      = Json::object();

    RegistryVisitors visitors;
    visitors.domain = [&](DomainRecord const& record) {
        domains[record.key] = Json{{"owner", record.owner.text},
                                   {"valid_until", record.validUntil},
                                   {"updated_at", record.updatedAt}};
        return ScanControl::Continue;
    };
    if (options.includeReservations) {
        visitors.reservation = [&](std::string_view key, Principal const& wallet) {
            reservations[std::string(key)] = wallet.text;
            return ScanControl::Continue;
        };
    }
    if (options.includeHistory) {
        visitors.history = [&](std::string_view key, std::vector<HistoryEntry> const& entries) {
            history[std::string(key)] = historyToJson(entries);
            return ScanControl::Continue;
        };
    }

    // One visit, so records and history come from the same registry state.
    if (auto visited = registry.visit(visitors); !visited)
        return std::unexpected(visited.error());

    Json extensions = Json::array();
    for (auto const& extension : registry.options().supportedExtensions)
        extensions.push_back(extension);

    Json meta = Json::object();
    meta["administrator"] = registry.getCanisterOwner().text;
    meta["domain_count"]  = domains.size();
    meta["extensions"]    = std::move(extensions);

    Json root = Json::object();
    root["_meta"]   = std::move(meta);
    root["domains"] = std::move(domains);
    if (options.includeReservations)
        root["reservations"] = std::move(reservations);
    if (options.includeHistory)
        root["history"] = std::move(history);

    try {
        if (options.dumpIndent < 0)
            return root.dump();
        return root.dump(options.dumpIndent);
    } catch (nlohmann::json::exception const& e) {
        // Raised for keys or owners that are not valid UTF-8.
        return std::unexpected(Error{Error::Code::UnknownError, e.what()});
    }
}

} // namespace DR
