#include "store/MemoryStore.hpp"

namespace DR {

auto MemoryStore::get(std::string_view key) const -> Expected<std::optional<Bytes>> {
    std::lock_guard<std::mutex> lock(this->mutex);
    auto                        it = this->entries.find(key);
    if (it == this->entries.end())
        return std::optional<Bytes>{};
    return std::optional<Bytes>{it->second};
}

auto MemoryStore::scan(std::string_view prefix, ScanVisitor const& visitor) const -> Expected<void> {
    std::lock_guard<std::mutex> lock(this->mutex);
    for (auto it = this->entries.lower_bound(prefix); it != this->entries.end(); ++it) {
        std::string_view key{it->first};
        if (!key.starts_with(prefix))
            break;
        if (visitor(key, it->second) == ScanControl::Stop)
            break;
    }
    return {};
}

auto MemoryStore::apply(std::span<Mutation const> batch) -> Expected<void> {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->applyUnlocked(batch);
    return {};
}

auto MemoryStore::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->entries.size();
}

auto MemoryStore::applyUnlocked(std::span<Mutation const> batch) -> void {
    for (auto const& mutation : batch) {
        switch (mutation.kind) {
        case Mutation::Kind::Insert:
            this->entries.insert_or_assign(mutation.key, mutation.value);
            break;
        case Mutation::Kind::Remove:
            if (auto it = this->entries.find(mutation.key); it != this->entries.end())
                this->entries.erase(it);
            break;
        }
    }
}

} // namespace DR
