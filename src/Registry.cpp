/**
 * @file Registry.cpp
 * @brief Registry construction and lookup, instantiated for both key schemes
 */

#include "fluxconf/Registry.hpp"
#include "fluxconf/Errors.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace fluxconf {

template <typename Key>
MigrationRegistry<Key>::MigrationRegistry(const Migrations& migrations)
    : MigrationRegistry(merge({migrations}))
{}

template <typename Key>
MigrationRegistry<Key> MigrationRegistry<Key>::merge(const std::vector<Migrations>& sources) {
    // Same name declared by more than one source
    std::set<std::string> seen_names;
    std::set<std::string> name_collisions;
    for (const auto& source : sources) {
        for (const auto& [name, step] : source) {
            if (!seen_names.insert(name).second) {
                name_collisions.insert(name);
            }
        }
    }
    if (!name_collisions.empty()) {
        throw DuplicateKeyError(
            std::vector<std::string>(name_collisions.begin(), name_collisions.end()));
    }

    // Distinct names sharing one version key
    std::map<Key, std::vector<std::string>> names_by_key;
    MigrationRegistry registry;
    for (const auto& source : sources) {
        for (const auto& [name, step] : source) {
            Key key = Key::from_name(name);
            names_by_key[key].push_back(name);
            registry.entries_.push_back(Entry{key, name, step});
        }
    }

    std::vector<std::string> key_collisions;
    for (auto& [key, names] : names_by_key) {
        if (names.size() > 1) {
            std::sort(names.begin(), names.end());
            key_collisions.insert(key_collisions.end(), names.begin(), names.end());
        }
    }
    if (!key_collisions.empty()) {
        throw DuplicateKeyError(std::move(key_collisions));
    }

    std::sort(registry.entries_.begin(), registry.entries_.end(),
              [](const Entry& a, const Entry& b) { return a.key < b.key; });

    return registry;
}

template <typename Key>
std::optional<Key> MigrationRegistry<Key>::latest() const {
    if (entries_.empty()) return std::nullopt;
    return entries_.back().key;
}

template <typename Key>
const typename MigrationRegistry<Key>::Entry* MigrationRegistry<Key>::find(const Key& key) const {
    auto it = std::lower_bound(entries_.begin(), entries_.end(), key,
                               [](const Entry& e, const Key& k) { return e.key < k; });
    if (it == entries_.end() || it->key != key) return nullptr;
    return &(*it);
}

template <typename Key>
std::vector<const typename MigrationRegistry<Key>::Entry*>
MigrationRegistry<Key>::pending(const Key& stored, const Key& target) const {
    std::vector<const Entry*> selected;
    auto it = std::upper_bound(entries_.begin(), entries_.end(), stored,
                               [](const Key& k, const Entry& e) { return k < e.key; });
    for (; it != entries_.end() && it->key <= target; ++it) {
        selected.push_back(&(*it));
    }
    return selected;
}

template class MigrationRegistry<IntegerKey>;
template class MigrationRegistry<SemVerKey>;

} // namespace fluxconf
