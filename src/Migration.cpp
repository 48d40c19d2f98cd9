/**
 * @file Migration.cpp
 * @brief Implementation of the migration executor
 */

#include "fluxconf/Migration.hpp"
#include "fluxconf/Errors.hpp"
#include "fluxconf/Logger.hpp"

#include <exception>
#include <utility>

namespace fluxconf {

namespace {

Logger& migration_logger() {
    static Logger logger = create_logger("Migration");
    return logger;
}

void require_document(const Document& document) {
    if (!document.is_object() && !document.is_null()) {
        throw TypeError("", "object", type_name(document));
    }
}

template <typename Key>
Key resolve_target(const MigrationRegistry<Key>& registry, const std::optional<Key>& target_version) {
    if (target_version.has_value()) return *target_version;
    return registry.latest().value_or(Key::zero());
}

/**
 * @brief Stored version, target and the ordered selection between them
 */
template <typename Key>
struct Plan {
    Key stored;
    Key target;
    std::vector<const typename MigrationRegistry<Key>::Entry*> steps;
};

template <typename Key>
Plan<Key> make_plan(const Document& document, const MigrationRegistry<Key>& registry,
                    const std::optional<Key>& target_version, const std::string& version_field) {
    Key stored = stored_version<Key>(document, version_field);
    Key target = resolve_target(registry, target_version);

    if (stored > target) {
        migration_logger()->error("Stored version {} is ahead of target {}",
                                  stored.to_string(), target.to_string());
        throw VersionAheadError(stored.to_string(), target.to_string());
    }

    return Plan<Key>{stored, target, registry.pending(stored, target)};
}

} // anonymous namespace

template <typename Key>
Key stored_version(const Document& document, const std::string& version_field) {
    require_document(document);
    if (document.is_null()) return Key::zero();

    auto it = document.find(version_field);
    if (it == document.end() || it->is_null()) {
        return Key::zero();
    }
    return Key::from_value(*it);
}

template <typename Key>
Document run_migrations(const Document& document,
                        const MigrationRegistry<Key>& registry,
                        const std::optional<typename MigrationRegistry<Key>::key_type>& target_version,
                        const std::string& version_field) {
    Plan<Key> plan = make_plan(document, registry, target_version, version_field);

    Document data = document.is_null() ? Document::object() : document;
    Key last_successful = plan.stored;

    for (const auto* entry : plan.steps) {
        migration_logger()->debug("Applying {} migration '{}'",
                                  to_string(entry->step.kind()), entry->name);
        try {
            data = entry->step.apply(std::move(data));
        } catch (const std::exception& e) {
            migration_logger()->error("Migration '{}' failed after version {}: {}",
                                      entry->name, last_successful.to_string(), e.what());
            throw StepExecutionError(entry->name, entry->key.to_value(),
                                     last_successful.to_value(),
                                     std::current_exception(), e.what());
        } catch (...) {
            migration_logger()->error("Migration '{}' failed after version {}",
                                      entry->name, last_successful.to_string());
            throw StepExecutionError(entry->name, entry->key.to_value(),
                                     last_successful.to_value(),
                                     std::current_exception(), "unknown exception");
        }
        if (!data.is_object()) {
            TypeError cause("", "object", type_name(data));
            migration_logger()->error("Migration '{}' returned {} instead of an object",
                                      entry->name, type_name(data));
            throw StepExecutionError(entry->name, entry->key.to_value(),
                                     last_successful.to_value(),
                                     std::make_exception_ptr(cause), cause.what());
        }
        last_successful = entry->key;
    }

    data[version_field] = plan.target.to_value();

    if (plan.stored != plan.target) {
        migration_logger()->info("Migrated document from version {} to {} ({} step(s))",
                                 plan.stored.to_string(), plan.target.to_string(),
                                 plan.steps.size());
    }

    return data;
}

template <typename Key>
std::vector<std::string> pending_migrations(const Document& document,
                                            const MigrationRegistry<Key>& registry,
                                            const std::optional<typename MigrationRegistry<Key>::key_type>& target_version,
                                            const std::string& version_field) {
    Plan<Key> plan = make_plan(document, registry, target_version, version_field);

    std::vector<std::string> names;
    names.reserve(plan.steps.size());
    for (const auto* entry : plan.steps) {
        names.push_back(entry->name);
    }
    return names;
}

template IntegerKey stored_version<IntegerKey>(const Document&, const std::string&);
template SemVerKey stored_version<SemVerKey>(const Document&, const std::string&);

template Document run_migrations<IntegerKey>(const Document&,
                                             const MigrationRegistry<IntegerKey>&,
                                             const std::optional<IntegerKey>&,
                                             const std::string&);
template Document run_migrations<SemVerKey>(const Document&,
                                            const MigrationRegistry<SemVerKey>&,
                                            const std::optional<SemVerKey>&,
                                            const std::string&);

template std::vector<std::string> pending_migrations<IntegerKey>(
    const Document&, const MigrationRegistry<IntegerKey>&,
    const std::optional<IntegerKey>&, const std::string&);
template std::vector<std::string> pending_migrations<SemVerKey>(
    const Document&, const MigrationRegistry<SemVerKey>&,
    const std::optional<SemVerKey>&, const std::string&);

} // namespace fluxconf
