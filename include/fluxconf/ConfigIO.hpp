/**
 * @file ConfigIO.hpp
 * @brief File-backed typed configuration with migrations on read
 *
 * ConfigIO ties a configuration file, a migration registry and a model
 * type together. Model must be convertible from and to nlohmann::json
 * (from_json / to_json).
 *
 * Example:
 * ```cpp
 * struct AppConfig { std::string name; bool enabled = true; int version = 0; };
 * // to_json / from_json for AppConfig ...
 *
 * ConfigIOOptions<> options;
 * options.config_directory = "~/.config/app";
 * options.file_name = "app.toml";
 * options.migrations = {{"1_rename_active", rename_active}};
 *
 * ConfigIO<AppConfig> io(options);
 * AppConfig cfg = io.read();   // migrated and written back if needed
 * cfg.enabled = false;
 * io.write(cfg);
 * ```
 */

#ifndef FLUXCONF_CONFIGIO_HPP
#define FLUXCONF_CONFIGIO_HPP

#include "fluxconf/Errors.hpp"
#include "fluxconf/FileIO.hpp"
#include "fluxconf/Loader.hpp"
#include "fluxconf/Logger.hpp"
#include "fluxconf/Migration.hpp"
#include "fluxconf/Registry.hpp"
#include "fluxconf/Value.hpp"
#include "fluxconf/VersionKey.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fluxconf {

/**
 * @brief Construction options for ConfigIO
 */
template <typename Key = IntegerKey>
struct ConfigIOOptions {
    /// Directory holding the file; a leading "~" expands to $HOME
    std::string config_directory;

    /// File name; its extension (.json or .toml) selects the format
    std::string file_name;

    /// Inline migration steps
    Migrations migrations;

    /// Directory scanned for step files, merged with the inline steps
    std::optional<std::string> migrations_dir;

    /// Transformations available to ".step" files in migrations_dir
    TransformTable transforms;

    std::string version_field = kDefaultVersionField;

    /// Written as a "#:schema" header line (TOML only)
    std::string schema_url;
};

template <typename Model, typename Key = IntegerKey>
class ConfigIO {
public:
    using registry_type = MigrationRegistry<Key>;

    /**
     * @brief Resolve the file path and build the registry
     * @throws StructuralLoadError if migrations_dir cannot be loaded
     * @throws DuplicateKeyError if inline and discovered steps collide
     * @throws VersionFormatError if an inline step name has no valid prefix
     */
    explicit ConfigIO(ConfigIOOptions<Key> options)
        : path_(std::filesystem::path(expand_user(options.config_directory)) / options.file_name)
        , version_field_(std::move(options.version_field))
        , schema_url_(std::move(options.schema_url))
        , registry_(build_registry(options))
        , logger_(create_logger("ConfigIO"))
    {}

    const std::filesystem::path& path() const noexcept { return path_; }

    const registry_type& registry() const noexcept { return registry_; }

    const std::string& version_field() const noexcept { return version_field_; }

    /**
     * @brief Highest registry key, or zero without migrations
     */
    Key latest_version() const {
        return registry_.latest().value_or(Key::zero());
    }

    /**
     * @brief Load the file without migrating or parsing it
     *
     * An empty file reads as an empty object.
     *
     * @throws FileNotFoundError, ConfigParseError
     */
    Document read_raw() const {
        return load_document(path_.string());
    }

    /**
     * @brief Write a document as-is, creating parent directories
     */
    void write_raw(const Document& document) const {
        write_document(path_.string(), document, schema_url_);
        logger_->info("Wrote {}", path_.string());
    }

    /**
     * @brief Convert a document into the model type
     * @throws ValidationError naming the file if conversion fails
     */
    Model parse(const Document& document) const {
        try {
            return document.is_null() ? Document::object().get<Model>()
                                      : document.get<Model>();
        } catch (const nlohmann::json::exception& e) {
            throw ValidationError(path_.string(), e.what());
        }
    }

    /**
     * @brief Read, migrate and parse the file
     *
     * When migrations change the document, the migrated document is
     * written back before parsing. A document already at the latest
     * version is left untouched on disk.
     *
     * @throws FileNotFoundError, ConfigParseError, ValidationError, and
     *         the migration errors of run_migrations()
     */
    Model read() const {
        Document raw = read_raw();
        if (!registry_.empty()) {
            Document migrated = run_migrations(raw, registry_, std::nullopt, version_field_);
            if (migrated != raw) {
                logger_->info("Writing migrated configuration back to {}", path_.string());
                write_raw(migrated);
                raw = std::move(migrated);
            }
        }
        return parse(raw);
    }

    /**
     * @brief Serialise and write a model
     *
     * A version field older than latest_version() is bumped to it, so a
     * freshly written file never needs migrating.
     */
    void write(const Model& model) const {
        write_raw(to_document(model));
    }

    /**
     * @brief Text form of a model, in the file's format, without touching
     *        the disk
     */
    std::string serialise(const Model& model) const {
        return serialise_document(path_.string(), to_document(model));
    }

private:
    static registry_type build_registry(const ConfigIOOptions<Key>& options) {
        std::vector<Migrations> sources{options.migrations};
        if (options.migrations_dir.has_value()) {
            sources.push_back(load_migrations_from_dir<Key>(
                expand_user(*options.migrations_dir), options.transforms));
        }
        return registry_type::merge(sources);
    }

    Document to_document(const Model& model) const {
        Document document = model;
        auto latest = registry_.latest();
        if (latest.has_value() && document.is_object()) {
            auto it = document.find(version_field_);
            if (it != document.end() && !it->is_null() && Key::from_value(*it) < *latest) {
                *it = latest->to_value();
            }
        }
        return document;
    }

    std::filesystem::path path_;
    std::string version_field_;
    std::string schema_url_;
    registry_type registry_;
    Logger logger_;
};

} // namespace fluxconf

#endif // FLUXCONF_CONFIGIO_HPP
