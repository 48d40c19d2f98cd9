#include <cxxopts.hpp>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "fluxconf/Errors.hpp"
#include "fluxconf/FileIO.hpp"
#include "fluxconf/Loader.hpp"
#include "fluxconf/Logger.hpp"
#include "fluxconf/Migration.hpp"
#include "fluxconf/Patch.hpp"
#include "fluxconf/Registry.hpp"
#include "fluxconf/VersionKey.hpp"

using namespace fluxconf;

namespace {

constexpr const char* kCommandHelp =
    "Commands: migrate [--dry-run] | status | list | patch PATCH_FILE [--out FILE]\n";

template <typename Key>
int run_cli(const cxxopts::ParseResult& result, const std::vector<std::string>& cmdv) {
    const std::string& cmd = cmdv[0];
    const std::string version_field = result["version-field"].as<std::string>();

    // The CLI links no transforms, so only patch steps can load
    MigrationRegistry<Key> registry;
    if (result.count("migrations")) {
        try {
            registry = MigrationRegistry<Key>(
                load_migrations_from_dir<Key>(expand_user(result["migrations"].as<std::string>())));
        } catch (const StructuralLoadError& e) {
            if (std::filesystem::path(e.path()).extension() == ".step") {
                std::cerr << "Note: the fluxconf CLI has no registered transforms; "
                             ".step files must provide a 'patch' list\n";
            }
            throw;
        }
    }

    std::optional<Key> target;
    if (result.count("target")) {
        target = Key::parse(result["target"].as<std::string>());
    }

    // LIST does not need a config file
    if (cmd == "list") {
        if (registry.empty()) {
            std::cout << "No migrations\n";
            return 0;
        }
        for (const auto& entry : registry.entries()) {
            std::cout << entry.key.to_string() << "\t" << entry.name << "\t"
                      << to_string(entry.step.kind()) << "\n";
        }
        return 0;
    }

    if (!result.count("config")) {
        std::cerr << "Error: --config must be provided for `" << cmd << "`\n";
        return 1;
    }
    const std::string config_path = expand_user(result["config"].as<std::string>());
    Document raw = load_document(config_path);

    // STATUS
    if (cmd == "status") {
        Key stored = stored_version<Key>(raw, version_field);
        Key effective_target = target.value_or(registry.latest().value_or(Key::zero()));
        std::cout << "Stored version: " << stored.to_string() << "\n";
        std::cout << "Target version: " << effective_target.to_string() << "\n";
        auto names = pending_migrations(raw, registry, target, version_field);
        if (names.empty()) {
            std::cout << "Up to date\n";
        } else {
            std::cout << "Pending:\n";
            for (const auto& name : names) {
                std::cout << "  " << name << "\n";
            }
        }
        return 0;
    }

    // MIGRATE
    if (cmd == "migrate") {
        Document migrated = run_migrations(raw, registry, target, version_field);
        if (result.count("dry-run")) {
            std::cout << to_json_string(migrated, 2) << "\n";
            return 0;
        }
        if (migrated == raw) {
            std::cout << "Already at version " << stored_version<Key>(raw, version_field).to_string()
                      << "\n";
            return 0;
        }
        write_document(config_path, migrated);
        std::cout << "Migrated " << config_path << " to version "
                  << stored_version<Key>(migrated, version_field).to_string() << "\n";
        return 0;
    }

    // PATCH
    if (cmd == "patch") {
        if (cmdv.size() < 2) {
            std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
            return 1;
        }
        Patch patch = parse_patch(load_json_file(cmdv[1]));
        Document patched = apply_patch(raw, patch);
        std::string out = result.count("out") ? result["out"].as<std::string>() : config_path;
        write_document(out, patched);
        std::cout << "Applied " << patch.size() << " operation(s), wrote " << out << "\n";
        return 0;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    return 1;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("fluxconf", "Migrate versioned JSON/TOML config documents");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,config", "Path to JSON/TOML config", cxxopts::value<std::string>())
            ("m,migrations",
             "Directory of migration step files (.json patches, or .step manifests "
             "with a 'patch' list; named transforms are not available here)",
             cxxopts::value<std::string>())
            ("target", "Version to migrate up to (default: latest)", cxxopts::value<std::string>())
            ("version-field", "Document field holding the version",
             cxxopts::value<std::string>()->default_value(kDefaultVersionField))
            ("scheme", "Version key scheme: int or semver",
             cxxopts::value<std::string>()->default_value("int"))
            ("v,verbose", "Log every step")
            ("h,help", "Show help");

        // Command options
        options.add_options("Command")
            ("dry-run", "migrate: print the result instead of writing it")
            ("out", "patch: write the result to FILE instead of the config",
             cxxopts::value<std::string>());

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help({"", "Command"}) << "\n";
            std::cout << kCommandHelp;
            return 0;
        }

        set_log_level(result.count("verbose") ? spdlog::level::debug : spdlog::level::warn);

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }

        const std::string scheme = result["scheme"].as<std::string>();
        if (scheme == "int" || scheme == "integer") {
            return run_cli<IntegerKey>(result, cmdv);
        }
        if (scheme == "semver") {
            return run_cli<SemVerKey>(result, cmdv);
        }
        std::cerr << "Error: unknown scheme '" << scheme << "' (expected int or semver)\n";
        return 1;

    } catch (const StepExecutionError& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        std::cerr << "Last successful version: " << ex.last_successful().dump() << "\n";
        std::cerr << "The config file was not modified.\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
