// Blobs CLI Implementation

#include "cli.h"
#include <blobs/macro_catalog.h>
#include <blobs/storage/persistence.h>
#include <blobs/storage/storage.h>
#include <CLI/CLI.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

namespace blobs::cli {

namespace {

bool readFile(const std::string& path, std::string& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

} // namespace

int parseCommandLine(int argc, char** argv, Options& options) {
    CLI::App app{"Blobs - Oscillator-modulated particle flock with macro record/replay"};
    app.set_version_flag("-v,--version", std::string(VERSION));
    app.set_help_flag("-h,--help", "Show this help");

    std::vector<std::string> addMacro;
    uint32_t seed = 0;

    app.add_option("--storage", options.storagePath, "Key/value storage file")
        ->capture_default_str();
    app.add_option("--settings", options.settingsFile, "Import settings from a JSON file")
        ->check(CLI::ExistingFile);
    app.add_flag("--reset-settings", options.resetSettings, "Drop stored settings and use the defaults");
    app.add_option("--macro", options.macroName, "Current macro (default: first in catalog)");
    app.add_option("--add-macro", addMacro, "Validate and store a user macro: NAME FILE")
        ->expected(2);
    app.add_option("--export-recording", options.exportRecordingFile,
                   "Write the live input recording to this file on exit");
    auto* seedOpt = app.add_option("--seed", seed, "Random seed for a reproducible flock");
    app.add_flag("--list-macros", options.listMacros, "List the macro catalog and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (addMacro.size() == 2) {
        options.addMacroName = addMacro[0];
        options.addMacroFile = addMacro[1];
    }
    if (seedOpt->count() > 0) {
        options.seed = seed;
    }
    return -1;
}

int runStorageCommands(const Options& options) {
    storage::Storage store(options.storagePath);
    bool changed = false;

    if (options.resetSettings) {
        if (storage::resetStoredSettings(store)) {
            std::cout << "[blobs] Stored settings removed" << std::endl;
            changed = true;
        }
    }

    if (!options.settingsFile.empty()) {
        std::string text;
        if (!readFile(options.settingsFile, text)) {
            std::cerr << "[blobs] Could not read " << options.settingsFile << "\n";
            return 1;
        }
        std::string error;
        if (!storage::importSettings(store, text, &error)) {
            std::cerr << "[blobs] Invalid settings in " << options.settingsFile << ": " << error << "\n";
            return 1;
        }
        changed = true;
    }

    if (!options.addMacroName.empty()) {
        std::string text;
        if (!readFile(options.addMacroFile, text)) {
            std::cerr << "[blobs] Could not read " << options.addMacroFile << "\n";
            return 1;
        }
        MacroCatalog catalog = storage::loadMacroCatalog(store);
        if (!catalog.add(options.addMacroName, text)) {
            std::cerr << "[blobs] " << catalog.error() << "\n";
            return 1;
        }
        if (!storage::storeUserMacros(store, catalog)) {
            std::cerr << "[blobs] Could not store macro '" << options.addMacroName << "'\n";
            return 1;
        }
        std::cout << "[blobs] Added macro '" << options.addMacroName << "'" << std::endl;
        changed = true;
    }

    if (changed && !store.save()) {
        std::cerr << "[blobs] " << store.error() << "\n";
        return 1;
    }

    if (options.listMacros) {
        MacroCatalog catalog = storage::loadMacroCatalog(store);
        for (const auto& entry : catalog.entries()) {
            std::cout << entry.name << " (" << entry.events.size() << " events"
                      << (entry.builtin ? ", built-in" : "") << ")\n";
        }
        return 0;
    }

    return -1;
}

} // namespace blobs::cli
