// Blobs CLI
// Command line options and the commands that run without a window

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace blobs::cli {

constexpr const char* VERSION = "1.3.0";

struct Options {
    std::string storagePath = "blobs-storage.json";
    std::string settingsFile;           // Settings JSON to import
    bool resetSettings = false;
    std::string macroName;              // Current macro (empty = first in catalog)
    std::string addMacroName;
    std::string addMacroFile;
    std::string exportRecordingFile;
    std::optional<uint32_t> seed;
    bool listMacros = false;
};

// Parse the command line into options
// Returns: 0+ = exit with this code (help, version, parse error), -1 = continue
int parseCommandLine(int argc, char** argv, Options& options);

// Apply storage commands (reset, import, add macro, list)
// Returns: 0+ = exit with this code, -1 = continue to the window
int runStorageCommands(const Options& options);

} // namespace blobs::cli
