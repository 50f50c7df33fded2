#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace holdfast::app {

// Parsed command-line arguments for the holdfast_headless executable.
//
// Notes:
//   - All option names are case-insensitive (values are not).
//   - "--opt value", "--opt=value" and "--opt:value" are all accepted.
struct CommandLineArgs
{
    bool showHelp = false;                     // --help / -h / -?
    bool verbose = false;                      // --verbose / -v

    std::optional<std::filesystem::path> configPath; // --config <ini>
    std::optional<std::filesystem::path> farmsPath;  // --farms <json>
    std::optional<std::filesystem::path> logDir;     // --log-dir <dir>
    std::optional<std::string> ownerId;              // --owner <id>
    std::optional<int> days;                         // --days <0..100000>

    // Unknown options and options with missing/bad values, in command-line order.
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace holdfast::app
