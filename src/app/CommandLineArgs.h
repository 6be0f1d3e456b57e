#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rustactions::app {

// Parsed command line of the rustactions executable:
//
//   rustactions [options] <command> [args...]
//
// Notes:
//   - Option names are case-insensitive; values and command arguments are not.
//   - "--opt value", "--opt=value" and "--opt:value" are all accepted.
//   - Options may appear before or after the command; "--" ends option
//     parsing so arguments that start with "--" can be passed through.
struct CommandLineArgs
{
    bool showHelp = false;      // --help / -h / -?
    bool dryRun = false;        // --dry-run (log keys instead of sending them)
    bool writeDefaults = false; // --write-defaults (config command)

    std::optional<std::filesystem::path> settingsPath; // --settings <path>
    std::optional<std::filesystem::path> keysCfgPath;  // --keys-cfg <path>
    std::optional<std::filesystem::path> itemsPath;    // --items <path>
    std::optional<std::string>           logLevel;     // --log-level <lvl>

    std::string              command;   // first positional, lower-cased
    std::vector<std::string> arguments; // remaining positionals, verbatim

    // Unknown options and options missing their value, in order.
    std::vector<std::string> unknown;
};

[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, char** argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace rustactions::app
