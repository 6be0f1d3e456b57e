#include "app/CommandLineArgs.h"

#include "rustactions/util/StringUtil.hpp"

#include <sstream>

namespace rustactions::app {

namespace {

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

[[nodiscard]] bool ConsumeValue(std::string_view arg,
                                std::string_view prefix,
                                std::string_view& outValue)
{
    if (!StartsWith(arg, prefix))
        return false;

    // Accept either:
    //   --opt=value
    //   --opt:value
    const std::size_t n = prefix.size();
    if (arg.size() == n)
        return false;

    const char sep = arg[n];
    if (sep != '=' && sep != ':')
        return false;

    outValue = arg.substr(n + 1);
    return true;
}

[[nodiscard]] bool LooksLikeOption(std::string_view arg)
{
    return StartsWith(arg, "--") || arg == "-h" || arg == "-?";
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;

    auto addPositional = [&](std::string_view raw) {
        if (out.command.empty())
            out.command = util::ToLowerCopy(raw);
        else
            out.arguments.emplace_back(raw);
    };

    bool optionsEnded = false;

    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        const std::string_view raw = argv[i];

        if (optionsEnded || !LooksLikeOption(raw))
        {
            addPositional(raw);
            continue;
        }

        if (raw == "--")
        {
            optionsEnded = true;
            continue;
        }

        // Lower-case the option name only; "--keys-cfg=C:\Games\Keys.cfg"
        // keeps the value's case.
        const std::size_t sepPos = raw.find_first_of("=:");
        std::string lowered = util::ToLowerCopy(raw.substr(0, sepPos));
        if (sepPos != std::string_view::npos)
            lowered.append(raw.substr(sepPos));
        const std::string_view arg(lowered);

        // Help
        if (arg == "--help" || arg == "-h" || arg == "-?") {
            out.showHelp = true;
            continue;
        }

        // Simple flags
        if (arg == "--dry-run" || arg == "--dryrun") { out.dryRun = true; continue; }
        if (arg == "--write-defaults") { out.writeDefaults = true; continue; }

        // Options with values
        std::string_view value;

        const auto takeNext = [&](auto& dst) {
            if (i + 1 >= argv.size() || LooksLikeOption(argv[i + 1])) {
                out.unknown.emplace_back(raw);
                return;
            }
            dst = std::string(argv[i + 1]);
            ++i;
        };

        const auto parseValueInto = [&](auto& dst, std::string_view v) {
            if (v.empty()) {
                out.unknown.emplace_back(raw);
                return;
            }
            dst = std::string(v);
        };


        if (arg == "--settings" || arg == "--config") {
            takeNext(out.settingsPath);
            continue;
        }
        if (ConsumeValue(arg, "--settings", value) || ConsumeValue(arg, "--config", value)) {
            parseValueInto(out.settingsPath, value);
            continue;
        }

        if (arg == "--keys-cfg" || arg == "--keys") {
            takeNext(out.keysCfgPath);
            continue;
        }
        if (ConsumeValue(arg, "--keys-cfg", value) || ConsumeValue(arg, "--keys", value)) {
            parseValueInto(out.keysCfgPath, value);
            continue;
        }

        if (arg == "--items" || arg == "--item-database") {
            takeNext(out.itemsPath);
            continue;
        }
        if (ConsumeValue(arg, "--items", value) || ConsumeValue(arg, "--item-database", value)) {
            parseValueInto(out.itemsPath, value);
            continue;
        }

        if (arg == "--log-level") {
            takeNext(out.logLevel);
            continue;
        }
        if (ConsumeValue(arg, "--log-level", value)) {
            parseValueInto(out.logLevel, value);
            continue;
        }

        // Anything else is unknown.
        out.unknown.emplace_back(raw);
    }

    return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, char** argv)
{
    std::vector<std::string_view> v;
    v.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0u);
    for (int i = 0; i < argc; ++i)
        v.emplace_back(argv[i] ? argv[i] : "");
    return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "RustActions - key binds for Rust crafting, commands and chat\n\n";
    oss << "Usage: rustactions [options] <command> [args]\n\n";

    oss << "Setup\n";
    oss << "  generate                    Write keys.cfg (crafting, command and dynamic binds)\n";
    oss << "  status                      Show bind usage and keys.cfg state\n";
    oss << "  protect / unprotect         Make keys.cfg read-only / writable\n";
    oss << "  clear-dynamic               Drop every chat/connection bind and rewrite keys.cfg\n";
    oss << "  config --write-defaults     Write settings.json with the current values\n\n";

    oss << "Actions\n";
    oss << "  craft <id|name> [qty]       Queue a craft\n";
    oss << "  cancel <id|name> [qty]      Cancel a queued craft\n";
    oss << "  stack [n]                   Restack the inventory (n rounds, default 100)\n";
    oss << "  unstack [n]                 Cancel the crafts queued by 'stack'\n";
    oss << "  command <name>              Run a fixed command (see 'commands')\n";
    oss << "  commands                    List fixed command names\n";
    oss << "  say <text>                  Global chat\n";
    oss << "  teamsay <text>              Team chat\n";
    oss << "  connect <ip:port>           Connect to a server\n";
    oss << "  respawn <bag id>            Respawn at a sleeping bag\n";
    oss << "  give <console command>      Run an inventory give command\n";
    oss << "  type <text>                 Type text into the game and press Enter\n";
    oss << "  reload                      Make the game re-read keys.cfg\n\n";

    oss << "Options\n";
    oss << "  --settings <path>           settings.json to use\n";
    oss << "  --keys-cfg <path>           Rust keys.cfg location\n";
    oss << "  --items <path>              Item database JSON\n";
    oss << "  --log-level <lvl>           trace|debug|info|warn|error\n";
    oss << "  --dry-run                   Log key presses instead of sending them\n";
    oss << "  --help, -h                  Show this help\n\n";

    oss << "Examples\n";
    oss << "  rustactions generate\n";
    oss << "  rustactions craft \"Wooden Door\" 2\n";
    oss << "  rustactions say -- \"--- raid at B4 ---\"\n";
    return oss.str();
}

} // namespace rustactions::app
