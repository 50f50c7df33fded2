#include "app/CommandLineArgs.h"

#include <cctype>
#include <limits>
#include <sstream>

namespace holdfast::app {

namespace {

constexpr long long kMaxDays = 100'000;

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Splits "--opt=value" / "--opt:value" into name and value.
[[nodiscard]] bool SplitInlineValue(std::string_view arg, std::string_view& name, std::string_view& value)
{
    if (!StartsWith(arg, "-"))
        return false;

    const std::size_t sep = arg.find_first_of("=:");
    if (sep == std::string_view::npos)
        return false;

    name = arg.substr(0, sep);
    value = arg.substr(sep + 1);
    return true;
}

[[nodiscard]] std::optional<int> ParseInt(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    int sign = 1;
    std::size_t i = 0;
    if (s[0] == '+') {
        i = 1;
    } else if (s[0] == '-') {
        sign = -1;
        i = 1;
    }
    if (i == s.size())
        return std::nullopt;

    long long v = 0;
    for (; i < s.size(); ++i)
    {
        const char c = s[i];
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + static_cast<long long>(c - '0');
        if (v > 1'000'000'000LL)
            return std::nullopt; // absurd
    }

    v *= sign;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        return std::nullopt;

    return static_cast<int>(v);
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        std::string_view name = raw;
        std::string_view inlineValue;
        const bool hasInline = SplitInlineValue(raw, name, inlineValue);

        const std::string lowered = ToLower(name);
        const std::string_view arg(lowered);

        if (!hasInline)
        {
            if (arg == "--help" || arg == "-h" || arg == "-?") { out.showHelp = true; continue; }
            if (arg == "--verbose" || arg == "-v") { out.verbose = true; continue; }
        }

        // Options with values: inline, or taken from the next argument.
        const bool isValueOption =
            arg == "--config" || arg == "--farms" || arg == "--log-dir" ||
            arg == "--owner" || arg == "--days";
        if (!isValueOption)
        {
            addUnknown(raw);
            continue;
        }

        std::string_view value;
        if (hasInline)
        {
            value = inlineValue;
        }
        else
        {
            if (i + 1 >= argv.size())
            {
                addUnknown(raw);
                continue;
            }
            value = argv[++i];
        }

        if (value.empty())
        {
            addUnknown(raw);
            continue;
        }

        if (arg == "--config")       out.configPath = std::filesystem::path(std::string(value));
        else if (arg == "--farms")   out.farmsPath = std::filesystem::path(std::string(value));
        else if (arg == "--log-dir") out.logDir = std::filesystem::path(std::string(value));
        else if (arg == "--owner")   out.ownerId = std::string(value);
        else
        {
            const auto parsed = ParseInt(value);
            if (!parsed || *parsed < 0 || *parsed > kMaxDays)
            {
                addUnknown(raw);
                continue;
            }
            out.days = *parsed;
        }
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
    oss << "Usage: holdfast_headless [options]\n"
        << "\n"
        << "  --config <file>    Simulation settings (key=value INI)\n"
        << "  --farms <file>     Farm roster (JSON)\n"
        << "  --days <N>         Days to simulate (default 14, max " << kMaxDays << ")\n"
        << "  --owner <id>       Owner whose farms feed the population pool\n"
        << "  --log-dir <dir>    Also write holdfast.log into <dir>\n"
        << "  --verbose, -v      Trace-level logging\n"
        << "  --help, -h         Show this text\n"
        << "\n"
        << "Values may also be given as --opt=value or --opt:value.\n";
    return oss.str();
}

} // namespace holdfast::app
