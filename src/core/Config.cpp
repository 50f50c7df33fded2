#include "Config.h"

#include <charconv>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace holdfast::core {

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

static bool ParseInt(std::string_view sv, int& out) noexcept
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);

    int v = 0;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end)
        return false;

    out = v;
    return true;
}

static bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }

    return true;
}

static bool ParseBool(std::string_view sv, bool& out) noexcept
{
    //   true  values:  1, true, yes, on
    //   false values:  0, false, no, off
    if (sv == "1") { out = true; return true; }
    if (sv == "0") { out = false; return true; }

    if (EqualsI(sv, "true") || EqualsI(sv, "yes") || EqualsI(sv, "on"))
    {
        out = true;
        return true;
    }

    if (EqualsI(sv, "false") || EqualsI(sv, "no") || EqualsI(sv, "off"))
    {
        out = false;
        return true;
    }

    return false;
}

static const char* LogLevelName(LogLevel lvl)
{
    switch (lvl)
    {
    case LogLevel::Trace:    return "trace";
    case LogLevel::Info:     return "info";
    case LogLevel::Warn:     return "warn";
    case LogLevel::Error:    return "error";
    case LogLevel::Critical: return "critical";
    }
    return "info";
}

static void StripInlineComment(std::string& v)
{
    //   daysPerWeek=7      # days
    //   ownerId=player     ; who gets the pool
    //   logLevel=info      // verbosity
    std::size_t cut = std::string::npos;
    auto consider = [&](std::size_t p)
    {
        if (p == std::string::npos) return;
        if (cut == std::string::npos || p < cut) cut = p;
    };

    consider(v.find('#'));
    consider(v.find(';'));
    consider(v.find("//"));

    if (cut != std::string::npos)
    {
        v.erase(cut);
        TrimInPlace(v);
    }
}

bool LoadSimConfig(SimConfig& cfg, const std::filesystem::path& file)
{
    std::ifstream f(file, std::ios::binary);
    if (!f) return false;
    std::ostringstream oss;
    oss << f.rdbuf();
    std::string text = oss.str();

    // Editors on some platforms prepend a UTF-8 BOM.
    if (text.size() >= 3 &&
        static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB &&
        static_cast<unsigned char>(text[2]) == 0xBF)
    {
        text.erase(0, 3);
    }

    std::istringstream iss(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(iss, line))
    {
        ++lineNo;
        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';') continue;

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);
        StripInlineComment(v);

        auto warnBad = [&]() {
            HF_LOG_WARN("LoadSimConfig: %s:%d: ignoring invalid value '%s' for '%s'",
                        file.string().c_str(), lineNo, v.c_str(), k.c_str());
        };

        if (k == "daysPerWeek" || k == "weeksPerMonth" || k == "startingPopulation")
        {
            int parsed = 0;
            const bool positiveOnly = (k != "startingPopulation");
            if (!ParseInt(v, parsed) || parsed < (positiveOnly ? 1 : 0))
            {
                warnBad();
                continue;
            }

            if (k == "daysPerWeek")        cfg.daysPerWeek = parsed;
            else if (k == "weeksPerMonth") cfg.weeksPerMonth = parsed;
            else                           cfg.startingPopulation = parsed;
        }
        else if (k == "ownerId")
        {
            if (v.empty())
            {
                warnBad();
                continue;
            }
            cfg.ownerId = v;
        }
        else if (k == "productionDebugLogs")
        {
            bool parsed = cfg.productionDebugLogs;
            if (ParseBool(v, parsed))
                cfg.productionDebugLogs = parsed;
            else
                warnBad();
        }
        else if (k == "logLevel")
        {
            LogLevel parsed = cfg.logLevel;
            if (ParseLogLevel(v, parsed))
                cfg.logLevel = parsed;
            else
                warnBad();
        }
    }

    return true;
}

bool SaveSimConfig(const SimConfig& cfg, const std::filesystem::path& file)
{
    const auto dir = file.parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            HF_LOG_ERROR("SaveSimConfig: create_directories failed for %s (%d: %s)",
                         dir.string().c_str(), ec.value(), ec.message().c_str());
            return false;
        }
    }

    std::ostringstream oss;
    oss << "daysPerWeek="         << cfg.daysPerWeek << "\n";
    oss << "weeksPerMonth="       << cfg.weeksPerMonth << "\n";
    oss << "ownerId="             << cfg.ownerId << "\n";
    oss << "startingPopulation="  << cfg.startingPopulation << "\n";
    oss << "productionDebugLogs=" << (cfg.productionDebugLogs ? 1 : 0) << "\n";
    oss << "logLevel="            << LogLevelName(cfg.logLevel) << "\n";
    const std::string text = oss.str();

    std::ofstream f(file, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        HF_LOG_ERROR("SaveSimConfig: cannot open %s for writing", file.string().c_str());
        return false;
    }
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(f);
}

} // namespace holdfast::core
