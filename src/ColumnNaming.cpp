#include "ecmsio/ColumnNaming.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace ecmsio {

namespace {

// "{label} [{unit}]"
const std::regex kBracketUnitRe(R"(^(.+?) \[(.+?)\]$)");
// "{label}/{unit}", greedy so "a/b/unit" keeps "a/b"
const std::regex kSlashUnitRe(R"(^(.+)/(.+)$)");
// "C{channel}M{mass}"
const std::regex kMassBlockRe(R"(^C[0-9]+M([0-9]+)$)");

std::string lowercase(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string time_prefix(const std::string& block_header)
{
    if (block_header == kPotentialBlock) return "Potential";
    if (block_header == kEcLabBlock)     return "Biologic";
    return block_header;
}

} // unnamed namespace

bool is_time_column(const std::string& column_header)
{
    return column_header == kNativeTimeHeader || column_header == kEcLabTimeHeader;
}

bool is_run_id_column(const std::string& column_header)
{
    return column_header == kExperimentColumn || column_header == kTechniqueColumn;
}

std::optional<std::string> mass_of_block(const std::string& block_header)
{
    std::smatch m;
    if (std::regex_match(block_header, m, kMassBlockRe)) return m[1].str();
    return std::nullopt;
}

ColumnName form_column_name(const std::string& block_header,
                            const std::string& column_header)
{
    if (is_time_column(column_header))
        return {time_prefix(block_header) + " " + lowercase(column_header), "s",
                std::nullopt};

    std::string unit;
    std::smatch m;
    if (std::regex_match(column_header, m, kBracketUnitRe) ||
        std::regex_match(column_header, m, kSlashUnitRe))
        unit = m[2].str();

    // "Flow" in "Flow [ml/min]" adds nothing once the block name is there
    if (ends_with(block_header, "setpoint") || ends_with(block_header, "value"))
        return {block_header + " [" + unit + "]", unit, std::nullopt};

    if (auto mass = mass_of_block(block_header))
        return {"M" + *mass + " [" + unit + "]", unit, "M" + *mass};

    return {column_header, unit, std::nullopt};
}

} // namespace ecmsio
