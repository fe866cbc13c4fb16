#include "ecmsio/JsonUtils.hpp"
#include <fstream>
#include <regex>
#include <cstdlib>
#include <stdexcept>

namespace ecmsio {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open()) throw std::runtime_error("Cannot open '" + path + "'");
    try {
        nlohmann::json j;
        f >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in '" + path + "': " + e.what());
    }
}

std::string expand_env(const std::string& text)
{
    static const std::regex var_re(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");
    std::string out;
    auto last = text.cbegin();
    for (std::sregex_iterator it(text.begin(), text.end(), var_re), end; it != end; ++it) {
        const std::smatch& m = *it;
        out.append(last, m[0].first);
        const std::string var = m[1];
        const char* value = std::getenv(var.c_str());
        if (!value)
            throw std::runtime_error("Config refers to unset variable ${" + var + "}");
        out += value;
        last = m[0].second;
    }
    out.append(last, text.cend());
    return out;
}

static std::string config_string(const nlohmann::json& j, const char* key)
{
    if (!j[key].is_string())
        throw std::runtime_error(std::string("Config key '") + key + "' must be a string");
    return expand_env(j[key].get<std::string>());
}

/* ---------------------------------------------------------------------- */
ReaderConfig ReaderConfig::from_json(const nlohmann::json& j)
{
    ReaderConfig cfg;
    if (j.contains("format"))    cfg.format    = config_string(j, "format");
    if (j.contains("technique")) cfg.technique = parse_technique(config_string(j, "technique"));
    if (j.contains("name"))      cfg.name      = config_string(j, "name");

    if (j.contains("cycle")) {
        const auto& c = j["cycle"];
        cfg.segment_cycles = true;
        if (c.contains("startPotential") && !c["startPotential"].is_null())
            cfg.cycle.start_potential = c["startPotential"].get<double>();
        cfg.cycle.anodic          = c.value("anodic", true);
        cfg.cycle.debounce_points = c.value("debouncePoints", 5);
    }
    return cfg;
}

} // namespace ecmsio
