#pragma once
#include "ecmsio/CycleSegmenter.hpp"
#include "ecmsio/Technique.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ecmsio {

nlohmann::json load_json(const std::string& path);

// "${VAR}" replaced by the environment; an unset variable is an error
std::string expand_env(const std::string& text);

// settings of one read, from a JSON config or the command line;
// string values of the config go through expand_env
struct ReaderConfig {
    std::string  format    = "auto";
    Technique    technique = Technique::ECMS;
    std::string  name;                  // empty: file stem
    bool         segment_cycles = false;
    CycleOptions cycle;

    static ReaderConfig from_json(const nlohmann::json& j);
};

} // namespace ecmsio
