#include "ecmsio/MeasurementLoaders.hpp"
#include "ecmsio/TmpDirReader.hpp"
#include "ecmsio/TsvReader.hpp"

#include <filesystem>
#include <stdexcept>
#include <unordered_map>

namespace ecmsio {

static const std::unordered_map<std::string, MeasurementLoader> kLoaderMap = {
    {"tsv", [](const std::string& p, Technique t) { return read_tsv(p, t); }},
    {"tmp", [](const std::string& p, Technique)   { return read_tmp_dir(p); }},
};

Measurement load_measurement(const std::string& path,
                             const std::string& format,
                             Technique          technique)
{
    std::string fmt = format;
    if (fmt == "auto")
        fmt = std::filesystem::is_directory(path) ? "tmp" : "tsv";

    auto it = kLoaderMap.find(fmt);
    if (it == kLoaderMap.end())
        throw std::runtime_error("Unsupported measurement format: " + format);

    return it->second(path, technique);
}

} // namespace ecmsio
