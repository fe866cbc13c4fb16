// MeasurementLoaders.hpp
#pragma once
#include "ecmsio/Measurement.hpp"
#include "ecmsio/Technique.hpp"
#include <functional>
#include <string>

namespace ecmsio {

using MeasurementLoader =
    std::function<Measurement(const std::string&, Technique)>;

// "tsv"  - exported two-header-row file
// "tmp"  - per-channel tmp directory of a crashed run
// "auto" - "tmp" for directories, "tsv" otherwise
Measurement load_measurement(const std::string& path,
                             const std::string& format    = "auto",
                             Technique          technique = Technique::ECMS);

} // namespace ecmsio
