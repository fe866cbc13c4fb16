#pragma once
#include "Spectrum.hpp"
#include <string>
#include <vector>

namespace ecmsio {

// the x column has gone by both spellings
inline const std::vector<std::string> kMassColumnNames = {"Mass  [AMU]", "Mass [AMU]"};
inline const std::string              kSpectrumCurrentColumn = "Current [A]";
inline const std::string              kScanStartLabel = "Mass scan started at [s]";
constexpr std::size_t                 kSpectrumHeaderLine = 9;   // 0-based

// single mass scan exported by the acquisition software
Spectrum read_ms_spectrum(const std::string& path);

} // namespace ecmsio
