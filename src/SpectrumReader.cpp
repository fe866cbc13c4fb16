#include "ecmsio/SpectrumReader.hpp"
#include "ecmsio/Errors.hpp"
#include "ecmsio/TsvFormat.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <regex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ecmsio {

namespace {

const std::regex kFloatRe(R"([-+]?(?:[0-9]+\.?[0-9]*|\.[0-9]+)(?:[eE][-+]?[0-9]+)?)");

std::optional<double> scan_start(const std::string& line)
{
    const auto pos = line.find(kScanStartLabel);
    if (pos == std::string::npos) return std::nullopt;
    const std::string rest = line.substr(pos + kScanStartLabel.size());
    std::smatch m;
    if (!std::regex_search(rest, m, kFloatRe)) return std::nullopt;
    double v = 0.0;
    if (!parse_double(m.str(), v)) return std::nullopt;
    return v;
}

} // unnamed namespace

Spectrum read_ms_spectrum(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("Cannot open '" + path + "'");

    // -------------------- 1. preamble + header ------------------------------
    std::optional<double> tstamp;
    std::string line;
    for (std::size_t i = 0; i < kSpectrumHeaderLine; ++i) {
        if (!std::getline(in, line))
            throw FormatError("File ends inside the spectrum preamble",
                              "line " + std::to_string(i + 1), path);
        if (auto t = scan_start(line)) tstamp = t;
    }
    if (!std::getline(in, line))
        throw FormatError("Missing spectrum column header", "", path);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!tstamp) tstamp = scan_start(line);
    if (!tstamp)
        throw FormatError("No scan start time in the spectrum preamble",
                          kScanStartLabel, path);
    const std::vector<std::string> headers = split_tabs(line);

    // -------------------- 2. locate columns --------------------------------
    std::optional<std::size_t> x_col;
    std::string x_name;
    for (const auto& candidate : kMassColumnNames) {
        auto it = std::find(headers.begin(), headers.end(), candidate);
        if (it != headers.end()) {
            x_col  = static_cast<std::size_t>(it - headers.begin());
            x_name = candidate;
            break;
        }
    }
    if (!x_col)
        throw FormatError("No mass column; looked for \"" + kMassColumnNames[0] +
                          "\" and \"" + kMassColumnNames[1] + "\"", "", path);

    auto y_it = std::find(headers.begin(), headers.end(), kSpectrumCurrentColumn);
    if (y_it == headers.end())
        throw FormatError("No current column", kSpectrumCurrentColumn, path);
    const auto y_col = static_cast<Eigen::Index>(y_it - headers.begin());

    // -------------------- 3. data -------------------------------------------
    const Matrix data = read_table(in, headers.size(), path);

    const Spectrum raw = Spectrum::from_data(
        Vector(data.col(static_cast<Eigen::Index>(*x_col))), Vector(data.col(y_col)),
        *tstamp, x_name, kSpectrumCurrentColumn, "m/z", "A", "MS");
    return Spectrum(fs::path(path).filename().string(), raw.field(), "MS");
}

} // namespace ecmsio
