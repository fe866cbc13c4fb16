#include "ecmsio/TsvFormat.hpp"
#include "ecmsio/Errors.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <istream>
#include <limits>

namespace ecmsio {

namespace {

void strip_eol(std::string& line)
{
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        line.pop_back();
}

std::string trim(const std::string& s)
{
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

bool next_line(std::istream& in, std::string& line)
{
    if (!std::getline(in, line)) return false;
    strip_eol(line);
    return true;
}

} // unnamed namespace

/* ---------------------------------------------------------------------- */
std::vector<std::string> split_tabs(const std::string& line)
{
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        const auto pos = line.find('\t', start);
        if (pos == std::string::npos) {
            out.push_back(line.substr(start));
            return out;
        }
        out.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
}

bool parse_double(const std::string& token, double& out)
{
    const std::string t = trim(token);
    if (t.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size()) return false;
    if (errno == ERANGE && std::isinf(v)) return false;
    out = v;
    return true;
}

bool parse_int(const std::string& token, long long& out)
{
    const std::string t = trim(token);
    if (t.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(t.c_str(), &end, 10);
    if (end != t.c_str() + t.size() || errno == ERANGE) return false;
    out = v;
    return true;
}

/* ====================================================================== *
 *  metadata lines
 * ====================================================================== */
std::pair<std::string, nlohmann::json>
parse_metadata_line(const std::string& raw, const std::string& path)
{
    std::string line = raw;
    strip_eol(line);
    const auto fields = split_tabs(line);
    if (fields.size() != 5)
        throw FormatError("Metadata line needs 5 tab-separated fields, has " +
                          std::to_string(fields.size()), line, path);

    const std::string& name   = fields[0];
    const std::string& series = fields[2];
    const std::string& type   = fields[3];
    const std::string& value  = fields[4];

    // per-series items share generic names ("count"), so qualify them
    std::string key = series.empty() ? name : series + "_" + name;

    if (type == "string")
        return {key, value};
    if (type == "int") {
        long long v = 0;
        if (!parse_int(value, v))
            throw FormatError("Metadata item '" + key + "' is not an int", value, path);
        return {key, v};
    }
    if (type == "double") {
        double v = 0.0;
        if (!parse_double(value, v))
            throw FormatError("Metadata item '" + key + "' is not a double", value, path);
        return {key, v};
    }
    if (type == "bool")
        return {key, value == "true"};

    throw FormatError("Unknown metadata type for '" + name + "'", type, path);
}

/* ====================================================================== *
 *  preamble: metadata + two header rows
 * ====================================================================== */
Preamble read_preamble(std::istream& in, const std::string& path)
{
    Preamble p;
    std::string line;

    auto read_item = [&](std::size_t lineno) {
        if (!next_line(in, line))
            throw FormatError("File ends inside the metadata preamble",
                              "line " + std::to_string(lineno + 1), path);
        auto [key, value] = parse_metadata_line(line, path);
        p.metadata[key] = std::move(value);
    };

    // -------------------- 1. fixed lines declare the total ----------------
    for (std::size_t i = 0; i < kFixedMetadataLines; ++i) read_item(i);

    auto it = p.metadata.find("num_header_lines");
    if (it == p.metadata.end() || !it->is_number_integer())
        throw FormatError("Preamble does not declare its length",
                          "num_header_lines", path);
    const long long declared = it->get<long long>();
    if (declared < 0)
        throw FormatError("Negative header line count",
                          std::to_string(declared), path);
    p.header_lines = static_cast<std::size_t>(declared);

    // -------------------- 2. the rest, now that the length is known -------
    for (std::size_t i = kFixedMetadataLines; i < p.header_lines; ++i) read_item(i);

    // older files lack the version item
    if (!p.metadata.contains("file_format_version"))
        p.metadata["file_format_version"] = 1;

    // -------------------- 3. header rows ----------------------------------
    if (!next_line(in, line))
        throw FormatError("Missing series header row", "", path);
    p.series_headers = split_tabs(line);
    if (!next_line(in, line))
        throw FormatError("Missing column header row", "", path);
    p.column_headers = split_tabs(line);

    if (p.series_headers.size() != p.column_headers.size())
        throw FormatError("Series and column header rows differ in width",
                          std::to_string(p.series_headers.size()) + " vs " +
                          std::to_string(p.column_headers.size()), path);
    return p;
}

/* ====================================================================== *
 *  numeric matrix
 * ====================================================================== */
Matrix read_table(std::istream& in, std::size_t ncols, const std::string& path)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<double> values;       // row-major
    std::size_t nrows = 0;
    std::string line;

    while (next_line(in, line)) {
        if (trim(line).empty()) continue;
        const auto fields = split_tabs(line);

        for (std::size_t c = ncols; c < fields.size(); ++c)
            if (!trim(fields[c]).empty())
                throw FormatError("Data row " + std::to_string(nrows + 1) +
                                  " is wider than the header", fields[c], path);

        for (std::size_t c = 0; c < ncols; ++c) {
            if (c >= fields.size() || trim(fields[c]).empty()) {
                values.push_back(nan);
                continue;
            }
            double v = 0.0;
            if (!parse_double(fields[c], v))
                throw FormatError("Non-numeric value in data row " +
                                  std::to_string(nrows + 1), fields[c], path);
            values.push_back(v);
        }
        ++nrows;
    }

    Matrix m(static_cast<Eigen::Index>(nrows), static_cast<Eigen::Index>(ncols));
    for (std::size_t r = 0; r < nrows; ++r)
        for (std::size_t c = 0; c < ncols; ++c)
            m(r, c) = values[r * ncols + c];
    return m;
}

} // namespace ecmsio
