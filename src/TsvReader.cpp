#include "ecmsio/TsvReader.hpp"
#include "ecmsio/ColumnNaming.hpp"
#include "ecmsio/Errors.hpp"
#include "ecmsio/Timestamp.hpp"
#include "ecmsio/TsvFormat.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ecmsio {

namespace {

std::size_t column_index(const std::vector<std::string>& headers,
                         const std::string& wanted,
                         const std::string& path)
{
    auto it = std::find(headers.begin(), headers.end(), wanted);
    if (it == headers.end())
        throw FormatError("EC-lab block lacks a run identifier column", wanted, path);
    return static_cast<std::size_t>(it - headers.begin());
}

// row runs of the embedded potentiostat log, one per technique visit
std::vector<RowRange> ec_lab_runs(const std::vector<std::string>& headers,
                                  const Matrix&                   block,
                                  std::size_t                     count,
                                  const std::string&              path)
{
    const std::size_t exp_col  = column_index(headers, kExperimentColumn, path);
    const std::size_t tech_col = column_index(headers, kTechniqueColumn,  path);

    std::vector<std::int64_t> keys(count);
    for (std::size_t r = 0; r < count; ++r)
        keys[r] = composite_run_key(block(r, exp_col), block(r, tech_col), path);
    return split_runs(keys);
}

} // unnamed namespace

/* ====================================================================== *
 *  policy helpers
 * ====================================================================== */
bool block_is_relevant(Technique technique, const std::string& block_header)
{
    if (!includes_ec(technique) &&
        (block_header == kPotentialBlock || block_header == kEcLabBlock))
        return false;
    if (!includes_ms(technique) && mass_of_block(block_header))
        return false;
    return true;
}

AliasTable default_aliases(Technique technique)
{
    AliasTable a;
    if (includes_ec(technique)) {
        a.add("t",             "Potential time [s]");
        a.add("raw_potential", "Voltage [V]");
        a.add("raw_current",   "Current [mA]");
        a.add("cycle_number",  "Cycle [n]");
    }
    return a;
}

std::size_t block_row_count(const nlohmann::json& metadata,
                            const std::string&    block_header,
                            std::size_t           available_rows,
                            const std::string&    path)
{
    const std::string key = block_header + "_" + block_header + "_count";
    auto it = metadata.find(key);
    if (it == metadata.end() || !it->is_number_integer())
        throw FormatError("No valid-row count for block '" + block_header + "'",
                          key, path);
    const long long n = it->get<long long>();
    if (n < 0)
        throw FormatError("Negative row count", key, path);
    return std::min(static_cast<std::size_t>(n), available_rows);
}

double measurement_tstamp(const nlohmann::json& metadata,
                          const std::string&    stem,
                          const std::string&    path)
{
    auto it = metadata.find("start_time_unix");
    if (it == metadata.end())
        return tstamp_from_stem(stem, path);

    if (it->is_number()) return it->get<double>();

    double t = 0.0;
    if (it->is_string() && parse_double(it->get<std::string>(), t)) return t;
    throw FormatError("start_time_unix is not a number", it->dump(), path);
}

/* ====================================================================== *
 *  series of one block (or one run of the EC-lab block)
 * ====================================================================== */
std::vector<SeriesPtr> block_series(const std::string&              block_header,
                                    const std::vector<std::string>& column_headers,
                                    const Matrix&                   block_data,
                                    RowRange                        rows,
                                    double                          tstamp,
                                    const std::string&              path)
{
    std::vector<SeriesPtr> out;
    TimeSeriesPtr          tseries;
    const auto             n = static_cast<Eigen::Index>(rows.size());

    for (std::size_t c = 0; c < column_headers.size(); ++c) {
        const std::string& header = column_headers[c];
        if (is_run_id_column(header)) continue;

        Vector column = block_data.block(static_cast<Eigen::Index>(rows.begin),
                                         static_cast<Eigen::Index>(c), n, 1);
        // holes in the EC-lab log: columns of techniques that were not run
        if (column.array().isNaN().all()) continue;

        ColumnName cn = form_column_name(block_header, header);

        if (is_time_column(header)) {
            tseries = std::make_shared<const TimeSeries>(
                std::move(cn.name), std::move(cn.unit), std::move(column), tstamp);
            // a hole or a step back inside the counted rows
            if (!tseries->is_monotonic())
                throw FormatError("Time column of block '" + block_header +
                                  "' is not monotonic", header, path);
            out.push_back(tseries);
            continue;
        }
        if (!tseries)
            throw FormatError("Time column must be first in block '" +
                              block_header + "'", header, path);
        out.push_back(std::make_shared<const ValueSeries>(
            std::move(cn.name), std::move(cn.unit), std::move(column), tseries));
    }
    return out;
}

/* ====================================================================== *
 *  read_tsv
 * ====================================================================== */
Measurement read_tsv(const std::string& path,
                     Technique          technique,
                     const std::string& name)
{
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("Cannot open '" + path + "'");

    // -------------------- 1. preamble + header rows ---------------------
    Preamble pre = read_preamble(in, path);

    // -------------------- 2. numeric matrix -----------------------------
    const Matrix data = read_table(in, pre.column_headers.size(), path);
    const auto   nrows = static_cast<std::size_t>(data.rows());

    // -------------------- 3. time origin --------------------------------
    const std::string stem = fs::path(path).stem().string();
    const double tstamp = measurement_tstamp(pre.metadata, stem, path);

    // -------------------- 4./5. blocks ----------------------------------
    Measurement m;
    AliasTableBuilder aliases;

    for (const auto& block : split_blocks(pre.series_headers)) {
        if (!block_is_relevant(technique, block.header)) continue;

        const std::vector<std::string> headers(
            pre.column_headers.begin() + static_cast<std::ptrdiff_t>(block.begin),
            pre.column_headers.begin() + static_cast<std::ptrdiff_t>(block.end));
        const Matrix block_data = data.middleCols(
            static_cast<Eigen::Index>(block.begin),
            static_cast<Eigen::Index>(block.width()));
        const std::size_t count = block_row_count(pre.metadata, block.header,
                                                  nrows, path);

        AliasTable block_aliases;
        for (const auto& h : headers) {
            const ColumnName cn = form_column_name(block.header, h);
            if (cn.standard_name) block_aliases.add(*cn.standard_name, cn.name);
        }

        std::vector<RowRange> runs;
        if (block.header == kEcLabBlock)
            runs = ec_lab_runs(headers, block_data, count, path);
        else
            runs.push_back({0, count});

        for (const RowRange& run : runs) {
            auto part = block_series(block.header, headers, block_data, run,
                                     tstamp, path);
            m.series.insert(m.series.end(), part.begin(), part.end());
        }
        aliases.merge_block(block_aliases);
    }

    // -------------------- 6. aliases + payload --------------------------
    aliases.add_defaults(default_aliases(technique));

    m.name      = name.empty() ? stem : name;
    m.technique = technique;
    m.tstamp    = tstamp;
    m.metadata  = std::move(pre.metadata);
    m.aliases   = aliases.build();
    return m;
}

} // namespace ecmsio
