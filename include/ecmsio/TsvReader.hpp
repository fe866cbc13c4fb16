#pragma once
#include "AliasTable.hpp"
#include "Measurement.hpp"
#include "TabularBlocks.hpp"
#include "Technique.hpp"
#include "Types.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ecmsio {

/* --------------------------------------------------------------------- */
/*  Reader for the two-header-row TSV export of the EC-MS acquisition    */
/*  software.                                                            */
/*                                                                       */
/*    metadata preamble       5 tab-separated fields per line            */
/*    series header row       one name per block, blanks continue it     */
/*    column header row       "Time [s]", "M44-CO2 [A]", ...             */
/*    numeric rows            ragged, NaN padded                         */
/*                                                                       */
/*  Every block yields one TimeSeries and one ValueSeries per remaining  */
/*  column.  The "EC-lab" block interleaves several potentiostat         */
/*  techniques; it is cut into row runs by (experiment, technique) and   */
/*  each run gets its own TimeSeries.                                    */
/* --------------------------------------------------------------------- */
Measurement read_tsv(const std::string& path,
                     Technique          technique = Technique::ECMS,
                     const std::string& name      = {});

// false for blocks the requested technique leaves out
bool block_is_relevant(Technique technique, const std::string& block_header);

// aliases every file gets on top of the ones its blocks contribute
AliasTable default_aliases(Technique technique);

// number of valid rows of a block, recorded as "{block}_{block}_count"
std::size_t block_row_count(const nlohmann::json& metadata,
                            const std::string&    block_header,
                            std::size_t           available_rows,
                            const std::string&    path = {});

// absolute start of the measurement: metadata if present, else file name
double measurement_tstamp(const nlohmann::json& metadata,
                          const std::string&    stem,
                          const std::string&    path = {});

/*
 * Series of one block restricted to rows [rows.begin, rows.end).
 * The time column has to come first; run-identifier columns and columns
 * without a single value are skipped.
 */
std::vector<SeriesPtr> block_series(const std::string&              block_header,
                                    const std::vector<std::string>& column_headers,
                                    const Matrix&                   block_data,
                                    RowRange                        rows,
                                    double                          tstamp,
                                    const std::string&              path = {});

} // namespace ecmsio
