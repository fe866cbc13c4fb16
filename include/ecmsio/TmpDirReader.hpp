#pragma once
#include "Measurement.hpp"
#include "Series.hpp"

#include <string>
#include <vector>

namespace ecmsio {

/*
 * The acquisition software streams every channel into its own file
 *
 *     <run dir>/tmp/2021-03-15 18_50_10 <...>.M44.data
 *
 * while a measurement is running.  When it crashes only this directory
 * is left; read_tmp_dir() stitches the files back into one measurement.
 */
Measurement read_tmp_dir(const std::string& tmp_dir);

// [TimeSeries, ValueSeries] of one channel file; empty if the file name
// does not name a channel
std::vector<SeriesPtr> series_from_tmp_file(const std::string& path);

} // namespace ecmsio
