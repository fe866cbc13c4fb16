#pragma once
#include "AliasTable.hpp"
#include "Series.hpp"
#include "Technique.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ecmsio {

/* --------------------------------------------------------------------- */
/*  Reader output.  Holds every series exactly once in a flat list;      */
/*  ValueSeries refer to TimeSeries that are members of the same list.   */
/* --------------------------------------------------------------------- */
struct Measurement
{
    std::string            name;
    Technique              technique = Technique::ECMS;
    double                 tstamp    = 0.0;
    nlohmann::json         metadata  = nlohmann::json::object();
    std::vector<SeriesPtr> series;
    AliasTable             aliases;

    // exact series name first, then the first alias target present
    SeriesPtr find(const std::string& name) const;
    SeriesPtr at(const std::string& name) const;
    ValueSeriesPtr value_series(const std::string& name) const;

    void replace_series(const std::string& name, SeriesPtr s);

    std::vector<TimeSeriesPtr> time_series() const;
    std::vector<std::string>   series_names() const;
};

nlohmann::json to_json(const Measurement& m);

} // namespace ecmsio
