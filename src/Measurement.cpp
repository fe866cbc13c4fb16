#include "ecmsio/Measurement.hpp"
#include <algorithm>
#include <stdexcept>

namespace ecmsio {

static SeriesPtr find_exact(const std::vector<SeriesPtr>& list,
                            const std::string& name)
{
    auto it = std::find_if(list.begin(), list.end(),
                           [&](const SeriesPtr& s) { return s->name() == name; });
    return it == list.end() ? nullptr : *it;
}

SeriesPtr Measurement::find(const std::string& key) const
{
    if (auto s = find_exact(series, key)) return s;
    if (!aliases.contains(key)) return nullptr;
    for (const auto& target : aliases.targets(key)) {
        if (target == key) continue;
        if (auto s = find_exact(series, target)) return s;
    }
    return nullptr;
}

SeriesPtr Measurement::at(const std::string& key) const
{
    auto s = find(key);
    if (!s)
        throw std::out_of_range("Measurement '" + name +
                                "' has no series or alias '" + key + "'");
    return s;
}

ValueSeriesPtr Measurement::value_series(const std::string& key) const
{
    auto v = std::dynamic_pointer_cast<const ValueSeries>(at(key));
    if (!v)
        throw std::invalid_argument("'" + key + "' in measurement '" + name +
                                    "' is not a ValueSeries");
    return v;
}

void Measurement::replace_series(const std::string& key, SeriesPtr s)
{
    if (!s) throw std::invalid_argument("replace_series: null series");
    for (auto& existing : series) {
        if (existing->name() == key) {
            existing = std::move(s);
            return;
        }
    }
    series.push_back(std::move(s));
}

std::vector<TimeSeriesPtr> Measurement::time_series() const
{
    std::vector<TimeSeriesPtr> out;
    for (const auto& s : series)
        if (auto t = std::dynamic_pointer_cast<const TimeSeries>(s))
            if (std::find(out.begin(), out.end(), t) == out.end())
                out.push_back(t);
    return out;
}

std::vector<std::string> Measurement::series_names() const
{
    std::vector<std::string> out;
    out.reserve(series.size());
    for (const auto& s : series) out.push_back(s->name());
    return out;
}

/* ---------------------------------------------------------------------- */
nlohmann::json to_json(const Measurement& m)
{
    nlohmann::json j;
    j["name"]      = m.name;
    j["technique"] = to_string(m.technique);
    j["tstamp"]    = m.tstamp;
    j["metadata"]  = m.metadata;

    nlohmann::json aliases = nlohmann::json::object();
    for (const auto& [key, targets] : m.aliases.entries())
        aliases[key] = targets;
    j["aliases"] = aliases;

    nlohmann::json list = nlohmann::json::array();
    for (const auto& s : m.series) {
        nlohmann::json e;
        e["id"]   = s->id();
        e["name"] = s->name();
        e["unit"] = s->unit();
        e["kind"] = s->kind();
        e["size"] = s->size();
        if (auto t = std::dynamic_pointer_cast<const TimeSeries>(s))
            e["tstamp"] = t->tstamp();
        if (auto v = std::dynamic_pointer_cast<const ValueSeries>(s))
        {
            e["tseries"]    = v->tseries()->id();
            e["tseries_name"] = v->tseries()->name();
        }
        list.push_back(e);
    }
    j["series"] = list;
    return j;
}

} // namespace ecmsio
