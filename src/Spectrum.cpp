#include "ecmsio/Spectrum.hpp"
#include <stdexcept>

namespace ecmsio {

namespace {

constexpr const char* kSpectrumTimeName = "spectrum time [s]";

// both axes present and the second one a one-point TimeSeries
void check_spectrum_field(const Field& f)
{
    if (f.axes().size() != 2)
        throw std::invalid_argument("Spectrum field '" + f.name() +
                                    "' must have exactly two axes, has " +
                                    std::to_string(f.axes().size()));
    auto t = std::dynamic_pointer_cast<const TimeSeries>(f.axes()[1]);
    if (!t || t->size() != 1)
        throw std::invalid_argument("Spectrum field '" + f.name() +
                                    "': second axis must be a one-point TimeSeries");
}

} // unnamed namespace

Spectrum::Spectrum(std::string name, FieldPtr field,
                   std::string technique, nlohmann::json metadata)
    : name_(std::move(name)), technique_(std::move(technique)),
      metadata_(std::move(metadata)), field_(std::move(field))
{
    check_spectrum_field(*field_.get());
}

Spectrum::Spectrum(std::string name, ObjectId field_id,
                   std::shared_ptr<const ObjectStore> store,
                   std::string technique, nlohmann::json metadata)
    : name_(std::move(name)), technique_(std::move(technique)),
      metadata_(std::move(metadata)), field_(field_id, "Field"),
      store_(std::move(store))
{
    if (!store_)
        throw std::invalid_argument("Spectrum '" + name_ +
                                    "': lazy field needs a store");
}

/* ---------------------------------------------------------------------- */
Spectrum Spectrum::from_field(FieldPtr field, std::string technique)
{
    if (!field) throw std::invalid_argument("Spectrum::from_field: null field");
    std::string name = field->name();
    return Spectrum(std::move(name), std::move(field), std::move(technique));
}

Spectrum Spectrum::from_series(SeriesPtr xseries, const Series& yseries,
                               double tstamp, std::string technique)
{
    auto tseries = std::make_shared<const TimeSeries>(
        kSpectrumTimeName, "s", Vector::Zero(1), tstamp);
    // shape (N, 1): row-major flat storage is y itself
    auto field = std::make_shared<const Field>(
        yseries.name(), yseries.unit(), yseries.data(),
        std::vector<SeriesPtr>{std::move(xseries), std::move(tseries)});
    return from_field(std::move(field), std::move(technique));
}

Spectrum Spectrum::from_data(Vector x, Vector y, double tstamp,
                             std::string x_name, std::string y_name,
                             std::string x_unit, std::string y_unit,
                             std::string technique)
{
    auto xs = std::make_shared<const Series>(std::move(x_name),
                                             std::move(x_unit), std::move(x));
    const Series ys(std::move(y_name), std::move(y_unit), std::move(y));
    return from_series(std::move(xs), ys, tstamp, std::move(technique));
}

/* ---------------------------------------------------------------------- */
const FieldPtr& Spectrum::field() const
{
    if (!field_.is_resolved())
        return field_.resolve(*store_, check_spectrum_field);
    return field_.get();
}

const SeriesPtr& Spectrum::xseries() const
{
    return field()->axes()[0];
}

TimeSeriesPtr Spectrum::tseries() const
{
    return std::static_pointer_cast<const TimeSeries>(field()->axes()[1]);
}

Vector Spectrum::y() const
{
    return field()->lane(0, {0, 0});
}

Series Spectrum::yseries() const
{
    return Series(field()->name(), field()->unit(), y());
}

double Spectrum::tstamp() const
{
    const TimeSeriesPtr t = tseries();
    return t->data()[0] + t->tstamp();
}

/* ---------------------------------------------------------------------- */
nlohmann::json to_json(const Spectrum& s)
{
    nlohmann::json j;
    j["name"]      = s.name();
    j["technique"] = s.technique();
    j["tstamp"]    = s.tstamp();
    j["x_name"]    = s.x_name();
    j["y_name"]    = s.y_name();
    j["size"]      = s.x().size();
    if (!s.metadata().is_null()) j["metadata"] = s.metadata();
    return j;
}

} // namespace ecmsio
