#pragma once
#include "ObjectStore.hpp"
#include "Series.hpp"
#include "Types.hpp"

#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace ecmsio {

/*
 * One spectrum: y spanning an x-domain and a single time sample.
 *
 *   field.axes()[0]  x Series     (e.g. m/z)
 *   field.axes()[1]  TimeSeries with exactly one point
 *
 * The field may live in a backend; it is then loaded through the store
 * on first access and kept for the rest of the object's life.
 */
class Spectrum
{
public:
    Spectrum(std::string name, FieldPtr field,
             std::string technique = {}, nlohmann::json metadata = {});
    Spectrum(std::string name, ObjectId field_id,
             std::shared_ptr<const ObjectStore> store,
             std::string technique = {}, nlohmann::json metadata = {});

    /* ------------ construction paths ------------------------------- */
    static Spectrum from_field(FieldPtr field, std::string technique = {});
    static Spectrum from_series(SeriesPtr xseries, const Series& yseries,
                                double tstamp, std::string technique = {});
    static Spectrum from_data(Vector x, Vector y, double tstamp,
                              std::string x_name = "x", std::string y_name = "y",
                              std::string x_unit = {}, std::string y_unit = {},
                              std::string technique = {});

    const std::string&    name()      const { return name_; }
    const std::string&    technique() const { return technique_; }
    const nlohmann::json& metadata()  const { return metadata_; }

    bool field_loaded() const { return field_.is_resolved(); }
    ObjectId field_id() const { return field_.id(); }
    const FieldPtr& field() const;

    /* ------------ views -------------------------------------------- */
    const SeriesPtr&    xseries() const;
    TimeSeriesPtr       tseries() const;
    Series              yseries() const;
    const Vector&       x()       const { return xseries()->data(); }
    Vector              y()       const;
    const std::string&  x_name()  const { return xseries()->name(); }
    const std::string&  y_name()  const { return field()->name(); }
    double              tstamp()  const;

private:
    std::string                        name_;
    std::string                        technique_;
    nlohmann::json                     metadata_;
    mutable LazyRef<Field>             field_;
    std::shared_ptr<const ObjectStore> store_;
};

nlohmann::json to_json(const Spectrum& s);

} // namespace ecmsio
