#pragma once
#include "Types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ecmsio {

// id 0 is never handed out; passing it asks for a fresh one
constexpr ObjectId kNewId = 0;
ObjectId next_object_id();

/* --------------------------------------------------------------------- */
/*  Common identity of everything a backend can store:  id, name, unit   */
/* --------------------------------------------------------------------- */
class DataObject
{
public:
    virtual ~DataObject() = default;

    ObjectId           id()   const { return id_; }
    const std::string& name() const { return name_; }
    const std::string& unit() const { return unit_; }

    virtual const char* kind() const = 0;

protected:
    DataObject(std::string name, std::string unit, ObjectId id);

private:
    ObjectId    id_;
    std::string name_;
    std::string unit_;
};

// Named, unit-tagged 1-D sequence.  The data is fixed at construction.
class Series : public DataObject
{
public:
    Series(std::string name, std::string unit, Vector data,
           ObjectId id = kNewId);

    const Vector& data() const { return data_; }
    Eigen::Index  size() const { return data_.size(); }

    const char* kind() const override { return "Series"; }

private:
    Vector data_;
};

// Elapsed seconds relative to an absolute epoch offset `tstamp`.
class TimeSeries : public Series
{
public:
    TimeSeries(std::string name, std::string unit, Vector data, double tstamp,
               ObjectId id = kNewId);

    double tstamp() const { return tstamp_; }

    /* non-decreasing and without NaN holes */
    bool is_monotonic() const;

    const char* kind() const override { return "TimeSeries"; }

private:
    double tstamp_;
};

using SeriesPtr     = std::shared_ptr<const Series>;
using TimeSeriesPtr = std::shared_ptr<const TimeSeries>;

/*
 * Measured values on a shared time axis.  Many ValueSeries may point at
 * the same TimeSeries; the TimeSeries is stored once in the owning
 * Measurement and referenced from here.
 */
class ValueSeries : public Series
{
public:
    ValueSeries(std::string name, std::string unit, Vector data,
                TimeSeriesPtr tseries, ObjectId id = kNewId);

    const TimeSeriesPtr& tseries() const { return tseries_; }

    // absolute-epoch-relative time of every sample (tseries data)
    const Vector& t() const { return tseries_->data(); }

    const char* kind() const override { return "ValueSeries"; }

private:
    TimeSeriesPtr tseries_;
};

using ValueSeriesPtr = std::shared_ptr<const ValueSeries>;

/* --------------------------------------------------------------------- */
/*  N-dimensional data spanning one Series per axis.                     */
/*                                                                       */
/*  data is stored flat in row-major order (the last axis varies         */
/*  fastest); shape()[i] == axes()[i]->size() for every axis.            */
/* --------------------------------------------------------------------- */
class Field : public DataObject
{
public:
    Field(std::string name, std::string unit, Vector data,
          std::vector<SeriesPtr> axes, ObjectId id = kNewId);

    const Vector&                 data() const { return data_; }
    const std::vector<SeriesPtr>& axes() const { return axes_; }

    std::vector<Eigen::Index> shape() const;

    Real at(const std::vector<Eigen::Index>& index) const;

    /* all values along `axis`, the other coordinates taken from `index` */
    Vector lane(std::size_t axis, std::vector<Eigen::Index> index) const;

    const char* kind() const override { return "Field"; }

private:
    Eigen::Index flat_index(const std::vector<Eigen::Index>& index) const;

    Vector                 data_;
    std::vector<SeriesPtr> axes_;
};

using FieldPtr = std::shared_ptr<const Field>;

} // namespace ecmsio
