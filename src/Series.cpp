#include "ecmsio/Series.hpp"
#include <atomic>
#include <cmath>
#include <stdexcept>

namespace ecmsio {

ObjectId next_object_id()
{
    static std::atomic<ObjectId> counter{0};
    return ++counter;
}

DataObject::DataObject(std::string name, std::string unit, ObjectId id)
    : id_(id == kNewId ? next_object_id() : id),
      name_(std::move(name)), unit_(std::move(unit))
{}

/* ---------------------------------------------------------------------- */
Series::Series(std::string name, std::string unit, Vector data, ObjectId id)
    : DataObject(std::move(name), std::move(unit), id), data_(std::move(data))
{}

/* ---------------------------------------------------------------------- */
TimeSeries::TimeSeries(std::string name, std::string unit, Vector data,
                       double tstamp, ObjectId id)
    : Series(std::move(name), std::move(unit), std::move(data), id),
      tstamp_(tstamp)
{}

bool TimeSeries::is_monotonic() const
{
    const Vector& t = data();
    for (Eigen::Index i = 0; i < t.size(); ++i) {
        if (std::isnan(t[i])) return false;
        if (i > 0 && t[i] < t[i - 1]) return false;
    }
    return true;
}

/* ---------------------------------------------------------------------- */
ValueSeries::ValueSeries(std::string name, std::string unit, Vector data,
                         TimeSeriesPtr tseries, ObjectId id)
    : Series(std::move(name), std::move(unit), std::move(data), id),
      tseries_(std::move(tseries))
{
    if (!tseries_)
        throw std::invalid_argument("ValueSeries '" + this->name() +
                                    "' needs a TimeSeries");
    if (tseries_->size() != size())
        throw std::invalid_argument(
            "ValueSeries '" + this->name() + "' has " + std::to_string(size()) +
            " points but its TimeSeries '" + tseries_->name() + "' has " +
            std::to_string(tseries_->size()));
}

/* ====================================================================== *
 *  Field
 * ====================================================================== */
Field::Field(std::string name, std::string unit, Vector data,
             std::vector<SeriesPtr> axes, ObjectId id)
    : DataObject(std::move(name), std::move(unit), id),
      data_(std::move(data)), axes_(std::move(axes))
{
    Eigen::Index expected = axes_.empty() ? 0 : 1;
    for (const auto& ax : axes_) {
        if (!ax)
            throw std::invalid_argument("Field '" + this->name() +
                                        "' has a null axis");
        expected *= ax->size();
    }
    if (expected != data_.size())
        throw std::invalid_argument(
            "Field '" + this->name() + "' holds " +
            std::to_string(data_.size()) + " values but its axes span " +
            std::to_string(expected));
}

std::vector<Eigen::Index> Field::shape() const
{
    std::vector<Eigen::Index> s;
    s.reserve(axes_.size());
    for (const auto& ax : axes_) s.push_back(ax->size());
    return s;
}

Eigen::Index Field::flat_index(const std::vector<Eigen::Index>& index) const
{
    if (index.size() != axes_.size())
        throw std::out_of_range("Field '" + name() + "': expected " +
                                std::to_string(axes_.size()) + " indices");
    Eigen::Index flat = 0;
    for (std::size_t i = 0; i < index.size(); ++i) {
        const Eigen::Index n = axes_[i]->size();
        if (index[i] < 0 || index[i] >= n)
            throw std::out_of_range("Field '" + name() + "': index " +
                                    std::to_string(index[i]) +
                                    " out of range on axis " + std::to_string(i));
        flat = flat * n + index[i];
    }
    return flat;
}

Real Field::at(const std::vector<Eigen::Index>& index) const
{
    return data_[flat_index(index)];
}

Vector Field::lane(std::size_t axis, std::vector<Eigen::Index> index) const
{
    if (axis >= axes_.size())
        throw std::out_of_range("Field '" + name() + "' has no axis " +
                                std::to_string(axis));
    const Eigen::Index n = axes_[axis]->size();
    Vector out(n);
    for (Eigen::Index k = 0; k < n; ++k) {
        index[axis] = k;
        out[k] = data_[flat_index(index)];
    }
    return out;
}

} // namespace ecmsio
