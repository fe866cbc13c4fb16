#include "ecmsio/CycleSegmenter.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace ecmsio {

namespace {

enum class Side { Behind, Ahead };

/* first index >= from where the (direction-normalised) potential is on
 * `side` of the threshold; n if there is none */
Eigen::Index find_side(const Vector& v, double threshold, Side side,
                       Eigen::Index from)
{
    const Eigen::Index n = v.size();
    for (Eigen::Index i = from; i < n; ++i) {
        if (side == Side::Behind ? v[i] < threshold : v[i] > threshold)
            return i;
    }
    return n;
}

} // unnamed namespace

IntVector segment_cycles(const Vector& time,
                         const Vector& potential,
                         double        start_potential,
                         bool          anodic,
                         int           debounce_points)
{
    if (time.size() != potential.size())
        throw std::invalid_argument("segment_cycles: time has " +
                                    std::to_string(time.size()) +
                                    " points, potential " +
                                    std::to_string(potential.size()));
    if (debounce_points < 0)
        throw std::invalid_argument("segment_cycles: negative debounce");

    // cathodic scans become anodic ones by negating signal and threshold
    const Vector v         = anodic ? potential : Vector(-potential);
    const double threshold = anodic ? start_potential : -start_potential;

    const Eigen::Index N = v.size();
    std::vector<Eigen::Index> starts;        // first sample of cycle 1, 2, ...
    Eigen::Index n = 0;

    while (n < N) {
        n = find_side(v, threshold, Side::Behind, n);
        if (n >= N) break;
        n += debounce_points;

        n = find_side(v, threshold, Side::Ahead, n);
        if (n >= N) break;
        starts.push_back(n);
        n += debounce_points;
    }

    IntVector cycle = IntVector::Zero(N);
    for (std::size_t c = 0; c < starts.size(); ++c) {
        const Eigen::Index end = c + 1 < starts.size() ? starts[c + 1] : N;
        cycle.segment(starts[c], end - starts[c]).setConstant(static_cast<int>(c + 1));
    }
    return cycle;
}

Vector shift_cycle_counter(const Vector& coarse)
{
    double lowest = std::numeric_limits<double>::infinity();
    for (Eigen::Index i = 0; i < coarse.size(); ++i)
        if (!std::isnan(coarse[i])) lowest = std::min(lowest, coarse[i]);
    if (!std::isfinite(lowest)) return coarse;
    return (coarse.array() - lowest).matrix();
}

ValueSeriesPtr add_cycle_series(Measurement& m, const CycleOptions& opts)
{
    ValueSeriesPtr cycle;
    if (!opts.start_potential) {
        const ValueSeriesPtr coarse = m.value_series("cycle_number");
        cycle = std::make_shared<const ValueSeries>(
            "cycle", coarse->unit(), shift_cycle_counter(coarse->data()),
            coarse->tseries());
    } else {
        const ValueSeriesPtr v = m.value_series("raw_potential");
        const IntVector idx = segment_cycles(v->t(), v->data(),
                                             *opts.start_potential,
                                             opts.anodic, opts.debounce_points);
        cycle = std::make_shared<const ValueSeries>(
            "cycle", "", idx.cast<double>(), v->tseries());
    }
    m.replace_series("cycle", cycle);
    return cycle;
}

std::vector<RowRange> cycle_ranges(const IntVector& cycle)
{
    std::vector<std::int64_t> keys(cycle.data(), cycle.data() + cycle.size());
    return split_runs(keys);
}

} // namespace ecmsio
