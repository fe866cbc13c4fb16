#pragma once
#include "Measurement.hpp"
#include "TabularBlocks.hpp"
#include "Types.hpp"

#include <optional>
#include <vector>

namespace ecmsio {

struct CycleOptions
{
    std::optional<double> start_potential;     // nullopt: reuse the logged "cycle_number"
    bool                  anodic          = true;
    int                   debounce_points = 5;
};

/*
 * Cycle index of every sample of a potential sweep.
 *
 * A new cycle starts where the potential passes start_potential in the
 * scan direction (upwards if anodic, downwards otherwise), after having
 * been behind it.  After each transition the next debounce_points
 * samples are not searched, which keeps noise around the threshold
 * from counting extra cycles.  Single pass; the result starts at 0 and
 * never decreases.
 */
IntVector segment_cycles(const Vector& time,
                         const Vector& potential,
                         double        start_potential,
                         bool          anodic,
                         int           debounce_points);

// coarse counter shifted to start at 0 (NaN stays NaN)
Vector shift_cycle_counter(const Vector& coarse);

// builds the "cycle" series on `m` (see CycleOptions) and returns it
ValueSeriesPtr add_cycle_series(Measurement& m, const CycleOptions& opts);

// rows of each cycle value, in order of appearance
std::vector<RowRange> cycle_ranges(const IntVector& cycle);

} // namespace ecmsio
