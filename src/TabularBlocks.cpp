#include "ecmsio/TabularBlocks.hpp"
#include "ecmsio/Errors.hpp"
#include <cmath>
#include <sstream>

namespace ecmsio {

constexpr std::int64_t kTechniqueSlots = 1000;
constexpr double       kMaxExperiment  = 1e12;

std::vector<BlockRange> split_blocks(const std::vector<std::string>& series_headers)
{
    std::vector<BlockRange> blocks;
    for (std::size_t i = 0; i < series_headers.size(); ++i) {
        if (series_headers[i].empty()) continue;
        if (!blocks.empty()) blocks.back().end = i;
        blocks.push_back({series_headers[i], i, series_headers.size()});
    }
    return blocks;
}

static std::string fmt_id(double v)
{
    std::ostringstream s; s << v;
    return s.str();
}

std::int64_t composite_run_key(double experiment, double technique,
                               const std::string& path)
{
    if (!std::isfinite(experiment) || !std::isfinite(technique) ||
        experiment != std::floor(experiment) || technique != std::floor(technique))
        throw AmbiguousIdentifierError(
            "Run identifiers must be integers",
            fmt_id(experiment) + "/" + fmt_id(technique), path);

    if (experiment < 0 || experiment > kMaxExperiment ||
        technique < 0 || technique >= kTechniqueSlots)
        throw AmbiguousIdentifierError(
            "Run identifier pair does not fit experiment*1000+technique",
            fmt_id(experiment) + "/" + fmt_id(technique), path);

    return static_cast<std::int64_t>(experiment) * kTechniqueSlots +
           static_cast<std::int64_t>(technique);
}

std::vector<RowRange> split_runs(const std::vector<std::int64_t>& keys)
{
    std::vector<RowRange> runs;
    std::size_t begin = 0;
    for (std::size_t i = 1; i <= keys.size(); ++i) {
        if (i == keys.size() || keys[i] != keys[begin]) {
            runs.push_back({begin, i});
            begin = i;
        }
    }
    return runs;
}

} // namespace ecmsio
