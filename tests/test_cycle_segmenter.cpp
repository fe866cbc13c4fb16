#include <gtest/gtest.h>
#include <ecmsio/CycleSegmenter.hpp>

#include <memory>

using namespace ecmsio;

namespace {

// triangle wave 0 -> 1 -> 0 with a period of 20 samples
Vector triangle(int periods)
{
    const int n = 20 * periods;
    Vector v(n);
    for (int i = 0; i < n; ++i) {
        const int k = i % 20;
        v[i] = (k < 10 ? k : 20 - k) / 10.0;
    }
    return v;
}

Vector time_for(const Vector& v) { return Vector::LinSpaced(v.size(), 0.0, v.size() - 1.0); }

bool non_decreasing(const IntVector& c)
{
    for (Eigen::Index i = 1; i < c.size(); ++i)
        if (c[i] < c[i - 1]) return false;
    return true;
}

} // namespace

TEST(SegmentCycles, CountsAnodicCrossings) {
    const Vector v = triangle(3);
    IntVector c = segment_cycles(time_for(v), v, 0.5, true, 2);

    ASSERT_EQ(c.size(), v.size());
    EXPECT_TRUE(non_decreasing(c));
    EXPECT_EQ(c[0], 0);
    EXPECT_EQ(c[5], 0);
    EXPECT_EQ(c[6], 1);
    EXPECT_EQ(c[25], 1);
    EXPECT_EQ(c[26], 2);
    EXPECT_EQ(c[46], 3);
    EXPECT_EQ(c.maxCoeff(), 3);
}

TEST(SegmentCycles, CathodicUsesTheDownwardSweep) {
    const Vector v = triangle(3);
    IntVector c = segment_cycles(time_for(v), v, 0.5, false, 2);

    EXPECT_TRUE(non_decreasing(c));
    EXPECT_EQ(c[15], 0);
    EXPECT_EQ(c[16], 1);
    EXPECT_EQ(c[36], 2);
    EXPECT_EQ(c[56], 3);
    EXPECT_EQ(c.maxCoeff(), 3);
}

TEST(SegmentCycles, DebounceSuppressesChatter) {
    Vector v(13);
    v << 0.0, 0.6, 0.4, 0.6, 0.4, 0.6, 0.4, 0.0, 0.0, 0.0, 0.6, 0.7, 0.8;
    const Vector t = time_for(v);

    EXPECT_EQ(segment_cycles(t, v, 0.5, true, 0).maxCoeff(), 4);

    IntVector c = segment_cycles(t, v, 0.5, true, 3);
    IntVector expected(13);
    expected << 0, 0, 0, 1, 1, 1, 1, 1, 1, 1, 2, 2, 2;
    EXPECT_EQ(c, expected);
}

TEST(SegmentCycles, NoCrossingNoCycle) {
    Vector v = Vector::Constant(10, 0.2);
    EXPECT_EQ(segment_cycles(time_for(v), v, 0.5, true, 1).maxCoeff(), 0);

    Vector empty(0);
    EXPECT_EQ(segment_cycles(empty, empty, 0.5, true, 5).size(), 0);
}

TEST(SegmentCycles, RejectsBadInput) {
    const Vector v = triangle(1);
    EXPECT_THROW(segment_cycles(Vector::Zero(3), v, 0.5, true, 2), std::invalid_argument);
    EXPECT_THROW(segment_cycles(time_for(v), v, 0.5, true, -1), std::invalid_argument);
}

TEST(ShiftCycleCounter, StartsAtZero) {
    Vector coarse(4);
    coarse << 3, 3, 4, 5;
    Vector shifted = shift_cycle_counter(coarse);
    EXPECT_DOUBLE_EQ(shifted[0], 0.0);
    EXPECT_DOUBLE_EQ(shifted[3], 2.0);
}

TEST(CycleRanges, RowsPerCycle) {
    IntVector c(6);
    c << 0, 0, 1, 1, 1, 2;
    auto r = cycle_ranges(c);
    ASSERT_EQ(r.size(), 3u);
    EXPECT_EQ(r[1], (RowRange{2, 5}));
}

TEST(AddCycleSeries, SegmentsThePotentialAlias) {
    const Vector v = triangle(2);
    auto t = std::make_shared<const TimeSeries>("Potential time [s]", "s", time_for(v), 0.0);
    Measurement m;
    m.series = {t, std::make_shared<const ValueSeries>("Voltage [V]", "V", v, t)};
    m.aliases.add("raw_potential", "Voltage [V]");

    CycleOptions opts;
    opts.start_potential = 0.5;
    opts.debounce_points = 2;
    auto cycle = add_cycle_series(m, opts);

    EXPECT_EQ(cycle->name(), "cycle");
    EXPECT_EQ(cycle->tseries(), t);
    EXPECT_DOUBLE_EQ(cycle->data()[26], 2.0);
    EXPECT_EQ(m.at("cycle"), cycle);
    EXPECT_EQ(m.series.size(), 3u);

    // running it again replaces the series instead of adding another
    add_cycle_series(m, opts);
    EXPECT_EQ(m.series.size(), 3u);
}

TEST(AddCycleSeries, FallsBackToCoarseCounter) {
    auto t = std::make_shared<const TimeSeries>("Potential time [s]", "s",
                                                Vector::LinSpaced(4, 0.0, 3.0), 0.0);
    Vector coarse(4);
    coarse << 2, 2, 3, 3;
    Measurement m;
    m.series = {t, std::make_shared<const ValueSeries>("Cycle [n]", "n", coarse, t)};
    m.aliases.add("cycle_number", "Cycle [n]");

    auto cycle = add_cycle_series(m, CycleOptions{});
    EXPECT_EQ(cycle->unit(), "n");
    EXPECT_DOUBLE_EQ(cycle->data()[0], 0.0);
    EXPECT_DOUBLE_EQ(cycle->data()[3], 1.0);
    EXPECT_EQ(cycle->tseries(), t);
    EXPECT_EQ(m.series.size(), 3u);

    Measurement bare;
    EXPECT_THROW(add_cycle_series(bare, CycleOptions{}), std::out_of_range);
}

TEST(AddCycleSeries, CoarseCounterIgnoresEarlierSegmentation) {
    auto t = std::make_shared<const TimeSeries>("Potential time [s]", "s",
                                                Vector::LinSpaced(8, 0.0, 7.0), 0.0);
    Vector v(8), coarse(8);
    v      << 0, 1, 0, 1, 0, 1, 0, 1;
    coarse << 7, 7, 7, 7, 8, 8, 8, 8;
    Measurement m;
    m.series = {t,
                std::make_shared<const ValueSeries>("Voltage [V]", "V", v, t),
                std::make_shared<const ValueSeries>("Cycle [n]", "n", coarse, t)};
    m.aliases.add("raw_potential", "Voltage [V]");
    m.aliases.add("cycle_number", "Cycle [n]");

    CycleOptions segmented;
    segmented.start_potential = 0.5;
    segmented.debounce_points = 0;
    EXPECT_DOUBLE_EQ(add_cycle_series(m, segmented)->data()[7], 4.0);

    auto cycle = add_cycle_series(m, CycleOptions{});
    Vector expected(8);
    expected << 0, 0, 0, 0, 1, 1, 1, 1;
    EXPECT_TRUE(cycle->data().isApprox(expected));
    EXPECT_EQ(cycle->unit(), "n");
    EXPECT_EQ(m.series.size(), 4u);
}
