#include <gtest/gtest.h>
#include <ecmsio/Errors.hpp>
#include <ecmsio/MeasurementLoaders.hpp>
#include <ecmsio/Timestamp.hpp>
#include <ecmsio/TmpDirReader.hpp>
#include "test_utils.hpp"

using namespace ecmsio;
using ecmsio_test::TempDir;
using ecmsio_test::write_file;

namespace {

// <tmp>/2021-03-15 18_50_10 CO strip/tmp/...
std::string make_tmp_dir(const TempDir& dir)
{
    const auto tmp = dir.path() / "2021-03-15 18_50_10 CO strip" / "tmp";
    write_file(tmp / "2021-03-15 18_50_12 run.M44-CO2.data",
               "time\tvalue\n0.0\t1e-10\n1.0\t2e-10\n2.0\t3e-10\n");
    write_file(tmp / "2021-03-15 18_50_11 run.Voltage.data",
               "time\tvalue\n0.5\t0.1\n1.5\t0.2\n");
    write_file(tmp / "notes.txt", "not a channel\n");
    return tmp.string();
}

} // namespace

TEST(TmpDirReader, StitchesChannelFiles) {
    TempDir dir;
    Measurement m = read_tmp_dir(make_tmp_dir(dir));

    EXPECT_EQ(m.name, "2021-03-15 18_50_10 CO strip");
    EXPECT_EQ(m.series_names(),
              (std::vector<std::string>{"Voltage-x", "Voltage", "M44-x", "M44"}));
    EXPECT_DOUBLE_EQ(m.tstamp, parse_name_timestamp("2021-03-15 18_50_10"));

    auto m44 = m.value_series("M44");
    EXPECT_EQ(m44->unit(), "A");
    EXPECT_EQ(m44->size(), 3);
    EXPECT_EQ(m44->tseries()->name(), "M44-x");
    EXPECT_DOUBLE_EQ(m44->tseries()->tstamp() - m.tstamp, 2.0);

    auto volt = m.value_series("Voltage");
    EXPECT_EQ(volt->unit(), "");
    EXPECT_EQ(volt->tseries()->unit(), "s");
}

TEST(TmpDirReader, DefaultAliasesApply) {
    TempDir dir;
    Measurement m = read_tmp_dir(make_tmp_dir(dir));
    EXPECT_TRUE(m.aliases.contains("raw_potential"));
    EXPECT_EQ(m.find("raw_potential"), nullptr);
}

TEST(TmpDirReader, SingleFile) {
    TempDir dir;
    const auto file = dir.path() / "2021-03-15 18_50_12 run.M2-H2.data";
    write_file(file, "t\tv\n0\t1\n1\t2\n");
    auto series = series_from_tmp_file(file.string());
    ASSERT_EQ(series.size(), 2u);
    EXPECT_EQ(series[0]->name(), "M2-x");
    EXPECT_EQ(series[1]->name(), "M2");

    EXPECT_TRUE(series_from_tmp_file((dir.path() / "readme").string()).empty());
}

TEST(TmpDirReader, AutoFormatPicksDirectories) {
    TempDir dir;
    EXPECT_EQ(load_measurement(make_tmp_dir(dir)).series.size(), 4u);
}

TEST(TmpDirReader, Failures) {
    TempDir dir;
    EXPECT_THROW(read_tmp_dir(dir.file("missing")), std::runtime_error);

    const auto tmp = dir.path() / "no timestamp here" / "tmp";
    write_file(tmp / "2021-03-15 18_50_12 run.M2.data", "t\tv\n0\t1\n");
    EXPECT_THROW(read_tmp_dir(tmp.string()), FormatError);
}
