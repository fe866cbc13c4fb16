#include <gtest/gtest.h>
#include <ecmsio/JsonUtils.hpp>
#include "test_utils.hpp"

#include <cstdlib>

using namespace ecmsio;
using ecmsio_test::TempDir;
using ecmsio_test::write_file;

TEST(ReaderConfig, Defaults) {
    ReaderConfig cfg = ReaderConfig::from_json(nlohmann::json::object());
    EXPECT_EQ(cfg.format, "auto");
    EXPECT_EQ(cfg.technique, Technique::ECMS);
    EXPECT_FALSE(cfg.segment_cycles);
    EXPECT_FALSE(cfg.cycle.start_potential);
}

TEST(ReaderConfig, FromJson) {
    auto j = nlohmann::json::parse(R"({
        "technique": "EC",
        "name": "CO strip",
        "cycle": { "startPotential": 0.45, "anodic": false, "debouncePoints": 3 }
    })");
    ReaderConfig cfg = ReaderConfig::from_json(j);
    EXPECT_EQ(cfg.technique, Technique::EC);
    EXPECT_EQ(cfg.name, "CO strip");
    EXPECT_TRUE(cfg.segment_cycles);
    ASSERT_TRUE(cfg.cycle.start_potential);
    EXPECT_DOUBLE_EQ(*cfg.cycle.start_potential, 0.45);
    EXPECT_FALSE(cfg.cycle.anodic);
    EXPECT_EQ(cfg.cycle.debounce_points, 3);

    EXPECT_THROW(ReaderConfig::from_json(nlohmann::json{{"technique", "XPS"}}),
                 std::invalid_argument);
}

TEST(JsonUtils, LoadJson) {
    TempDir dir;
    const std::string path = dir.file("reader.json");
    write_file(path, R"({"format": "tsv"})");
    EXPECT_EQ(load_json(path)["format"], "tsv");

    EXPECT_THROW(load_json(dir.file("missing.json")), std::runtime_error);

    write_file(dir.file("broken.json"), "{ nope");
    EXPECT_THROW(load_json(dir.file("broken.json")), std::runtime_error);
}

TEST(JsonUtils, ExpandEnv) {
    setenv("ECMSIO_TEST_RUN", "run7", 1);
    setenv("ECMSIO_TEST_DIR", "/data", 1);
    EXPECT_EQ(expand_env("${ECMSIO_TEST_DIR}/${ECMSIO_TEST_RUN}.tsv"), "/data/run7.tsv");
    EXPECT_EQ(expand_env("no variables"), "no variables");
    EXPECT_EQ(expand_env("$ECMSIO_TEST_RUN"), "$ECMSIO_TEST_RUN");

    unsetenv("ECMSIO_TEST_UNSET");
    EXPECT_THROW(expand_env("${ECMSIO_TEST_UNSET}"), std::runtime_error);
}

TEST(ReaderConfig, StringsExpandFromEnvironment) {
    TempDir dir;
    const std::string path = dir.file("reader.json");
    write_file(path, R"({"name": "${ECMSIO_TEST_RUN}", "technique": "${ECMSIO_TEST_TECH}"})");
    setenv("ECMSIO_TEST_RUN", "run7", 1);
    setenv("ECMSIO_TEST_TECH", "MS", 1);

    ReaderConfig cfg = ReaderConfig::from_json(load_json(path));
    EXPECT_EQ(cfg.name, "run7");
    EXPECT_EQ(cfg.technique, Technique::MS);

    EXPECT_THROW(ReaderConfig::from_json(nlohmann::json{{"name", 3}}), std::runtime_error);
}

TEST(Technique, ParseAndPrint) {
    EXPECT_EQ(parse_technique("EC-MS"), Technique::ECMS);
    EXPECT_EQ(parse_technique("MS"), Technique::MS);
    EXPECT_EQ(to_string(Technique::EC), "EC");
    EXPECT_EQ(to_string(Technique::ECMS), "EC-MS");
    EXPECT_THROW(parse_technique("ec"), std::invalid_argument);
}
