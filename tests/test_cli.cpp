#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "test_utils.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

using ecmsio_test::TempDir;
using ecmsio_test::full_tsv;
using ecmsio_test::write_file;

namespace {

std::string slurp(const std::string& path)
{
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

int run_cli(const std::string& args, const std::string& out, const std::string& err)
{
    const std::string cmd = std::string("\"") + ECMSIO_CLI_PATH + "\" " + args +
                            " > \"" + out + "\" 2> \"" + err + "\"";
    return std::system(cmd.c_str());
}

} // namespace

TEST(Cli, JsonOnStdoutProgressOnStderr) {
    TempDir dir;
    const std::string tsv = dir.file("cli_run.tsv");
    write_file(tsv, full_tsv());

    ASSERT_EQ(run_cli("\"" + tsv + "\"", dir.file("out.txt"), dir.file("err.txt")), 0);

    const auto j = nlohmann::json::parse(slurp(dir.file("out.txt")));
    EXPECT_EQ(j["name"], "cli_run");
    EXPECT_EQ(j["series"].size(), 20u);

    const std::string err = slurp(dir.file("err.txt"));
    EXPECT_NE(err.find("Loaded:"), std::string::npos);
    EXPECT_NE(err.find("Took:"), std::string::npos);
}

TEST(Cli, ProgressOnStdoutWhenWritingAFile) {
    TempDir dir;
    const std::string tsv = dir.file("cli_run.tsv");
    write_file(tsv, full_tsv());
    const std::string json_path = dir.file("summary.json");

    ASSERT_EQ(run_cli("--output \"" + json_path + "\" \"" + tsv + "\"",
                      dir.file("out.txt"), dir.file("err.txt")), 0);

    const std::string out = slurp(dir.file("out.txt"));
    EXPECT_NE(out.find("Loaded:"), std::string::npos);
    EXPECT_NE(out.find("Took:"), std::string::npos);
    EXPECT_EQ(slurp(dir.file("err.txt")), "");
    EXPECT_EQ(nlohmann::json::parse(slurp(json_path))["name"], "cli_run");
}

TEST(Cli, ErrorsGoToStderr) {
    TempDir dir;
    EXPECT_NE(run_cli("\"" + dir.file("missing.tsv") + "\"",
                      dir.file("out.txt"), dir.file("err.txt")), 0);
    EXPECT_NE(slurp(dir.file("err.txt")).find("Error:"), std::string::npos);
}
