#include "ecmsio/TmpDirReader.hpp"
#include "ecmsio/Errors.hpp"
#include "ecmsio/Timestamp.hpp"
#include "ecmsio/TsvFormat.hpp"
#include "ecmsio/TsvReader.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace ecmsio {

namespace {

const std::regex kChannelRe(R"(\.([^\.]+)\.data)");
const std::regex kMassRe(R"(M[0-9]+)");

double leading_timestamp(const std::string& name, const std::string& path)
{
    if (name.size() < kNameTimestampLength)
        throw FormatError("Name is too short to start with a timestamp", name, path);
    return parse_name_timestamp(name.substr(0, kNameTimestampLength), path);
}

} // unnamed namespace

std::vector<SeriesPtr> series_from_tmp_file(const std::string& path)
{
    const std::string file_name = fs::path(path).filename().string();

    std::smatch m;
    if (!std::regex_search(file_name, m, kChannelRe)) {
        std::cerr << "Could not find a column name in '" << path
                  << "', skipping it\n";
        return {};
    }
    const double tstamp = leading_timestamp(file_name, path);

    std::string v_name = m[1].str();
    std::string unit;
    std::smatch mass;
    if (std::regex_search(v_name, mass, kMassRe)) {
        v_name = mass.str();
        unit   = "A";
    }
    const std::string t_name = v_name + "-x";

    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("Cannot open '" + path + "'");
    std::string header;
    std::getline(in, header);                 // column names, unused
    const Matrix data = read_table(in, 2, path);

    auto tseries = std::make_shared<const TimeSeries>(t_name, "s", Vector(data.col(0)), tstamp);
    auto vseries = std::make_shared<const ValueSeries>(v_name, unit, Vector(data.col(1)), tseries);
    return {tseries, vseries};
}

Measurement read_tmp_dir(const std::string& tmp_dir)
{
    const fs::path dir(tmp_dir);
    if (!fs::is_directory(dir))
        throw std::runtime_error("Not a directory: '" + tmp_dir + "'");

    // normalise "a/b/tmp/" so that parent_path() is the run directory
    const fs::path clean = dir.has_filename() ? dir : dir.parent_path();
    const std::string run_name = clean.parent_path().filename().string();

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir))
        if (entry.is_regular_file()) files.push_back(entry.path());
    std::sort(files.begin(), files.end());

    Measurement m;
    m.name      = run_name;
    m.technique = Technique::ECMS;
    m.tstamp    = leading_timestamp(run_name, tmp_dir);
    for (const auto& f : files) {
        auto part = series_from_tmp_file(f.string());
        m.series.insert(m.series.end(), part.begin(), part.end());
    }

    AliasTableBuilder aliases;
    aliases.add_defaults(default_aliases(m.technique));
    m.aliases = aliases.build();
    return m;
}

} // namespace ecmsio
