#include "ecmsio/JsonUtils.hpp"
#include "ecmsio/CycleSegmenter.hpp"
#include "ecmsio/MeasurementLoaders.hpp"
#include "ecmsio/SpectrumReader.hpp"
#include <cxxopts.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;
using namespace ecmsio;

static void write_output(const nlohmann::json& j, const std::string& out_path)
{
    if (out_path.empty()) {
        std::cout << j.dump(2) << '\n';
        return;
    }
    std::ofstream out(out_path);
    if (!out.is_open()) throw std::runtime_error("Cannot write '" + out_path + "'");
    out << j.dump(2) << '\n';
    std::cout << "Wrote summary to: " << out_path << '\n';
}

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    // stdout carries the JSON unless it goes to a file
    std::ostream* progress = &std::cerr;
    try {
        cxxopts::Options opts("ecmsio", "Read EC-MS measurement files into time series");
        opts.add_options()
            ("file", "Measurement file or tmp directory", cxxopts::value<std::string>())
            ("format", "tsv, tmp, spectrum or auto", cxxopts::value<std::string>())
            ("technique", "EC, MS or EC-MS", cxxopts::value<std::string>())
            ("config", "Reader configuration JSON", cxxopts::value<std::string>())
            ("output", "Write the JSON summary here instead of stdout", cxxopts::value<std::string>())
            ("start-potential", "Potential [V] at which cycles begin", cxxopts::value<double>())
            ("cathodic", "Count cycles on the cathodic sweep")
            ("debounce", "Points to skip after each threshold crossing", cxxopts::value<int>())
            ("cycles", "Add a cycle series (coarse counter if no start potential)")
            ("h,help", "Show help");
        opts.parse_positional({"file"});

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("file")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        // Configuration: file first, command line on top
        ReaderConfig cfg;
        if (cli.count("config")) {
            cfg = ReaderConfig::from_json(load_json(cli["config"].as<std::string>()));
        }
        if (cli.count("format"))    cfg.format    = cli["format"].as<std::string>();
        if (cli.count("technique")) cfg.technique = parse_technique(cli["technique"].as<std::string>());
        if (cli.count("start-potential")) {
            cfg.segment_cycles = true;
            cfg.cycle.start_potential = cli["start-potential"].as<double>();
        }
        if (cli.count("cathodic")) cfg.cycle.anodic = false;
        if (cli.count("debounce")) cfg.cycle.debounce_points = cli["debounce"].as<int>();
        if (cli.count("cycles"))   cfg.segment_cycles = true;

        const std::string path = cli["file"].as<std::string>();
        const std::string out_path =
            cli.count("output") ? cli["output"].as<std::string>() : std::string();
        if (!out_path.empty()) progress = &std::cout;

        if (cfg.format == "spectrum") {
            Spectrum spec = read_ms_spectrum(path);
            *progress << "Loaded: " << fs::path(path).filename()
                      << " (" << spec.x().size() << " points)\n";
            write_output(to_json(spec), out_path);
        } else {
            Measurement m = load_measurement(path, cfg.format, cfg.technique);
            if (!cfg.name.empty()) m.name = cfg.name;
            *progress << "Loaded: " << fs::path(path).filename()
                      << " (" << m.series.size() << " series, "
                      << m.time_series().size() << " time axes)\n";

            if (cfg.segment_cycles) {
                auto cycle = add_cycle_series(m, cfg.cycle);
                const int n_cycles = cycle->size() > 0
                    ? static_cast<int>(cycle->data().maxCoeff()) + 1 : 0;
                *progress << "Cycles: " << n_cycles << '\n';
            }
            write_output(to_json(m), out_path);
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    *progress << "Took: " << duration << " ms\n";

    return 0;
}
