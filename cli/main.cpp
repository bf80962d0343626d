#include "geocluster/csv_io.hpp"
#include "geocluster/engine.hpp"

#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace geocluster;

static void usage(const char* argv0) {
    std::fprintf(stderr,
        "usage: %s <points.csv|-> --max N --home LAT,LON\n"
        "          [--tightness T] [--balance B] [--seed S] [--merge] [--verbose]\n"
        "\n"
        "Input rows: id,latitude,longitude (header optional).\n"
        "Output: cluster_id,id,latitude,longitude on stdout.\n", argv0);
}

static GeoPoint parse_home(const std::string& s) {
    size_t comma = s.find(',');
    if (comma == std::string::npos)
        throw std::invalid_argument("--home expects LAT,LON");
    GeoPoint home;
    home.latitude = std::stod(s.substr(0, comma));
    home.longitude = std::stod(s.substr(comma + 1));
    return home;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 2;
    }

    std::string input = argv[1];
    ClusterConfig cfg;
    GeoPoint home;
    bool have_max = false, have_home = false;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument(arg + " needs a value");
                return argv[++i];
            };
            if (arg == "--max") {
                long v = std::stol(value());
                if (v < 1) throw std::invalid_argument("--max must be >= 1");
                cfg.max_points_per_cluster = static_cast<size_t>(v);
                have_max = true;
            } else if (arg == "--home") {
                home = parse_home(value());
                have_home = true;
            } else if (arg == "--tightness") {
                cfg.tightness = std::stod(value());
            } else if (arg == "--balance") {
                cfg.balance_weight = std::stod(value());
            } else if (arg == "--seed") {
                cfg.seed = static_cast<unsigned>(std::stoul(value()));
            } else if (arg == "--merge") {
                cfg.merge_adjacent = true;
            } else if (arg == "--verbose") {
                cfg.verbose = true;
            } else {
                throw std::invalid_argument("unknown option " + arg);
            }
        }
        if (!have_max || !have_home)
            throw std::invalid_argument("--max and --home are required");

        std::vector<GeoPoint> points;
        if (input == "-") {
            points = read_points_csv(std::cin);
        } else {
            std::ifstream in(input);
            if (!in.is_open())
                throw std::runtime_error("cannot open " + input);
            points = read_points_csv(in);
        }

        GeoClusterer clusterer(cfg);
        auto clusters = clusterer.run(points, home);
        write_clusters_csv(std::cout, clusters);

        const RunStats& st = clusterer.last_run();
        std::fprintf(stderr, "%zu points -> %zu clusters (k0=%zu, %zu iters%s)\n",
                     points.size(), clusters.size(), st.initial_k,
                     st.partition_iterations, st.converged ? "" : ", not converged");
        for (const auto& c : clusters) {
            std::fprintf(stderr, "  #%-3d %4zu points  centroid %.5f,%.5f\n",
                         c.id, c.size(), c.centroid.latitude, c.centroid.longitude);
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        usage(argv[0]);
        return 1;
    }
    return 0;
}
