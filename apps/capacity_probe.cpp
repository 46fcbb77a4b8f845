#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "depotpack/area_kinds.hpp"
#include "depotpack/capacity_probe.hpp"
#include "depotpack/logging.hpp"
#include "utils/cli_parse.hpp"

#if defined(_OPENMP)
#include <omp.h>
#endif

namespace {

int omp_thread_id() {
#if defined(_OPENMP)
    return omp_get_thread_num();
#else
    return 0;
#endif
}

void omp_set_threads(int threads) {
#if defined(_OPENMP)
    if (threads > 0) {
        omp_set_num_threads(threads);
    }
#else
    (void)threads;
#endif
}

struct Args {
    depotpack::Fixed depot_a = 150;
    depotpack::Fixed depot_b = 150;
    std::string vehicle = "sb";
    bool distances = true;
    int threads = 0;
    int limit = depotpack::kDefaultProbeLimit;
    std::vector<std::string> kinds;
    bool log = false;
};

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto need = [&](const char* flag) { return require_arg(i, argc, argv, flag); };

        if (a == "--depot-a") {
            args.depot_a = parse_fixed(need("--depot-a"));
        } else if (a == "--depot-b") {
            args.depot_b = parse_fixed(need("--depot-b"));
        } else if (a == "--vehicle") {
            args.vehicle = need("--vehicle");
        } else if (a == "--no-distances") {
            args.distances = false;
        } else if (a == "--threads") {
            args.threads = parse_int(need("--threads"));
        } else if (a == "--limit") {
            args.limit = parse_int(need("--limit"));
        } else if (a == "--kinds") {
            args.kinds = parse_string_list(need("--kinds"));
        } else if (a == "--log") {
            args.log = true;
        } else if (a == "-h" || a == "--help") {
            std::cout << "Usage: capacity_probe [--depot-a A] [--depot-b B] [--vehicle sb|ab] [--no-distances]\n"
                      << "                      [--threads N] [--limit N] [--kinds L,DSR,DSR_90,DDR] [--log]\n";
            std::exit(0);
        } else {
            throw std::runtime_error("unknown arg: " + a);
        }
    }
    if (args.threads < 0) {
        throw std::runtime_error("--threads must be >= 0");
    }
    return args;
}

void print_optional(std::ostream& out, const std::optional<int>& v) {
    if (v) {
        out << *v;
    } else {
        out << "null";
    }
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        const depotpack::VehicleParameters params = depotpack::vehicle_parameters(args.vehicle);

        std::vector<depotpack::AreaKind> kinds;
        if (args.kinds.empty()) {
            kinds.assign(depotpack::kAllAreaKinds.begin(), depotpack::kAllAreaKinds.end());
        } else {
            for (const auto& k : args.kinds) {
                kinds.push_back(depotpack::parse_area_kind(k));
            }
        }

        depotpack::PlotSpec plot;
        plot.a = args.depot_a;
        plot.b = args.depot_b;
        plot.with_distances = args.distances;
        plot.clearance = depotpack::edge_clearance(params);

        omp_set_threads(args.threads);

        const int n = static_cast<int>(kinds.size());
        std::vector<depotpack::AreaKindProbe> results(kinds.size());
        std::vector<std::string> errors(kinds.size());

        // One independent bin per kind; nothing is shared between tasks.
#pragma omp parallel for schedule(dynamic)
        for (int k = 0; k < n; ++k) {
            const depotpack::AreaKind kind = kinds[static_cast<size_t>(k)];
            if (args.log) {
                depotpack::log_line("capacity_probe", "thread " + std::to_string(omp_thread_id()) + " probing " +
                                                          depotpack::area_kind_name(kind));
            }
            try {
                results[static_cast<size_t>(k)] = depotpack::probe_area_kind(kind, params, plot, args.limit);
            } catch (const std::exception& e) {
                errors[static_cast<size_t>(k)] = e.what();
            }
            if (args.log) {
                const auto& r = results[static_cast<size_t>(k)];
                depotpack::log_line("capacity_probe",
                                    std::string(depotpack::area_kind_name(kind)) + " done: capacity_max=" +
                                        (r.capacity_max ? std::to_string(*r.capacity_max) : std::string("none")));
            }
        }

        for (size_t k = 0; k < kinds.size(); ++k) {
            if (!errors[k].empty()) {
                throw std::runtime_error(std::string(depotpack::area_kind_name(kinds[k])) + ": " + errors[k]);
            }
        }

        std::cout << std::setprecision(17);
        std::cout << "{\n";
        std::cout << "  \"depot\": {\"a\": " << plot.a << ", \"b\": " << plot.b << "},\n";
        std::cout << "  \"vehicle\": \"" << args.vehicle << "\",\n";
        std::cout << "  \"with_distances\": " << (plot.with_distances ? "true" : "false") << ",\n";
        std::cout << "  \"kinds\": [\n";
        for (size_t k = 0; k < results.size(); ++k) {
            const auto& r = results[k];
            std::cout << "    {\"type\": \"" << depotpack::area_kind_name(r.kind) << "\", \"capacity_min\": "
                      << r.capacity_min << ", \"capacity_max\": ";
            print_optional(std::cout, r.capacity_max);
            std::cout << ", \"count_max_with_capacity_max\": ";
            print_optional(std::cout, r.count_max_with_capacity_max);
            std::cout << ", \"count_max_with_capacity_min\": ";
            print_optional(std::cout, r.count_max_with_capacity_min);
            std::cout << ", \"util_rate_capacity_max\": " << r.util_rate_capacity_max
                      << ", \"util_rate_capacity_min\": " << r.util_rate_capacity_min << "}";
            if (k + 1 != results.size()) {
                std::cout << ",";
            }
            std::cout << "\n";
        }
        std::cout << "  ]\n";
        std::cout << "}\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
