#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "depotpack/area_kinds.hpp"
#include "depotpack/bin.hpp"
#include "depotpack/bin_with_distances.hpp"
#include "depotpack/capacity_probe.hpp"
#include "depotpack/layout_csv.hpp"
#include "depotpack/logging.hpp"
#include "depotpack/packing_stats.hpp"
#include "depotpack/render.hpp"
#include "utils/cli_parse.hpp"

namespace {

struct Args {
    std::string layout;
    depotpack::Fixed depot_a = 150;
    depotpack::Fixed depot_b = 150;
    std::string vehicle = "sb";
    bool distances = true;
    bool edge_a_set = false;
    bool edge_b_set = false;
    depotpack::Fixed edge_a;
    depotpack::Fixed edge_b;
    std::string svg;
    std::string svg_steps;
    std::string lang = "en";
    double scale = 4.0;
    std::string placements;
    bool draw_availables = false;
    bool log = false;
};

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto need = [&](const char* flag) { return require_arg(i, argc, argv, flag); };

        if (a == "--layout") {
            args.layout = need("--layout");
        } else if (a == "--depot-a") {
            args.depot_a = parse_fixed(need("--depot-a"));
        } else if (a == "--depot-b") {
            args.depot_b = parse_fixed(need("--depot-b"));
        } else if (a == "--vehicle") {
            args.vehicle = need("--vehicle");
        } else if (a == "--no-distances") {
            args.distances = false;
        } else if (a == "--edge-a") {
            args.edge_a = parse_fixed(need("--edge-a"));
            args.edge_a_set = true;
        } else if (a == "--edge-b") {
            args.edge_b = parse_fixed(need("--edge-b"));
            args.edge_b_set = true;
        } else if (a == "--svg") {
            args.svg = need("--svg");
        } else if (a == "--svg-steps") {
            args.svg_steps = need("--svg-steps");
        } else if (a == "--scale") {
            args.scale = parse_double(need("--scale"));
        } else if (a == "--lang") {
            args.lang = need("--lang");
        } else if (a == "--placements") {
            args.placements = need("--placements");
        } else if (a == "--availables") {
            args.draw_availables = true;
        } else if (a == "--log") {
            args.log = true;
        } else if (a == "-h" || a == "--help") {
            std::cout << "Usage: pack_layout --layout FILE [--depot-a A] [--depot-b B] [--vehicle sb|ab]\n"
                      << "                   [--no-distances] [--edge-a E] [--edge-b E] [--svg FILE]\n"
                      << "                   [--svg-steps PREFIX] [--availables] [--lang en|de]\n"
                      << "                   [--scale PX_PER_M] [--placements FILE] [--log]\n";
            std::exit(0);
        } else {
            throw std::runtime_error("unknown arg: " + a);
        }
    }
    if (args.layout.empty()) {
        throw std::runtime_error("--layout is required");
    }
    return args;
}

void write_svg_file(const std::string& path,
                    const std::vector<depotpack::DrawRect>& rects,
                    const depotpack::Bin& bin,
                    const depotpack::RenderOptions& opt,
                    const std::string& title) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("cannot open " + path);
    }
    depotpack::write_svg(out, rects, bin.a(), bin.b(), opt, title);
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        const depotpack::VehicleParameters params = depotpack::vehicle_parameters(args.vehicle);

        depotpack::PlotSpec plot;
        plot.a = args.depot_a;
        plot.b = args.depot_b;
        plot.with_distances = args.distances;
        plot.clearance = depotpack::edge_clearance(params);
        if (args.edge_a_set) {
            plot.clearance.left = args.edge_a;
            plot.clearance.right = args.edge_a;
        }
        if (args.edge_b_set) {
            plot.clearance.bottom = args.edge_b;
            plot.clearance.top = args.edge_b;
        }

        std::unique_ptr<depotpack::Bin> bin = depotpack::make_bin(plot, !args.svg_steps.empty());
        {
            std::ifstream in(args.layout);
            if (!in) {
                throw std::runtime_error("cannot open " + args.layout);
            }
            depotpack::load_layout(in, *bin, params);
        }
        if (args.log) {
            depotpack::log_line("pack_layout", "packing " + std::to_string(bin->items().size()) + " area(s) into " +
                                                   plot.a.to_string() + " x " + plot.b.to_string());
        }

        bin->pack();
        const depotpack::PackingReport report = depotpack::packing_report(*bin);
        if (args.log) {
            depotpack::log_line("pack_layout", std::string("feasible=") + (report.feasible.value_or(false) ? "1" : "0") +
                                                   " packed=" + std::to_string(report.packed_count) +
                                                   " count_inner=" + std::to_string(report.count_inner));
        }

        depotpack::RenderOptions ropt;
        ropt.draw_distances = args.distances;
        ropt.draw_availables = args.draw_availables;
        ropt.language = depotpack::parse_language(args.lang);
        ropt.scale = args.scale;

        if (!args.svg.empty()) {
            write_svg_file(args.svg, depotpack::drawable_rectangles(*bin, ropt), *bin, ropt, {});
        }
        if (!args.svg_steps.empty()) {
            for (size_t s = 0; s < bin->history().size(); ++s) {
                const std::string path = args.svg_steps + "_" + std::to_string(s) + ".svg";
                const std::string title = depotpack::translate("Step", ropt.language) + " " + std::to_string(s);
                write_svg_file(path, depotpack::drawable_step(*bin, s, ropt), *bin, ropt, title);
            }
        }
        if (!args.placements.empty()) {
            std::ofstream out(args.placements);
            if (!out) {
                throw std::runtime_error("cannot open " + args.placements);
            }
            depotpack::write_placements_csv(out, *bin);
        }

        depotpack::write_report_json(std::cout, report);
        std::cout << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
