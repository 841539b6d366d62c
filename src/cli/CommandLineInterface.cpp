/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace hydromesh {

CommandLineInterface::CommandLineInterface()
    : logger_("CLI") {
}

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("hydromesh",
        "Build river-aware triangulated surface meshes of hydrologic units\n");

    help_shown_ = false;

    parser.begin_section("INPUT OPTIONS");
    parser.add_option("config", "c", "Load options from a JSON job file (command line wins)");
    parser.add_option("hucs", "", "OGR vector dataset with HUC polygons");
    parser.add_option("huc", "", "Hydrologic unit code to mesh, e.g. 060102020103");
    parser.add_option("level", "", "HUC level of the sub-basins (default: level of --huc)");
    parser.add_option("shapes", "", "OGR polygon dataset meshed instead of HUCs");
    parser.add_option("shape-index", "", "Mesh only the shape at this position in --shapes");
    parser.add_option("reaches", "", "OGR line dataset with river reaches");
    parser.add_option("dem", "", "GDAL raster used to elevate the mesh");
    parser.add_option("crs", "", "Working coordinate system (default: EPSG:5070)");

    parser.begin_section("CLEANING OPTIONS");
    parser.add_option("simplify", "", "Simplify tolerance in CRS units (default: 10)");
    parser.add_option("prune-reach-size", "", "Drop river networks with fewer reaches (default: 0)");
    parser.add_flag("cut-intersections", "", "Insert river/boundary crossings as mesh vertices");

    parser.begin_section("MESHING OPTIONS");
    parser.add_option("refine-max-area", "", "Refine triangles larger than this area");
    parser.add_option("refine-distance", "", "near_d,near_a,far_d,far_a river-distance area ceiling");
    parser.add_option("refine-max-edge-length", "", "Refine triangles with a longer edge");
    parser.add_option("refine-min-angle", "", "Minimum triangle angle in degrees");
    parser.add_flag("enforce-delaunay", "", "Make the constrained triangulation conforming Delaunay");
    parser.add_flag("diagnostics", "", "Log per-triangle refinement statistics");
    parser.add_option("interpolation", "", "DEM sampling: nearest or bilinear (default: bilinear)");

    parser.begin_section("OUTPUT OPTIONS");
    parser.add_option("output", "o", "Mesh triangles as an OGR vector file (driver from extension)");
    parser.add_option("color-raster", "", "GeoTIFF of HUC indices painted over the basin");
    parser.add_option("pixel-size", "", "Pixel size of --color-raster in CRS units");
    parser.add_option("log-level", "", "Verbosity 1-6 or facility list, e.g. 4,Triangulator=6");
    parser.add_option("log-file", "", "Log to specified file (append if exists)");
    parser.add_flag("dry-run", "", "Parse arguments and validate without processing");

    parser.add_example("--hucs wbd.gpkg --huc 06010202 --level 12 --reaches nhd.gpkg \\\n"
                       "        --refine-distance 100,1000,500,10000 --output mesh.gpkg");
    parser.add_example("--config job.json --dem dem.tif");

    if (!parser.parse(argc, argv)) {
        help_shown_ = parser.help_requested();
        return false;
    }

    // Job file first so the command line wins
    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            logger_.error("Failed to load job file: " + config_file.value());
            return false;
        }
        config_.config_file = config_file.value();
    }

    return parse_all_options(parser);
}

bool CommandLineInterface::parse_number(const SimpleCommandLineParser& parser, const std::string& name,
                                        std::optional<double>& target) {
    if (!parser.get(name)) {
        return true;
    }
    auto value = parser.get_as<double>(name);
    if (!value) {
        logger_.error("Option --" + name + " expects a number, got '" + parser.get(name).value() + "'");
        return false;
    }
    target = value;
    return true;
}

std::optional<std::array<double, 4>> CommandLineInterface::parse_refine_distance(const std::string& text) {
    std::array<double, 4> values{};
    std::istringstream iss(text);
    std::string token;
    size_t count = 0;
    while (std::getline(iss, token, ',')) {
        if (count == 4) {
            return std::nullopt;
        }
        try {
            size_t used = 0;
            values[count] = std::stod(token, &used);
            if (token.find_first_not_of(" \t", used) != std::string::npos) {
                return std::nullopt;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
        ++count;
    }
    if (count != 4) {
        return std::nullopt;
    }
    return values;
}

bool CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    if (auto v = parser.get("hucs")) config_.hucs_path = *v;
    if (auto v = parser.get("huc")) config_.huc = *v;
    if (parser.get("level")) {
        auto level = parser.get_as<int>("level");
        if (!level) {
            logger_.error("Option --level expects an integer");
            return false;
        }
        config_.level = level;
    }
    if (auto v = parser.get("shapes")) config_.shapes_path = *v;
    if (parser.get("shape-index")) {
        auto index = parser.get_as<size_t>("shape-index");
        if (!index) {
            logger_.error("Option --shape-index expects a non-negative integer");
            return false;
        }
        config_.shape_index = index;
    }
    if (auto v = parser.get("reaches")) config_.reaches_path = *v;
    if (auto v = parser.get("dem")) config_.dem_path = *v;
    if (auto v = parser.get("crs")) config_.crs = *v;

    auto& cleaner = config_.options.cleaner;
    auto& triangulation = config_.options.triangulation;

    std::optional<double> simplify;
    if (!parse_number(parser, "simplify", simplify)) return false;
    if (simplify) cleaner.simplify = *simplify;

    if (parser.get("prune-reach-size")) {
        auto prune = parser.get_as<size_t>("prune-reach-size");
        if (!prune) {
            logger_.error("Option --prune-reach-size expects a non-negative integer");
            return false;
        }
        cleaner.prune_reach_size = *prune;
    }
    if (parser.get_flag("cut-intersections")) cleaner.cut_intersections = true;

    if (!parse_number(parser, "refine-max-area", triangulation.refine_max_area)) return false;
    if (!parse_number(parser, "refine-max-edge-length", triangulation.refine_max_edge_length)) return false;
    if (!parse_number(parser, "refine-min-angle", triangulation.refine_min_angle)) return false;
    if (auto v = parser.get("refine-distance")) {
        auto distance = parse_refine_distance(*v);
        if (!distance) {
            logger_.error("Option --refine-distance expects four comma-separated numbers, got '" + *v + "'");
            return false;
        }
        triangulation.refine_distance = distance;
    }
    if (parser.get_flag("enforce-delaunay")) triangulation.enforce_delaunay = true;
    if (parser.get_flag("diagnostics")) triangulation.diagnostics = true;

    if (auto v = parser.get("interpolation")) {
        try {
            config_.interpolation = parse_interpolation(*v);
        } catch (const RasterError& e) {
            logger_.error(e.what());
            return false;
        }
    }

    if (auto v = parser.get("output")) config_.output = *v;
    if (auto v = parser.get("color-raster")) config_.color_raster = *v;
    if (!parse_number(parser, "pixel-size", config_.options.pixel_size)) return false;
    if (auto v = parser.get("log-level")) config_.workflow.log_config = *v;
    if (auto v = parser.get("log-file")) config_.workflow.log_file = *v;
    if (parser.get_flag("dry-run")) config_.dry_run = true;

    return true;
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            logger_.error("Could not open job file: " + filename);
            return false;
        }

        json config;
        file >> config;

        // Helper lambda for optional numeric values
        auto read_number = [&config](const std::string& key, std::optional<double>& target) {
            if (config.contains(key) && !config[key].is_null()) {
                target = config[key].get<double>();
            }
        };

        if (config.contains("hucs")) config_.hucs_path = config["hucs"].get<std::string>();
        if (config.contains("huc")) config_.huc = config["huc"].get<std::string>();
        if (config.contains("level")) config_.level = config["level"].get<int>();
        if (config.contains("shapes")) config_.shapes_path = config["shapes"].get<std::string>();
        if (config.contains("shape_index")) config_.shape_index = config["shape_index"].get<size_t>();
        if (config.contains("reaches")) config_.reaches_path = config["reaches"].get<std::string>();
        if (config.contains("dem")) config_.dem_path = config["dem"].get<std::string>();
        if (config.contains("crs")) config_.crs = config["crs"].get<std::string>();

        auto& cleaner = config_.options.cleaner;
        if (config.contains("simplify")) cleaner.simplify = config["simplify"].get<double>();
        if (config.contains("prune_reach_size"))
            cleaner.prune_reach_size = config["prune_reach_size"].get<size_t>();
        if (config.contains("cut_intersections"))
            cleaner.cut_intersections = config["cut_intersections"].get<bool>();

        auto& triangulation = config_.options.triangulation;
        read_number("refine_max_area", triangulation.refine_max_area);
        read_number("refine_max_edge_length", triangulation.refine_max_edge_length);
        read_number("refine_min_angle", triangulation.refine_min_angle);
        if (config.contains("refine_distance") && !config["refine_distance"].is_null()) {
            const auto& values = config["refine_distance"];
            if (!values.is_array() || values.size() != 4) {
                logger_.error("refine_distance must be an array of four numbers");
                return false;
            }
            triangulation.refine_distance = values.get<std::array<double, 4>>();
        }
        if (config.contains("enforce_delaunay"))
            triangulation.enforce_delaunay = config["enforce_delaunay"].get<bool>();
        if (config.contains("diagnostics"))
            triangulation.diagnostics = config["diagnostics"].get<bool>();

        if (config.contains("interpolation"))
            config_.interpolation = parse_interpolation(config["interpolation"].get<std::string>());

        if (config.contains("output")) config_.output = config["output"].get<std::string>();
        if (config.contains("color_raster")) config_.color_raster = config["color_raster"].get<std::string>();
        read_number("pixel_size", config_.options.pixel_size);
        if (config.contains("log_level")) config_.workflow.log_config = config["log_level"].get<std::string>();
        if (config.contains("log_file")) config_.workflow.log_file = config["log_file"].get<std::string>();

        return true;

    } catch (const json::exception& e) {
        logger_.error("Error parsing JSON job file: " + std::string(e.what()));
        return false;
    } catch (const RasterError& e) {
        logger_.error("Error in job file " + filename + ": " + e.what());
        return false;
    }
}

void CommandLineInterface::print_config() const {
    const auto& cleaner = config_.options.cleaner;
    const auto& triangulation = config_.options.triangulation;

    logger_.detailed("=== Configuration ===");
    if (!config_.shapes_path.empty()) {
        logger_.detailed("Shape file: " + config_.shapes_path +
                         (config_.shape_index ? " (shape " + std::to_string(*config_.shape_index) + ")"
                                              : std::string(" (all shapes)")));
    } else {
        logger_.detailed("HUC file: " + config_.hucs_path);
        logger_.detailed("HUC: " + (config_.huc.empty() ? std::string("(all)") : config_.huc) +
                         (config_.level ? " at level " + std::to_string(*config_.level) : std::string()));
    }
    logger_.detailed("Reaches: " + (config_.reaches_path.empty() ? std::string("(none)") : config_.reaches_path));
    logger_.detailed("DEM: " + (config_.dem_path.empty() ? std::string("(none)") : config_.dem_path));
    logger_.detailed("CRS: " + config_.working_crs());
    logger_.detailed("Simplify: " + std::to_string(cleaner.simplify) +
                     ", prune below " + std::to_string(cleaner.prune_reach_size) + " reaches" +
                     (cleaner.cut_intersections ? ", cutting intersections" : ""));
    if (triangulation.refine_max_area) {
        logger_.detailed("Max triangle area: " + std::to_string(*triangulation.refine_max_area));
    }
    if (triangulation.refine_distance) {
        const auto& d = *triangulation.refine_distance;
        logger_.detailed("River-distance refinement: " + std::to_string(d[0]) + "," + std::to_string(d[1]) +
                         "," + std::to_string(d[2]) + "," + std::to_string(d[3]));
    }
    if (triangulation.refine_max_edge_length) {
        logger_.detailed("Max edge length: " + std::to_string(*triangulation.refine_max_edge_length));
    }
    if (triangulation.refine_min_angle) {
        logger_.detailed("Min angle: " + std::to_string(*triangulation.refine_min_angle));
    }
    logger_.detailed("Interpolation: " + interpolation_name(config_.interpolation));
    if (!config_.output.empty()) logger_.detailed("Mesh output: " + config_.output);
    if (!config_.color_raster.empty()) logger_.detailed("Color raster: " + config_.color_raster);
}

} // namespace hydromesh
