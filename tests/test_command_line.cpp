// tests/test_command_line.cpp (doctest)
#include <doctest/doctest.h>

#include "TestShapes.hpp"
#include "cli/CommandLineInterface.hpp"

#include <fstream>
#include <string>
#include <vector>

using namespace hydromesh;
using hydromesh_test::TempPath;

namespace command_line_test {

// Owns argv storage for parse_arguments
class Args {
public:
    explicit Args(std::vector<std::string> args) : storage_(std::move(args)) {
        storage_.insert(storage_.begin(), "hydromesh");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

bool parse(CommandLineInterface& cli, std::vector<std::string> args) {
    Args a(std::move(args));
    return cli.parse_arguments(a.argc(), a.argv());
}

} // namespace command_line_test

using command_line_test::parse;

TEST_CASE("command line options fill the run configuration") {
    CommandLineInterface cli;
    REQUIRE(parse(cli, {"--hucs", "wbd.gpkg", "--huc", "060102020103", "--level", "12",
                        "--reaches", "nhd.shp", "--dem", "dem.tif",
                        "--simplify", "25", "--prune-reach-size", "3", "--cut-intersections",
                        "--refine-max-area=1000", "--refine-distance", "100,500,1000,5000",
                        "--refine-min-angle", "30", "--enforce-delaunay",
                        "--interpolation", "nearest", "-o", "mesh.gpkg", "--dry-run"}));

    const RunConfig& config = cli.get_config();
    CHECK(config.hucs_path == "wbd.gpkg");
    CHECK(config.huc == "060102020103");
    REQUIRE(config.level.has_value());
    CHECK(*config.level == 12);
    CHECK(config.reaches_path == "nhd.shp");
    CHECK(config.dem_path == "dem.tif");
    CHECK(config.options.cleaner.simplify == 25.0);
    CHECK(config.options.cleaner.prune_reach_size == 3);
    CHECK(config.options.cleaner.cut_intersections);

    const auto& tri = config.options.triangulation;
    REQUIRE(tri.refine_max_area.has_value());
    CHECK(*tri.refine_max_area == 1000.0);
    REQUIRE(tri.refine_distance.has_value());
    CHECK((*tri.refine_distance)[2] == 1000.0);
    REQUIRE(tri.refine_min_angle.has_value());
    CHECK(*tri.refine_min_angle == 30.0);
    CHECK(tri.enforce_delaunay);
    CHECK_FALSE(tri.refine_max_edge_length.has_value());

    CHECK(config.interpolation == Interpolation::Nearest);
    CHECK(config.output == "mesh.gpkg");
    CHECK(cli.is_dry_run());
}

TEST_CASE("the working CRS falls back to the configured default") {
    CommandLineInterface cli;
    WorkflowConfig defaults;
    defaults.default_crs = "EPSG:26917";
    cli.set_workflow_defaults(defaults);

    REQUIRE(parse(cli, {"--hucs", "wbd.gpkg"}));
    CHECK(cli.get_config().working_crs() == "EPSG:26917");

    REQUIRE(parse(cli, {"--hucs", "wbd.gpkg", "--crs", "EPSG:5070"}));
    CHECK(cli.get_config().working_crs() == "EPSG:5070");
}

TEST_CASE("malformed option values are rejected") {
    CommandLineInterface cli;
    CHECK_FALSE(parse(cli, {"--simplify", "ten"}));
    CHECK_FALSE(parse(cli, {"--level", "x"}));
    CHECK_FALSE(parse(cli, {"--refine-distance", "1,2,3"}));
    CHECK_FALSE(parse(cli, {"--refine-distance", "1,2,3,4,5"}));
    CHECK_FALSE(parse(cli, {"--interpolation", "cubic"}));
    CHECK_FALSE(parse(cli, {"--no-such-option"}));
    CHECK_FALSE(cli.help_shown());
}

TEST_CASE("numbers must be consumed whole") {
    CommandLineInterface cli;
    CHECK_FALSE(parse(cli, {"--simplify=5abc"}));
    CHECK_FALSE(parse(cli, {"--level", "12x"}));
    CHECK_FALSE(parse(cli, {"--refine-max-area=1e3m"}));
    CHECK_FALSE(parse(cli, {"--prune-reach-size=-3"}));
    CHECK_FALSE(parse(cli, {"--prune-reach-size", "2.5"}));

    REQUIRE(parse(cli, {"--prune-reach-size=3", "--simplify= 5 "}));
    CHECK(cli.get_config().options.cleaner.prune_reach_size == 3);
    CHECK(cli.get_config().options.cleaner.simplify == 5.0);
}

TEST_CASE("stray arguments and valued flags are rejected") {
    CommandLineInterface cli;
    CHECK_FALSE(parse(cli, {"--hucs", "wbd.gpkg", "mesh.gpkg"}));
    CHECK_FALSE(parse(cli, {"--dry-run=yes"}));
    CHECK_FALSE(parse(cli, {"--hucs="}));
    CHECK_FALSE(parse(cli, {"--hucs"}));
}

TEST_CASE("a shape dataset replaces the HUC options") {
    CommandLineInterface cli;
    REQUIRE(parse(cli, {"--shapes", "basins.gpkg", "--shape-index", "2", "--dem", "dem.tif"}));
    const RunConfig& config = cli.get_config();
    CHECK(config.shapes_path == "basins.gpkg");
    REQUIRE(config.shape_index.has_value());
    CHECK(*config.shape_index == 2);
    CHECK(config.hucs_path.empty());

    CommandLineInterface negative;
    CHECK_FALSE(parse(negative, {"--shapes", "basins.gpkg", "--shape-index=-1"}));
    CHECK_FALSE(parse(negative, {"--shapes", "basins.gpkg", "--shape-index", "first"}));
}

TEST_CASE("help stops parsing") {
    CommandLineInterface cli;
    CHECK_FALSE(parse(cli, {"--help"}));
    CHECK(cli.help_shown());
}

TEST_CASE("job files supply options and the command line wins") {
    TempPath job("job.json");
    {
        std::ofstream out(job.str());
        out << R"({
            "hucs": "wbd.gpkg",
            "huc": "0601",
            "simplify": 5.0,
            "refine_distance": [10, 50, 100, 500],
            "enforce_delaunay": true,
            "interpolation": "bilinear",
            "color_raster": "hucs.tif",
            "pixel_size": 30,
            "log_level": "4,Triangulator=6"
        })";
    }

    CommandLineInterface cli;
    REQUIRE(parse(cli, {"--config", job.str(), "--simplify", "12"}));

    const RunConfig& config = cli.get_config();
    CHECK(config.hucs_path == "wbd.gpkg");
    CHECK(config.huc == "0601");
    CHECK(config.options.cleaner.simplify == 12.0);
    REQUIRE(config.options.triangulation.refine_distance.has_value());
    CHECK((*config.options.triangulation.refine_distance)[3] == 500.0);
    CHECK(config.options.triangulation.enforce_delaunay);
    CHECK(config.color_raster == "hucs.tif");
    REQUIRE(config.options.pixel_size.has_value());
    CHECK(*config.options.pixel_size == 30.0);
    CHECK(config.workflow.log_config == "4,Triangulator=6");
    REQUIRE(config.config_file.has_value());
    CHECK(*config.config_file == job.str());
}

TEST_CASE("bad job files are rejected") {
    CommandLineInterface cli;

    SUBCASE("missing file") {
        CHECK_FALSE(cli.load_config_file("/nonexistent/job.json"));
    }
    SUBCASE("wrong refine_distance arity") {
        TempPath job("job_arity.json");
        {
            std::ofstream out(job.str());
            out << R"({"refine_distance": [1, 2, 3]})";
        }
        CHECK_FALSE(cli.load_config_file(job.str()));
    }
    SUBCASE("wrong value type") {
        TempPath job("job_type.json");
        {
            std::ofstream out(job.str());
            out << R"({"simplify": "lots"})";
        }
        CHECK_FALSE(cli.load_config_file(job.str()));
    }
    SUBCASE("not JSON") {
        TempPath job("job_syntax.json");
        {
            std::ofstream out(job.str());
            out << "simplify = 3";
        }
        CHECK_FALSE(cli.load_config_file(job.str()));
    }
}
