// tests/test_configuration.cpp (doctest)
//
// rc-file configuration and option validation.
#include <doctest/doctest.h>

#include "TestShapes.hpp"
#include "cli/ConfigurationManager.hpp"
#include "core/InputValidator.hpp"

#include <fstream>

using namespace hydromesh;
using hydromesh_test::TempPath;

TEST_CASE("ConfigurationManager reads key = value pairs") {
    TempPath rc("rc_basic");
    {
        std::ofstream out(rc.str());
        out << "# a comment\n"
            << "; another comment\n"
            << "[paths]\n"
            << "data_directory = /srv/hydro\n"
            << "  default_crs=EPSG:26917  \n"
            << "digits = 4\n"
            << "not a pair\n"
            << "verbose = True\n";
    }

    ConfigurationManager config;
    REQUIRE(config.load_from_file(rc.str()));
    CHECK(config.get_string("data_directory") == "/srv/hydro");
    CHECK(config.get_string("default_crs") == "EPSG:26917");
    CHECK(config.get_int("digits") == 4);
    CHECK(config.get_bool("verbose"));
    CHECK_FALSE(config.has_value("[paths]"));
    CHECK_FALSE(config.has_value("not a pair"));
    CHECK(config.get_double("missing", 2.5) == 2.5);

    WorkflowConfig workflow = config.to_workflow_config();
    CHECK(workflow.data_directory == "/srv/hydro");
    CHECK(workflow.default_crs == "EPSG:26917");
    CHECK(workflow.latlon_crs == "EPSG:4269");
    CHECK(workflow.digits == 4);
    CHECK_FALSE(workflow.log_file.has_value());
}

TEST_CASE("ConfigurationManager later files override earlier ones") {
    TempPath first("rc_first");
    TempPath second("rc_second");
    {
        std::ofstream out(first.str());
        out << "digits = 3\nlog_config = 4\n";
    }
    {
        std::ofstream out(second.str());
        out << "digits = 9\n";
    }

    ConfigurationManager config;
    CHECK(config.load_search_path({first.str(), "/nonexistent/hydromeshrc", second.str()}) == 2);
    CHECK(config.get_int("digits") == 9);
    CHECK(config.get_string("log_config") == "4");
}

TEST_CASE("ConfigurationManager round-trips a WorkflowConfig") {
    TempPath rc("rc_saved");
    WorkflowConfig original;
    original.default_crs = "EPSG:32618";
    original.digits = 5;
    original.log_file = "/tmp/hydromesh.log";

    ConfigurationManager writer;
    writer.from_workflow_config(original);
    REQUIRE(writer.save_to_file(rc.str()));

    ConfigurationManager reader;
    REQUIRE(reader.load_from_file(rc.str()));
    WorkflowConfig loaded = reader.to_workflow_config();
    CHECK(loaded.default_crs == "EPSG:32618");
    CHECK(loaded.digits == 5);
    REQUIRE(loaded.log_file.has_value());
    CHECK(*loaded.log_file == "/tmp/hydromesh.log");
}

TEST_CASE("ConfigurationManager reports unreadable files") {
    ConfigurationManager config;
    CHECK_FALSE(config.load_from_file("/nonexistent/hydromeshrc"));
}

TEST_CASE("InputValidator accepts the defaults") {
    InputValidator validator;
    ValidationResult result = validator.validate(RunOptions());
    CHECK(result.is_valid);
    CHECK(result.conflicts.empty());
    CHECK(result.format_error_message().empty());
    CHECK_NOTHROW(validator.validate_or_throw(RunOptions()));
}

TEST_CASE("InputValidator reports each conflicting option") {
    RunOptions options;
    options.cleaner.simplify = -1.0;
    options.triangulation.refine_max_area = 0.0;
    options.triangulation.refine_max_edge_length = -3.0;
    options.triangulation.refine_distance = std::array<double, 4>{{100.0, 10.0, 50.0, 1000.0}};
    options.triangulation.refine_min_angle = 40.0;
    options.pixel_size = 0.0;

    InputValidator validator;
    ValidationResult result = validator.validate(options);
    CHECK(result.has_errors());
    CHECK(result.conflicts.size() == 6);

    const std::string message = result.format_error_message();
    CHECK(message.find("--simplify -1") != std::string::npos);
    CHECK(message.find("--refine-max-area 0") != std::string::npos);
    CHECK(message.find("--refine-min-angle 40") != std::string::npos);
    CHECK(message.find("--pixel-size 0") != std::string::npos);
    CHECK(message.find("Swap the distances: --refine-distance 50,10,100,1000") != std::string::npos);

    CHECK_THROWS_AS(validator.validate_or_throw(options), ConfigurationError);
}

TEST_CASE("InputValidator minimum angle bounds") {
    InputValidator validator;
    RunOptions options;

    options.triangulation.refine_min_angle = 34.0;
    CHECK(validator.validate(options).is_valid);
    options.triangulation.refine_min_angle = 0.0;
    CHECK_FALSE(validator.validate(options).is_valid);
    options.triangulation.refine_min_angle = 20.0;
    CHECK(validator.validate(options).is_valid);
}
