/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the hydromesh driver
 */

#pragma once

#include "hydromesh.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/InputValidator.hpp"
#include "../core/Logger.hpp"
#include "../core/RasterSampler.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace hydromesh {

/**
 * @brief Everything one hydromesh run needs, merged from rc files, the
 *        JSON job file and the command line (in increasing priority)
 */
struct RunConfig {
    WorkflowConfig workflow;

    std::string hucs_path;
    std::string shapes_path;           ///< Plain polygon dataset meshed instead of HUCs
    std::optional<size_t> shape_index;
    std::string huc;
    std::optional<int> level;
    std::string reaches_path;
    std::string dem_path;
    std::string crs;                   ///< Empty means workflow.default_crs

    RunOptions options;
    Interpolation interpolation = Interpolation::Bilinear;

    std::string output;                ///< Mesh vector file
    std::string color_raster;          ///< HUC index GeoTIFF
    std::optional<std::string> config_file;
    bool dry_run = false;

    const std::string& working_crs() const { return crs.empty() ? workflow.default_crs : crs; }
};

/**
 * @brief Command line interface for parsing arguments and configuring a run
 */
class CommandLineInterface {
public:
    CommandLineInterface();

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if parsing was successful, false on error or after --help
     */
    bool parse_arguments(int argc, char* argv[]);

    /**
     * @brief Seed the run with rc-file defaults before parsing
     */
    void set_workflow_defaults(const WorkflowConfig& workflow) { config_.workflow = workflow; }

    const RunConfig& get_config() const { return config_; }

    bool is_dry_run() const { return config_.dry_run; }

    /**
     * @brief True when parse_arguments() stopped because help was shown
     */
    bool help_shown() const { return help_shown_; }

    /**
     * @brief Apply a JSON job file; keys mirror the long option names with
     *        dashes replaced by underscores
     * @return true if the file was read and every value had the right type
     */
    bool load_config_file(const std::string& filename);

    /**
     * @brief Log the effective configuration at DETAILED
     */
    void print_config() const;

private:
    RunConfig config_;
    bool help_shown_ = false;
    Logger logger_;

    // Main parsing method; false if a value does not parse
    bool parse_all_options(const SimpleCommandLineParser& parser);

    bool parse_number(const SimpleCommandLineParser& parser, const std::string& name,
                      std::optional<double>& target);

    /**
     * @brief near_d,near_a,far_d,far_a
     */
    static std::optional<std::array<double, 4>> parse_refine_distance(const std::string& text);
};

} // namespace hydromesh
