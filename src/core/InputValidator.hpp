/**
 * @file InputValidator.hpp
 * @brief Input validation for contradictory parameters
 *
 * Validates pipeline options before a run and provides clear error
 * messages with suggested solutions when conflicts are detected.
 */

#pragma once

#include "TopologyCleaner.hpp"
#include "Triangulator.hpp"
#include <string>
#include <vector>
#include <optional>

namespace hydromesh {

/**
 * @brief Represents a parameter conflict detected in user inputs
 */
struct ParameterConflict {
    std::string description;           // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;
};

/**
 * @brief Everything a pipeline run is parameterized by
 */
struct RunOptions {
    CleanerOptions cleaner;
    TriangulationOptions triangulation;
    std::optional<double> pixel_size;   ///< Only checked when a color raster is requested
};

/**
 * @brief Validates pipeline options for contradictions and conflicts
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate all options
     * @return Validation result with every conflict found
     */
    ValidationResult validate(const RunOptions& options) const;

    /**
     * @brief validate(), raising on any conflict
     * @throws ConfigurationError carrying the formatted conflict list
     */
    void validate_or_throw(const RunOptions& options) const;

private:
    std::optional<ParameterConflict> check_simplify_tolerance(const CleanerOptions& options) const;

    /**
     * @brief Area and edge-length ceilings must be positive when given
     */
    std::vector<ParameterConflict> check_refine_limits(const TriangulationOptions& options) const;

    /**
     * @brief near_distance < far_distance, both areas positive
     */
    std::optional<ParameterConflict> check_refine_distance(const TriangulationOptions& options) const;

    /**
     * @brief Minimum angle in (0, 34] degrees; the mesher may not
     *        terminate beyond that
     */
    std::optional<ParameterConflict> check_min_angle(const TriangulationOptions& options) const;

    std::optional<ParameterConflict> check_pixel_size(const std::optional<double>& pixel_size) const;
};

} // namespace hydromesh
