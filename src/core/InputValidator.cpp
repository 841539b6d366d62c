/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include <sstream>
#include <cmath>

namespace hydromesh {

namespace {

std::string format_value(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // anonymous namespace

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Contradictory parameters detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    oss << "\nProgram terminated due to contradictory inputs.\n";
    return oss.str();
}

ValidationResult InputValidator::validate(const RunOptions& options) const {
    ValidationResult result;
    result.is_valid = true;

    auto add = [&result](const ParameterConflict& conflict) {
        result.conflicts.push_back(conflict);
        result.is_valid = false;
    };

    if (auto conflict = check_simplify_tolerance(options.cleaner)) {
        add(*conflict);
    }
    for (const auto& conflict : check_refine_limits(options.triangulation)) {
        add(conflict);
    }
    if (auto conflict = check_refine_distance(options.triangulation)) {
        add(*conflict);
    }
    if (auto conflict = check_min_angle(options.triangulation)) {
        add(*conflict);
    }
    if (auto conflict = check_pixel_size(options.pixel_size)) {
        add(*conflict);
    }

    return result;
}

void InputValidator::validate_or_throw(const RunOptions& options) const {
    ValidationResult result = validate(options);
    if (result.has_errors()) {
        throw ConfigurationError(result.format_error_message());
    }
}

std::optional<ParameterConflict> InputValidator::check_simplify_tolerance(
    const CleanerOptions& options) const {

    if (options.simplify >= 0.0 && std::isfinite(options.simplify)) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Simplify tolerance must be a non-negative distance";
    conflict.involved_params = {"--simplify " + format_value(options.simplify)};
    conflict.suggestions = {
        "Use --simplify 0 to keep the input geometry unchanged",
        "Use a tolerance in CRS units, e.g. --simplify 10 for metres"
    };
    return conflict;
}

std::vector<ParameterConflict> InputValidator::check_refine_limits(
    const TriangulationOptions& options) const {

    std::vector<ParameterConflict> conflicts;

    if (options.refine_max_area && !(*options.refine_max_area > 0.0)) {
        ParameterConflict conflict;
        conflict.description = "Maximum triangle area must be positive";
        conflict.involved_params = {"--refine-max-area " + format_value(*options.refine_max_area)};
        conflict.suggestions = {
            "Omit --refine-max-area to disable area refinement",
            "Use a positive area in squared CRS units"
        };
        conflicts.push_back(conflict);
    }

    if (options.refine_max_edge_length && !(*options.refine_max_edge_length > 0.0)) {
        ParameterConflict conflict;
        conflict.description = "Maximum edge length must be positive";
        conflict.involved_params = {
            "--refine-max-edge-length " + format_value(*options.refine_max_edge_length)
        };
        conflict.suggestions = {
            "Omit --refine-max-edge-length to disable edge-length refinement",
            "Use a positive length in CRS units"
        };
        conflicts.push_back(conflict);
    }

    return conflicts;
}

std::optional<ParameterConflict> InputValidator::check_refine_distance(
    const TriangulationOptions& options) const {

    if (!options.refine_distance) {
        return std::nullopt;
    }

    const auto& [near_distance, near_area, far_distance, far_area] = *options.refine_distance;
    if (near_distance < far_distance && near_area > 0.0 && far_area > 0.0 && near_distance >= 0.0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "River-distance refinement needs 0 <= near distance < far distance "
                           "and positive areas";

    std::ostringstream given;
    given << "--refine-distance " << near_distance << "," << near_area << ","
          << far_distance << "," << far_area;
    conflict.involved_params = {given.str()};

    if (near_distance >= far_distance) {
        conflict.suggestions.push_back("Swap the distances: --refine-distance " +
                                       format_value(far_distance) + "," + format_value(near_area) + "," +
                                       format_value(near_distance) + "," + format_value(far_area));
    }
    conflict.suggestions.push_back("Use --refine-max-area alone for a uniform area ceiling");
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_min_angle(
    const TriangulationOptions& options) const {

    if (!options.refine_min_angle) {
        return std::nullopt;
    }
    const double angle = *options.refine_min_angle;
    if (angle > 0.0 && angle <= 34.0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Minimum angle must lie in (0, 34] degrees";
    conflict.involved_params = {"--refine-min-angle " + format_value(angle)};
    conflict.suggestions = {
        "Use --refine-min-angle 20 (guaranteed to terminate)",
        "Omit --refine-min-angle to skip quality refinement"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_pixel_size(
    const std::optional<double>& pixel_size) const {

    if (!pixel_size || *pixel_size > 0.0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Color raster pixel size must be positive";
    conflict.involved_params = {"--pixel-size " + format_value(*pixel_size)};
    conflict.suggestions = {"Use a positive pixel size in CRS units, e.g. --pixel-size 30"};
    return conflict;
}

} // namespace hydromesh
