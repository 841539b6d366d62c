#pragma once

/**
 * @file hydromesh.hpp
 * @brief Main header for the hydromesh watershed meshing library
 *
 * Shared value types for turning hydrologic-unit boundaries and river
 * reaches into a conforming triangulated surface draped onto a DEM.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hydromesh {

// ============================================================================
// Geometry Types
// ============================================================================

/**
 * @brief 2D point with x, y coordinates
 */
struct Point2D {
    double x_, y_;

    Point2D() : x_(0), y_(0) {}
    Point2D(double x, double y) : x_(x), y_(y) {}

    double x() const { return x_; }
    double y() const { return y_; }

    bool operator==(const Point2D& other) const {
        return x_ == other.x_ && y_ == other.y_;
    }
    bool operator!=(const Point2D& other) const { return !(*this == other); }

    // Lexicographic order, used for exact-coordinate maps
    bool operator<(const Point2D& other) const {
        return x_ < other.x_ || (x_ == other.x_ && y_ < other.y_);
    }
};

/**
 * @brief 3D point with x, y, z coordinates
 */
struct Point3D {
    double x_, y_, z_;

    Point3D() : x_(0), y_(0), z_(0) {}
    Point3D(double x, double y, double z) : x_(x), y_(y), z_(z) {}

    double x() const { return x_; }
    double y() const { return y_; }
    double z() const { return z_; }

    bool operator==(const Point3D& other) const {
        return x_ == other.x_ && y_ == other.y_ && z_ == other.z_;
    }
};

using Ring = std::vector<Point2D>;

/**
 * @brief Ordered sequence of at least two coordinates
 */
struct LineString {
    std::vector<Point2D> coords;

    LineString() = default;
    explicit LineString(std::vector<Point2D> c) : coords(std::move(c)) {}
    LineString(std::initializer_list<Point2D> c) : coords(c) {}

    size_t size() const { return coords.size(); }
    bool empty() const { return coords.empty(); }
    const Point2D& front() const { return coords.front(); }
    const Point2D& back() const { return coords.back(); }
    bool is_closed() const { return coords.size() > 2 && coords.front() == coords.back(); }

    double length() const {
        double total = 0.0;
        for (size_t i = 1; i < coords.size(); ++i) {
            total += std::hypot(coords[i].x() - coords[i - 1].x(),
                                coords[i].y() - coords[i - 1].y());
        }
        return total;
    }

    bool operator==(const LineString& other) const { return coords == other.coords; }
};

using MultiLineString = std::vector<LineString>;

/**
 * @brief Polygon stored as coordinate rings
 *
 * First ring is the exterior boundary, subsequent rings are holes.
 * Every ring is closed (first coordinate == last coordinate).
 */
struct Polygon {
    std::vector<Ring> rings;

    Polygon() = default;
    explicit Polygon(Ring exterior) { rings.push_back(std::move(exterior)); }

    bool empty() const { return rings.empty() || rings[0].empty(); }

    const Ring& exterior() const { return rings[0]; }

    std::vector<Ring> holes() const {
        if (rings.size() <= 1) return {};
        return std::vector<Ring>(rings.begin() + 1, rings.end());
    }

    size_t num_holes() const {
        return rings.size() > 0 ? rings.size() - 1 : 0;
    }
};

/**
 * @brief Bounding box for spatial queries
 */
struct BoundingBox {
    double min_x, min_y, max_x, max_y;

    BoundingBox()
        : min_x(std::numeric_limits<double>::max()), min_y(std::numeric_limits<double>::max()),
          max_x(std::numeric_limits<double>::lowest()), max_y(std::numeric_limits<double>::lowest()) {}
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    bool valid() const { return min_x <= max_x && min_y <= max_y; }

    void expand(const Point2D& p) {
        min_x = std::min(min_x, p.x());
        min_y = std::min(min_y, p.y());
        max_x = std::max(max_x, p.x());
        max_y = std::max(max_y, p.y());
    }

    void expand(const BoundingBox& other) {
        if (!other.valid()) return;
        min_x = std::min(min_x, other.min_x);
        min_y = std::min(min_y, other.min_y);
        max_x = std::max(max_x, other.max_x);
        max_y = std::max(max_y, other.max_y);
    }

    bool contains(const Point2D& point) const {
        return point.x() >= min_x && point.x() <= max_x &&
               point.y() >= min_y && point.y() <= max_y;
    }

    bool intersects(const BoundingBox& other, double tolerance = 0.0) const {
        return !(other.min_x > max_x + tolerance || other.max_x < min_x - tolerance ||
                 other.min_y > max_y + tolerance || other.max_y < min_y - tolerance);
    }

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
};

// ============================================================================
// Mesh Types
// ============================================================================

using TriangleIndices = std::array<size_t, 3>;

/**
 * @brief Planar triangulation: vertices plus counter-clockwise index triples
 */
struct Mesh2D {
    std::vector<Point2D> vertices;
    std::vector<TriangleIndices> triangles;

    size_t num_vertices() const { return vertices.size(); }
    size_t num_triangles() const { return triangles.size(); }
};

/**
 * @brief Triangulation draped onto an elevation surface
 */
struct Mesh3D {
    std::vector<Point3D> vertices;
    std::vector<TriangleIndices> triangles;

    size_t num_vertices() const { return vertices.size(); }
    size_t num_triangles() const { return triangles.size(); }
};

// ============================================================================
// Raster Types
// ============================================================================

/**
 * @brief Georeferencing and shape of a single-band raster
 *
 * The geotransform follows GDAL conventions:
 * X = gt[0] + col * gt[1] + row * gt[2]
 * Y = gt[3] + col * gt[4] + row * gt[5]
 */
struct RasterProfile {
    std::string crs;                                 ///< CRS as user input string or WKT
    std::array<double, 6> geotransform{{0.0, 1.0, 0.0, 0.0, 0.0, -1.0}};
    int width = 0;
    int height = 0;
    std::optional<double> nodata;
};

/**
 * @brief Row-major grid of samples with its profile
 */
struct Raster {
    RasterProfile profile;
    std::vector<double> data;

    double at(int row, int col) const {
        return data[static_cast<size_t>(row) * profile.width + col];
    }
    double& at(int row, int col) {
        return data[static_cast<size_t>(row) * profile.width + col];
    }

    BoundingBox bounds() const {
        const auto& gt = profile.geotransform;
        BoundingBox box;
        box.expand(Point2D(gt[0], gt[3]));
        box.expand(Point2D(gt[0] + profile.width * gt[1] + profile.height * gt[2],
                           gt[3] + profile.width * gt[4] + profile.height * gt[5]));
        return box;
    }
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Process-level defaults, threaded explicitly into pipeline entry points
 */
struct WorkflowConfig {
    std::string data_directory = "data";
    std::string default_crs = "EPSG:5070";   ///< CONUS Albers equal area, metres
    std::string latlon_crs = "EPSG:4269";    ///< NAD83 geographic
    int digits = 7;                          ///< Coordinate rounding digits
    std::string log_config = "3";
    std::optional<std::string> log_file;
};

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Malformed split topology or river network; aborts the pipeline
 */
class TopologyError : public std::runtime_error {
public:
    explicit TopologyError(const std::string& message)
        : std::runtime_error("Topology error: " + message) {}
};

/**
 * @brief Hierarchical HUC search could not place the query shape
 */
class SearchError : public std::runtime_error {
public:
    explicit SearchError(const std::string& message)
        : std::runtime_error("Search error: " + message) {}
};

/**
 * @brief The planar geometry backend could not produce a result
 */
class GeometryKernelError : public std::runtime_error {
public:
    explicit GeometryKernelError(const std::string& message)
        : std::runtime_error("Geometry kernel error: " + message) {}
};

/**
 * @brief Raster creation, georeferencing or I/O failure
 */
class RasterError : public std::runtime_error {
public:
    explicit RasterError(const std::string& message)
        : std::runtime_error("Raster error: " + message) {}
};

/**
 * @brief Contradictory or out-of-range options
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

} // namespace hydromesh
