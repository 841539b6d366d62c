/**
 * @file Geometry.hpp
 * @brief Planar measurement helpers and noded-linework utilities
 *
 * Small, exact helpers that do not need the geometry backend: distances,
 * areas, segment crossings, endpoint indexing, line merging and ring
 * assembly.
 */

#pragma once

#include "hydromesh.hpp"

#include <array>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace hydromesh {

double distance(const Point2D& a, const Point2D& b);

/**
 * @brief Distance from a point to the closed segment [a, b]
 */
double point_segment_distance(const Point2D& p, const Point2D& a, const Point2D& b);

double point_line_distance(const Point2D& p, const LineString& line);

/**
 * @brief Distance to the nearest line in a collection; +infinity when empty
 */
double point_lines_distance(const Point2D& p, const MultiLineString& lines);

double triangle_area(const Point2D& a, const Point2D& b, const Point2D& c);

/**
 * @brief Shoelace area; positive for counter-clockwise rings
 */
double ring_signed_area(const Ring& ring);

/**
 * @brief Exterior area minus hole areas
 */
double polygon_area(const Polygon& polygon);

Point2D centroid(const std::array<Point2D, 3>& triangle);

/**
 * @brief Intersection point of two non-parallel segments, endpoints included
 *
 * Collinear overlaps return nullopt; they are not crossings.
 */
std::optional<Point2D> segment_intersection(const Point2D& a, const Point2D& b,
                                            const Point2D& c, const Point2D& d);

BoundingBox bounds_of(const LineString& line);
BoundingBox bounds_of(const Polygon& polygon);
BoundingBox bounds_of(const std::vector<Polygon>& polygons);

/**
 * @brief Rings of a polygon as closed LineStrings
 */
MultiLineString polygon_boundary(const Polygon& polygon);

double round_to_digits(double value, int digits);
void round_coordinates(LineString& line, int digits);
void round_coordinates(Polygon& polygon, int digits);

/**
 * @brief Drop consecutive duplicate coordinates
 */
void remove_repeated_points(LineString& line);

/**
 * @brief Segment lengths of every line, for diagnostics
 */
std::vector<double> segment_lengths(const MultiLineString& lines);

/**
 * @brief Minimum and median of a sample; (0, 0) for an empty sample
 */
std::pair<double, double> min_and_median(std::vector<double> values);

/**
 * @brief Uniform hash grid of tagged points for radius queries
 */
class PointGrid {
public:
    /**
     * @param cell_size Grid spacing; non-positive values fall back to 1.0
     */
    explicit PointGrid(double cell_size);

    void insert(const Point2D& point, size_t id);

    /**
     * @brief Ids whose points lie within radius, nearest first, ties by lowest id
     */
    std::vector<size_t> query(const Point2D& point, double radius) const;

    size_t size() const { return points_.size(); }

private:
    using Cell = std::pair<long long, long long>;

    Cell cell_of(const Point2D& point) const;

    double cell_size_;
    std::map<Cell, std::vector<size_t>> cells_;
    std::vector<std::pair<Point2D, size_t>> points_;
};

/**
 * @brief Join noded lines into maximal chains through degree-2 endpoints
 *
 * Endpoints closer than tolerance are treated as the same node. Lines
 * never merge across nodes of degree other than 2. With
 * preserve_direction, a line only continues into a line that starts where
 * it ends, and no line is reversed.
 */
MultiLineString merge_lines(const MultiLineString& lines, double tolerance,
                            bool preserve_direction = false);

/**
 * @brief Assemble noded pieces into closed rings
 *
 * @throws TopologyError if the pieces do not close into rings of at least
 *         four coordinates
 */
std::vector<Ring> assemble_rings(const MultiLineString& pieces, double tolerance);

/**
 * @brief Polygon from closed rings; the largest ring becomes the exterior
 *
 * The exterior is oriented counter-clockwise and holes clockwise.
 */
Polygon polygon_from_rings(std::vector<Ring> rings);

} // namespace hydromesh
