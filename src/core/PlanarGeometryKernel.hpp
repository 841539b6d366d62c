/**
 * @file PlanarGeometryKernel.hpp
 * @brief Abstract planar boolean/simplify capability consumed by the core
 */

#pragma once

#include "hydromesh.hpp"

#include <vector>

namespace hydromesh {

/**
 * @brief Robust planar operations the topology code delegates to
 *
 * Implementations throw GeometryKernelError when the backend cannot
 * produce a result.
 */
class PlanarGeometryKernel {
public:
    virtual ~PlanarGeometryKernel() = default;

    /**
     * @brief Linear part of boundary(a) intersected with boundary(b)
     *
     * Point contacts are dropped. Pieces are noded but not merged.
     */
    virtual MultiLineString boundary_intersection(const Polygon& a, const Polygon& b) const = 0;

    /**
     * @brief boundary(polygon) minus the given linework
     */
    virtual MultiLineString boundary_difference(const Polygon& polygon,
                                                const MultiLineString& lines) const = 0;

    /**
     * @brief Length of line lying on the boundary of polygon
     */
    virtual double boundary_overlap_length(const Polygon& polygon, const LineString& line) const = 0;

    virtual std::vector<Polygon> union_polygons(const std::vector<Polygon>& polygons) const = 0;
    virtual std::vector<Polygon> buffer(const std::vector<Polygon>& polygons, double distance) const = 0;

    virtual bool intersects(const std::vector<Polygon>& polygons, const LineString& line) const = 0;
    virtual bool intersects(const Polygon& a, const Polygon& b) const = 0;
    virtual bool contains(const Polygon& outer, const Polygon& inner) const = 0;

    /**
     * @brief Topology-preserving Douglas-Peucker; endpoints never move
     */
    virtual LineString simplify(const LineString& line, double tolerance) const = 0;

    /**
     * @brief Point guaranteed to lie in the polygon's interior
     */
    virtual Point2D point_on_surface(const Polygon& polygon) const = 0;

    virtual double area(const Polygon& polygon) const = 0;
};

} // namespace hydromesh
