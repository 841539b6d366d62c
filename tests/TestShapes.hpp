// tests/TestShapes.hpp
//
// Small fixtures shared by the test files.
#pragma once

#include "hydromesh.hpp"
#include "core/Geometry.hpp"
#include "core/ShapeSource.hpp"

#include <cstdio>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace hydromesh_test {

using namespace hydromesh;

// Counter-clockwise closed rectangle
inline Polygon rect(double x0, double y0, double x1, double y1) {
    return Polygon(Ring{{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}, {x0, y0}});
}

inline bool has_coordinate(const Polygon& polygon, const Point2D& p) {
    for (const auto& ring : polygon.rings) {
        for (const auto& q : ring) {
            if (q == p) return true;
        }
    }
    return false;
}

inline bool has_coordinate(const LineString& line, const Point2D& p) {
    for (const auto& q : line.coords) {
        if (q == p) return true;
    }
    return false;
}

// Scratch path under the system temp directory, removed on destruction
class TempPath {
public:
    explicit TempPath(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / ("hydromesh_test_" + name)) {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    ~TempPath() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

/**
 * In-memory provider: every unit is stored under its full code, and
 * get_hucs returns the units of the requested level under the prefix.
 */
class FakeShapeSource : public ShapeSource {
public:
    std::string crs;
    std::vector<HucFeature> units;
    std::vector<Polygon> shapes;
    MultiLineString reaches;
    Raster raster;
    int lowest = 12;
    mutable std::vector<std::string> queries;

    std::pair<RasterProfile, std::vector<HucFeature>> get_hucs(const std::string& huc,
                                                               int level) const override {
        queries.push_back(huc + "@" + std::to_string(level));
        std::vector<HucFeature> found;
        for (const auto& unit : units) {
            if (static_cast<int>(unit.huc.size()) == level && unit.huc.compare(0, huc.size(), huc) == 0) {
                found.push_back(unit);
            }
        }
        RasterProfile profile;
        profile.crs = crs;
        return {profile, found};
    }

    std::pair<RasterProfile, std::vector<Polygon>> get_shapes(const ShapeFilter& filter,
                                                              const std::string&) const override {
        RasterProfile profile;
        profile.crs = crs;
        if (filter.index.has_value()) {
            if (*filter.index >= shapes.size()) {
                throw SearchError("no shape " + std::to_string(*filter.index));
            }
            return {profile, {shapes[*filter.index]}};
        }
        std::vector<Polygon> found;
        for (const auto& shape : shapes) {
            if (!filter.bounds || filter.bounds->intersects(bounds_of(shape))) found.push_back(shape);
        }
        return {profile, found};
    }

    std::pair<RasterProfile, MultiLineString> get_hydro(const std::string&,
                                                        const std::optional<BoundingBox>&,
                                                        const std::string&) const override {
        RasterProfile profile;
        profile.crs = crs;
        return {profile, reaches};
    }

    Raster get_raster(const Polygon&, const std::string&) const override { return raster; }

    int lowest_level() const override { return lowest; }
};

} // namespace hydromesh_test
