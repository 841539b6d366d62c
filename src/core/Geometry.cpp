/**
 * @file Geometry.cpp
 * @brief Planar measurement helpers and noded-linework utilities
 */

#include "Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <sstream>

namespace hydromesh {

double distance(const Point2D& a, const Point2D& b) {
    return std::hypot(a.x() - b.x(), a.y() - b.y());
}

double point_segment_distance(const Point2D& p, const Point2D& a, const Point2D& b) {
    const double dx = b.x() - a.x();
    const double dy = b.y() - a.y();
    const double len2 = dx * dx + dy * dy;
    if (len2 == 0.0) {
        return distance(p, a);
    }
    double t = ((p.x() - a.x()) * dx + (p.y() - a.y()) * dy) / len2;
    t = std::clamp(t, 0.0, 1.0);
    return distance(p, Point2D(a.x() + t * dx, a.y() + t * dy));
}

double point_line_distance(const Point2D& p, const LineString& line) {
    if (line.empty()) {
        return std::numeric_limits<double>::infinity();
    }
    if (line.size() == 1) {
        return distance(p, line.front());
    }
    double best = std::numeric_limits<double>::infinity();
    for (size_t i = 1; i < line.size(); ++i) {
        best = std::min(best, point_segment_distance(p, line.coords[i - 1], line.coords[i]));
    }
    return best;
}

double point_lines_distance(const Point2D& p, const MultiLineString& lines) {
    double best = std::numeric_limits<double>::infinity();
    for (const auto& line : lines) {
        best = std::min(best, point_line_distance(p, line));
    }
    return best;
}

double triangle_area(const Point2D& a, const Point2D& b, const Point2D& c) {
    return 0.5 * std::abs((b.x() - a.x()) * (c.y() - a.y()) - (c.x() - a.x()) * (b.y() - a.y()));
}

double ring_signed_area(const Ring& ring) {
    if (ring.size() < 3) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < ring.size(); ++i) {
        const Point2D& p = ring[i];
        const Point2D& q = ring[(i + 1) % ring.size()];
        sum += p.x() * q.y() - q.x() * p.y();
    }
    return 0.5 * sum;
}

double polygon_area(const Polygon& polygon) {
    if (polygon.empty()) return 0.0;
    double area = std::abs(ring_signed_area(polygon.rings[0]));
    for (size_t i = 1; i < polygon.rings.size(); ++i) {
        area -= std::abs(ring_signed_area(polygon.rings[i]));
    }
    return area;
}

Point2D centroid(const std::array<Point2D, 3>& triangle) {
    return Point2D((triangle[0].x() + triangle[1].x() + triangle[2].x()) / 3.0,
                   (triangle[0].y() + triangle[1].y() + triangle[2].y()) / 3.0);
}

std::optional<Point2D> segment_intersection(const Point2D& a, const Point2D& b,
                                            const Point2D& c, const Point2D& d) {
    const double rx = b.x() - a.x();
    const double ry = b.y() - a.y();
    const double sx = d.x() - c.x();
    const double sy = d.y() - c.y();
    const double denom = rx * sy - ry * sx;
    if (denom == 0.0) {
        return std::nullopt;
    }

    const double qpx = c.x() - a.x();
    const double qpy = c.y() - a.y();
    const double t = (qpx * sy - qpy * sx) / denom;
    const double u = (qpx * ry - qpy * rx) / denom;
    if (t < 0.0 || t > 1.0 || u < 0.0 || u > 1.0) {
        return std::nullopt;
    }

    // Exact endpoint hits are returned verbatim so callers can detect them
    if (t == 0.0) return a;
    if (t == 1.0) return b;
    if (u == 0.0) return c;
    if (u == 1.0) return d;
    return Point2D(a.x() + t * rx, a.y() + t * ry);
}

BoundingBox bounds_of(const LineString& line) {
    BoundingBox box;
    for (const auto& p : line.coords) box.expand(p);
    return box;
}

BoundingBox bounds_of(const Polygon& polygon) {
    BoundingBox box;
    if (!polygon.empty()) {
        for (const auto& p : polygon.exterior()) box.expand(p);
    }
    return box;
}

BoundingBox bounds_of(const std::vector<Polygon>& polygons) {
    BoundingBox box;
    for (const auto& polygon : polygons) box.expand(bounds_of(polygon));
    return box;
}

MultiLineString polygon_boundary(const Polygon& polygon) {
    MultiLineString result;
    for (const auto& ring : polygon.rings) {
        if (ring.size() >= 2) result.emplace_back(ring);
    }
    return result;
}

double round_to_digits(double value, int digits) {
    const double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

void round_coordinates(LineString& line, int digits) {
    for (auto& p : line.coords) {
        p = Point2D(round_to_digits(p.x(), digits), round_to_digits(p.y(), digits));
    }
}

void round_coordinates(Polygon& polygon, int digits) {
    for (auto& ring : polygon.rings) {
        for (auto& p : ring) {
            p = Point2D(round_to_digits(p.x(), digits), round_to_digits(p.y(), digits));
        }
    }
}

void remove_repeated_points(LineString& line) {
    auto last = std::unique(line.coords.begin(), line.coords.end());
    line.coords.erase(last, line.coords.end());
}

std::vector<double> segment_lengths(const MultiLineString& lines) {
    std::vector<double> lengths;
    for (const auto& line : lines) {
        for (size_t i = 1; i < line.size(); ++i) {
            lengths.push_back(distance(line.coords[i - 1], line.coords[i]));
        }
    }
    return lengths;
}

std::pair<double, double> min_and_median(std::vector<double> values) {
    if (values.empty()) return {0.0, 0.0};
    std::sort(values.begin(), values.end());
    const size_t n = values.size();
    const double median = (n % 2 == 1) ? values[n / 2]
                                       : 0.5 * (values[n / 2 - 1] + values[n / 2]);
    return {values.front(), median};
}

// ============================================================================
// PointGrid
// ============================================================================

PointGrid::PointGrid(double cell_size)
    : cell_size_(cell_size > 0.0 ? cell_size : 1.0) {
}

PointGrid::Cell PointGrid::cell_of(const Point2D& point) const {
    return {static_cast<long long>(std::floor(point.x() / cell_size_)),
            static_cast<long long>(std::floor(point.y() / cell_size_))};
}

void PointGrid::insert(const Point2D& point, size_t id) {
    cells_[cell_of(point)].push_back(points_.size());
    points_.emplace_back(point, id);
}

std::vector<size_t> PointGrid::query(const Point2D& point, double radius) const {
    std::vector<std::pair<double, size_t>> hits;

    auto consider = [&](size_t slot) {
        const auto& entry = points_[slot];
        double d = distance(point, entry.first);
        if (d <= radius) hits.emplace_back(d, entry.second);
    };

    const double span = std::ceil(radius / cell_size_) + 1.0;
    if (span * span * 4.0 > static_cast<double>(cells_.size())) {
        for (size_t slot = 0; slot < points_.size(); ++slot) consider(slot);
    } else {
        const Cell center = cell_of(point);
        const long long reach = static_cast<long long>(span);
        for (long long cx = center.first - reach; cx <= center.first + reach; ++cx) {
            for (long long cy = center.second - reach; cy <= center.second + reach; ++cy) {
                auto it = cells_.find({cx, cy});
                if (it == cells_.end()) continue;
                for (size_t slot : it->second) consider(slot);
            }
        }
    }

    std::sort(hits.begin(), hits.end());
    std::vector<size_t> ids;
    ids.reserve(hits.size());
    for (const auto& hit : hits) ids.push_back(hit.second);
    return ids;
}

// ============================================================================
// Line merging
// ============================================================================

namespace {

struct Incidence {
    size_t line;
    bool at_start;

    bool operator==(const Incidence& other) const {
        return line == other.line && at_start == other.at_start;
    }
};

struct NodeTable {
    std::vector<size_t> start_node;
    std::vector<size_t> end_node;
    std::vector<std::vector<Incidence>> incidences;
};

NodeTable build_nodes(const MultiLineString& lines, double tolerance) {
    NodeTable table;
    PointGrid grid(tolerance);

    auto node_for = [&](const Point2D& p) {
        auto hits = grid.query(p, tolerance);
        if (!hits.empty()) return hits.front();
        size_t id = table.incidences.size();
        table.incidences.emplace_back();
        grid.insert(p, id);
        return id;
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        size_t s = node_for(lines[i].front());
        size_t e = node_for(lines[i].back());
        table.start_node.push_back(s);
        table.end_node.push_back(e);
        table.incidences[s].push_back({i, true});
        table.incidences[e].push_back({i, false});
    }
    return table;
}

// The other incidence at a degree-2 node, if the node is a pass-through
std::optional<Incidence> continuation(const NodeTable& table, size_t node, const Incidence& arrival) {
    const auto& here = table.incidences[node];
    if (here.size() != 2) return std::nullopt;
    return here[0] == arrival ? here[1] : here[0];
}

} // anonymous namespace

MultiLineString merge_lines(const MultiLineString& lines, double tolerance, bool preserve_direction) {
    MultiLineString input;
    input.reserve(lines.size());
    for (const auto& line : lines) {
        if (line.size() >= 2) input.push_back(line);
    }

    const NodeTable table = build_nodes(input, tolerance);
    std::vector<bool> visited(input.size(), false);
    MultiLineString merged;

    for (size_t seed = 0; seed < input.size(); ++seed) {
        if (visited[seed]) continue;
        visited[seed] = true;

        std::deque<Point2D> chain(input[seed].coords.begin(), input[seed].coords.end());

        // Extend downstream from the chain's back
        Incidence arrival{seed, false};
        size_t node = table.end_node[seed];
        while (auto next = continuation(table, node, arrival)) {
            if (visited[next->line]) break;
            if (preserve_direction && !next->at_start) break;
            const auto& coords = input[next->line].coords;
            visited[next->line] = true;
            if (next->at_start) {
                chain.insert(chain.end(), coords.begin() + 1, coords.end());
                arrival = {next->line, false};
                node = table.end_node[next->line];
            } else {
                chain.insert(chain.end(), coords.rbegin() + 1, coords.rend());
                arrival = {next->line, true};
                node = table.start_node[next->line];
            }
        }

        // Extend upstream from the chain's front
        arrival = {seed, true};
        node = table.start_node[seed];
        while (auto next = continuation(table, node, arrival)) {
            if (visited[next->line]) break;
            if (preserve_direction && next->at_start) break;
            const auto& coords = input[next->line].coords;
            visited[next->line] = true;
            if (next->at_start) {
                chain.insert(chain.begin(), coords.rbegin(), coords.rend() - 1);
                arrival = {next->line, false};
                node = table.end_node[next->line];
            } else {
                chain.insert(chain.begin(), coords.begin(), coords.end() - 1);
                arrival = {next->line, true};
                node = table.start_node[next->line];
            }
        }

        merged.emplace_back(std::vector<Point2D>(chain.begin(), chain.end()));
    }
    return merged;
}

std::vector<Ring> assemble_rings(const MultiLineString& pieces, double tolerance) {
    std::vector<Ring> rings;
    for (auto& chain : merge_lines(pieces, tolerance)) {
        if (chain.size() < 4 || distance(chain.front(), chain.back()) > tolerance) {
            std::ostringstream msg;
            msg << "boundary pieces do not close into a ring (chain of " << chain.size()
                << " coordinates from (" << chain.front().x() << ", " << chain.front().y()
                << ") to (" << chain.back().x() << ", " << chain.back().y() << "))";
            throw TopologyError(msg.str());
        }
        chain.coords.back() = chain.coords.front();
        rings.push_back(std::move(chain.coords));
    }
    return rings;
}

Polygon polygon_from_rings(std::vector<Ring> rings) {
    Polygon polygon;
    if (rings.empty()) return polygon;

    std::stable_sort(rings.begin(), rings.end(), [](const Ring& a, const Ring& b) {
        return std::abs(ring_signed_area(a)) > std::abs(ring_signed_area(b));
    });
    for (size_t i = 0; i < rings.size(); ++i) {
        const double area = ring_signed_area(rings[i]);
        const bool want_ccw = (i == 0);
        if ((area > 0.0) != want_ccw) {
            std::reverse(rings[i].begin(), rings[i].end());
        }
        polygon.rings.push_back(std::move(rings[i]));
    }
    return polygon;
}

} // namespace hydromesh
