/**
 * @file CgalTriangulationKernel.cpp
 * @brief CGAL implementation of the constrained triangulation capability
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "CgalTriangulationKernel.hpp"
#include "Geometry.hpp"

#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Constrained_Delaunay_triangulation_2.h>
#include <CGAL/Delaunay_mesh_face_base_2.h>
#include <CGAL/Delaunay_mesh_vertex_base_2.h>
#include <CGAL/Delaunay_mesh_size_criteria_2.h>
#include <CGAL/Delaunay_mesher_2.h>
#include <CGAL/Triangulation_conformer_2.h>

#include <cmath>
#include <unordered_map>

namespace hydromesh {

namespace {

using K = CGAL::Exact_predicates_inexact_constructions_kernel;
using Vb = CGAL::Delaunay_mesh_vertex_base_2<K>;
using Fb = CGAL::Delaunay_mesh_face_base_2<K>;
using Tds = CGAL::Triangulation_data_structure_2<Vb, Fb>;
using CDT = CGAL::Constrained_Delaunay_triangulation_2<K, Tds, CGAL::Exact_predicates_tag>;
using CdtPoint = CDT::Point;

// Largest angle bound for which Delaunay refinement is known to terminate
constexpr double kGuaranteedAngle = 20.6;
constexpr double kPi = 3.14159265358979323846;

/**
 * @brief Size criteria with the size test replaced by a refine predicate
 *
 * The aspect bound is sin^2 of the minimum angle; zero disables the angle test.
 */
class PredicateCriteria : public CGAL::Delaunay_mesh_size_criteria_2<CDT> {
public:
    using Base = CGAL::Delaunay_mesh_size_criteria_2<CDT>;
    using Quality = Base::Quality;

    PredicateCriteria(double aspect_bound, const RefinePredicate* refine)
        : Base(aspect_bound, 0.0), refine_(refine) {
        // Delaunay_mesh_criteria_2 is a virtual base, default-built by this class
        this->set_bound(aspect_bound);
    }

    class Is_bad : public Base::Is_bad {
    public:
        Is_bad(double aspect_bound, const RefinePredicate* refine, const K& traits)
            : Base::Is_bad(aspect_bound, 0.0, traits), refine_(refine) {}

        using Base::Is_bad::operator();

        CGAL::Mesh_2::Face_badness operator()(const CDT::Face_handle& fh, Quality& q) const {
            const CGAL::Mesh_2::Face_badness badness = Base::Is_bad::operator()(fh, q);
            if (refine_ == nullptr || !(*refine_)) {
                return badness;
            }

            std::array<Point2D, 3> corners;
            for (int i = 0; i < 3; ++i) {
                const CdtPoint& p = fh->vertex(i)->point();
                corners[i] = Point2D(p.x(), p.y());
            }
            if ((*refine_)(corners, triangle_area(corners[0], corners[1], corners[2]))) {
                // size() > 1 keeps the stored quality consistent with the verdict
                q = Quality(q.sine(), 2.0);
                return CGAL::Mesh_2::IMPERATIVELY_BAD;
            }
            return badness;
        }

    private:
        const RefinePredicate* refine_;
    };

    Is_bad is_bad_object() const {
        return Is_bad(this->bound(), refine_, this->traits);
    }

private:
    const RefinePredicate* refine_;
};

} // anonymous namespace

CgalTriangulationKernel::CgalTriangulationKernel() : logger_("CgalTriangulationKernel") {
}

Mesh2D CgalTriangulationKernel::triangulate(const PSLG& pslg, const RefinePredicate& refine,
                                            std::optional<double> min_angle, bool enforce_delaunay) const {
    CDT cdt;

    std::vector<CDT::Vertex_handle> handles;
    handles.reserve(pslg.vertices.size());
    for (const auto& v : pslg.vertices) {
        handles.push_back(cdt.insert(CdtPoint(v.x(), v.y())));
    }

    size_t constraints = 0;
    for (const auto& segment : pslg.segments) {
        if (handles.at(segment[0]) == handles.at(segment[1])) continue;
        cdt.insert_constraint(handles[segment[0]], handles[segment[1]]);
        ++constraints;
    }
    logger_.debug("Inserted " + std::to_string(pslg.vertices.size()) + " vertices and " +
                  std::to_string(constraints) + " constraints");

    if (enforce_delaunay) {
        CGAL::make_conforming_Delaunay_2(cdt);
        logger_.debug("Conforming Delaunay: " + std::to_string(cdt.number_of_vertices()) + " vertices");
    }

    double aspect_bound = 0.0;
    if (min_angle.has_value()) {
        if (*min_angle > kGuaranteedAngle) {
            logger_.warning("Minimum angle " + std::to_string(*min_angle) +
                            " exceeds the bound for guaranteed termination (" +
                            std::to_string(kGuaranteedAngle) + " degrees)");
        }
        const double s = std::sin(*min_angle * kPi / 180.0);
        aspect_bound = s * s;
    }

    std::vector<CdtPoint> seeds;
    seeds.reserve(pslg.holes.size());
    for (const auto& hole : pslg.holes) {
        seeds.emplace_back(hole.x(), hole.y());
    }

    PredicateCriteria criteria(aspect_bound, refine ? &refine : nullptr);
    CGAL::Delaunay_mesher_2<CDT, PredicateCriteria> mesher(cdt, criteria);
    // Seeds mark regions to leave unmeshed; marking now also labels the domain
    mesher.set_seeds(seeds.begin(), seeds.end(), false, true);
    if (refine || aspect_bound > 0.0) {
        mesher.refine_mesh();
    }

    Mesh2D mesh;
    std::unordered_map<const CDT::Vertex*, size_t> index;
    index.reserve(cdt.number_of_vertices());

    for (const auto& handle : handles) {
        if (index.emplace(&*handle, mesh.vertices.size()).second) {
            mesh.vertices.emplace_back(handle->point().x(), handle->point().y());
        }
    }
    for (auto vit = cdt.finite_vertices_begin(); vit != cdt.finite_vertices_end(); ++vit) {
        if (index.emplace(&*vit, mesh.vertices.size()).second) {
            mesh.vertices.emplace_back(vit->point().x(), vit->point().y());
        }
    }

    for (auto fit = cdt.finite_faces_begin(); fit != cdt.finite_faces_end(); ++fit) {
        if (!fit->is_in_domain()) continue;
        mesh.triangles.push_back({index.at(&*fit->vertex(0)),
                                  index.at(&*fit->vertex(1)),
                                  index.at(&*fit->vertex(2))});
    }

    logger_.detailed("Triangulation: " + std::to_string(mesh.num_vertices()) + " vertices (" +
                     std::to_string(mesh.num_vertices() - handles.size()) + " added), " +
                     std::to_string(mesh.num_triangles()) + " triangles");
    return mesh;
}

} // namespace hydromesh
