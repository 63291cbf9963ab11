#pragma once

#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

#include <datapod/datapod.hpp>

#include "flatring/flat_ring.hpp"
#include "flatring/layout.hpp"

namespace flatring {

    /// Distance under which two vertices are considered the same
    inline constexpr double kClosureEpsilon = 1e-10;

    namespace utils {

        /**
         * @brief Check if two vertex tuples are approximately equal
         *
         * Tuples of different length are never equal.
         */
        inline bool points_equal(const Coordinate &p1, const Coordinate &p2, double epsilon = kClosureEpsilon) {
            if (p1.size() != p2.size()) {
                return false;
            }
            double sum = 0.0;
            for (std::size_t i = 0; i < p1.size(); ++i) {
                const double d = p1[i] - p2[i];
                sum += d * d;
            }
            return sum < epsilon * epsilon;
        }

        /**
         * @brief Check if the first and last vertex of a tuple list coincide
         */
        inline bool is_closed(const Coordinates &points, double epsilon = kClosureEpsilon) {
            if (points.size() < 2) {
                return false;
            }
            return points_equal(points.front(), points.back(), epsilon);
        }

        /**
         * @brief Check if the first and last vertex of a ring coincide in x/y
         */
        inline bool is_closed(const FlatRing &ring, double epsilon = kClosureEpsilon) {
            const std::size_t n = ring.vertex_count();
            if (n < 2) {
                return false;
            }
            const double dx = ring.x(0) - ring.x(n - 1);
            const double dy = ring.y(0) - ring.y(n - 1);
            return dx * dx + dy * dy < epsilon * epsilon;
        }

        /**
         * @brief Ensure a tuple list is closed (first vertex == last vertex)
         *
         * @param points Open or closed ring
         * @return Closed ring
         */
        inline Coordinates close_ring(const Coordinates &points, double epsilon = kClosureEpsilon) {
            if (points.empty()) {
                return points;
            }

            Coordinates result = points;
            if (points.size() == 1 || !points_equal(result.front(), result.back(), epsilon)) {
                result.push_back(result.front());
            }
            return result;
        }

        /**
         * @brief Flatten a datapod polygon into a ring
         *
         * @param polygon Source polygon, expected closed
         * @param layout XY drops z, XYZ keeps it; layouts with a measure are rejected
         * @throws InvalidLayout for XYM and XYZM, datapod points carry no measure
         */
        inline FlatRing from_polygon(const datapod::Polygon &polygon, Layout layout = Layout::XY) {
            const LayoutInfo info = layout_info(layout);
            if (info.has_m) {
                throw InvalidLayout("datapod polygons carry no measure, cannot build " + to_string(layout));
            }

            std::vector<double> flat;
            flat.reserve(polygon.vertices.size() * info.stride);
            for (const auto &v : polygon.vertices) {
                flat.push_back(v.x);
                flat.push_back(v.y);
                if (info.has_z) {
                    flat.push_back(v.z);
                }
            }
            return FlatRing(layout, std::move(flat));
        }

        /**
         * @brief Expand a ring into a datapod polygon; z is 0 unless the layout has one
         */
        inline datapod::Polygon to_polygon(const FlatRing &ring) {
            const LayoutInfo &info = ring.layout_info();
            const auto &flat = ring.flat_coordinates();

            datapod::Polygon polygon;
            polygon.vertices.reserve(ring.vertex_count());
            for (std::size_t offset = 0; offset < flat.size(); offset += info.stride) {
                const double z = info.has_z ? flat[offset + info.z_index] : 0.0;
                polygon.vertices.push_back(datapod::Point{flat[offset], flat[offset + 1], z});
            }
            return polygon;
        }

    } // namespace utils

} // namespace flatring
