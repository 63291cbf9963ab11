#pragma once

#include <cstdint>
#include <vector>

#include <datapod/datapod.hpp>

#include "flatring/closest.hpp"
#include "flatring/extent.hpp"
#include "flatring/flat_ring.hpp"
#include "flatring/layout.hpp"

namespace flatring {

    /**
     * @brief Ring owns a flat buffer together with the values derived from it
     *
     * Every coordinate assignment replaces the buffer, recomputes the bounding box and bumps
     * the revision. The edge-length bound used by closest point queries is memoized against
     * that revision.
     */
    class Ring {
      public:
        Ring() = default;
        Ring(const Coordinates &points, Layout layout);
        Ring(Layout layout, std::vector<double> flat);

        /**
         * @brief Replace the coordinates
         *
         * @param points Vertex tuples, expected closed
         * @param layout Layout of every tuple; checked against the first one
         * @throws InvalidLayout if the first tuple does not fit the layout
         * @throws InvalidCoordinate if any other tuple does not fit
         */
        void set_coordinates(const Coordinates &points, Layout layout);

        /**
         * @brief Replace the coordinates, layout inferred from the length of the first tuple
         */
        void set_coordinates(const Coordinates &points);

        void set_flat_coordinates(Layout layout, std::vector<double> flat);

        Coordinates coordinates() const { return buffer_.to_nested_coordinates(); }
        const FlatRing &buffer() const { return buffer_; }
        Layout layout() const { return buffer_.layout(); }
        std::size_t vertex_count() const { return buffer_.vertex_count(); }
        const datapod::AABB &bounding_box() const { return bounding_box_; }
        std::uint64_t revision() const { return revision_; }

        double signed_area() const;
        double area() const;

        /**
         * @brief Closest point on this ring if it beats best, best otherwise
         *
         * The whole ring is skipped when its bounding box is already farther than best.
         */
        ClosestPoint closest_point_xy(double x, double y, ClosestPoint best) const;

        /**
         * @brief Closest point on this ring to (x, y)
         */
        ClosestPoint closest_point(double x, double y) const { return closest_point_xy(x, y, ClosestPoint{}); }

        /**
         * @brief New XY ring simplified with Douglas-Peucker
         */
        Ring simplified(double squared_tolerance) const;

        Ring clone() const;

        /// The memo of the edge-length bound, exposed for inspection
        const MaxDeltaCache &max_delta_cache() const { return max_delta_; }

      private:
        void changed();

        FlatRing buffer_;
        datapod::AABB bounding_box_ = empty_extent();
        std::uint64_t revision_ = 0;
        MaxDeltaCache max_delta_;
    };

    /**
     * @brief Create a Ring from an open or closed tuple list
     *
     * The list is closed first if its last vertex differs from the first one.
     *
     * @param points Vertex tuples
     * @param layout Layout of the tuples
     * @return Closed ring
     */
    Ring create_ring(const Coordinates &points, Layout layout);

    /**
     * @brief Closest point over several rings, keeping a running best
     *
     * @param rings Rings to search
     * @param x Query x
     * @param y Query y
     * @param best Starting best, unbounded by default
     */
    ClosestPoint closest_point_on_rings(const std::vector<Ring> &rings, double x, double y,
                                        ClosestPoint best = ClosestPoint{});

} // namespace flatring
