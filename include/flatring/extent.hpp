#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>

#include <datapod/datapod.hpp>

#include "flatring/flat_ring.hpp"

namespace flatring {

    /**
     * @brief Extent that contains nothing; every point is infinitely far from it
     */
    inline datapod::AABB empty_extent() {
        return datapod::AABB{
            datapod::Point{std::numeric_limits<double>::max(), std::numeric_limits<double>::max(), 0.0},
            datapod::Point{std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest(), 0.0}};
    }

    inline bool is_empty_extent(const datapod::AABB &extent) {
        return extent.min_point.x > extent.max_point.x || extent.min_point.y > extent.max_point.y;
    }

    /**
     * @brief Axis-aligned bounds of the x/y components of a ring
     */
    inline datapod::AABB compute_extent(const FlatRing &ring) {
        datapod::AABB extent = empty_extent();
        const std::size_t n = ring.vertex_count();
        for (std::size_t i = 0; i < n; ++i) {
            extent.min_point.x = std::min(extent.min_point.x, ring.x(i));
            extent.min_point.y = std::min(extent.min_point.y, ring.y(i));
            extent.max_point.x = std::max(extent.max_point.x, ring.x(i));
            extent.max_point.y = std::max(extent.max_point.y, ring.y(i));
        }
        return extent;
    }

    /**
     * @brief Squared distance from (x, y) to the nearest point of an extent
     *
     * Zero when the point is inside or on the boundary. Serves as a lower bound for the
     * distance to anything the extent contains.
     *
     * @param extent Box to measure against
     * @param x Query x
     * @param y Query y
     * @return Squared distance, +inf for an empty extent
     */
    inline double squared_distance_to_extent(const datapod::AABB &extent, double x, double y) {
        if (is_empty_extent(extent)) {
            return std::numeric_limits<double>::infinity();
        }

        double dx = 0.0;
        if (x < extent.min_point.x) {
            dx = extent.min_point.x - x;
        } else if (extent.max_point.x < x) {
            dx = x - extent.max_point.x;
        }
        double dy = 0.0;
        if (y < extent.min_point.y) {
            dy = extent.min_point.y - y;
        } else if (extent.max_point.y < y) {
            dy = y - extent.max_point.y;
        }
        return dx * dx + dy * dy;
    }

} // namespace flatring
