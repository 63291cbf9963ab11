#pragma once

#include <cmath>
#include <cstddef>

#include "flatring/flat_ring.hpp"

namespace flatring {

    /**
     * @brief Signed planar area of a ring (shoelace formula)
     *
     * Positive area means counter-clockwise winding, negative means clockwise.
     * Z and M components are ignored.
     *
     * @param ring The ring to measure
     * @return Signed area, 0 for rings with fewer than 3 vertices
     */
    inline double signed_area(const FlatRing &ring) {
        const std::size_t n = ring.vertex_count();
        if (n < 3) {
            return 0.0;
        }

        const auto &flat = ring.flat_coordinates();
        const std::size_t stride = ring.stride();
        const std::size_t end = n * stride;

        double twice_area = 0.0;
        double x1 = flat[end - stride];
        double y1 = flat[end - stride + 1];
        for (std::size_t offset = 0; offset < end; offset += stride) {
            const double x2 = flat[offset];
            const double y2 = flat[offset + 1];
            twice_area += x1 * y2 - x2 * y1;
            x1 = x2;
            y1 = y2;
        }

        return twice_area * 0.5;
    }

    /**
     * @brief Unsigned planar area of a ring
     */
    inline double area(const FlatRing &ring) { return std::abs(signed_area(ring)); }

    inline bool is_ccw(const FlatRing &ring) { return signed_area(ring) > 0.0; }

} // namespace flatring
