#pragma once

#include <cstddef>
#include <vector>

#include "flatring/flat_ring.hpp"

namespace flatring {

    /**
     * @brief Douglas-Peucker over a range of a flat buffer
     *
     * Appends the x/y pairs of the retained vertices of [offset, end) to out, in input order.
     * The first and last vertex of the range are always retained. A range of fewer than
     * 3 vertices is copied as is.
     *
     * @param flat Flat coordinates
     * @param offset Offset of the first vertex
     * @param end Offset one past the last vertex
     * @param stride Components per vertex
     * @param squared_tolerance Vertices farther than this (squared) from their chord are kept
     * @param out Receives x, y of every retained vertex
     */
    void douglas_peucker(const std::vector<double> &flat, std::size_t offset, std::size_t end, std::size_t stride,
                         double squared_tolerance, std::vector<double> &out);

    /**
     * @brief Simplified 2D copy of a ring
     *
     * Z and M are dropped, the result is always XY. A tolerance of 0, or a ring of at most
     * 2 vertices, yields the 2D copy without any vertex removed.
     *
     * @param ring Input ring, left untouched
     * @param squared_tolerance Squared distance tolerance, must be >= 0
     * @return New XY ring
     * @throws std::invalid_argument if squared_tolerance is negative
     */
    FlatRing simplify(const FlatRing &ring, double squared_tolerance);

} // namespace flatring
