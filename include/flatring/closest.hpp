#pragma once

#include <cstdint>
#include <limits>
#include <mutex>
#include <shared_mutex>

#include <datapod/datapod.hpp>

#include "flatring/flat_ring.hpp"

namespace flatring {

    /**
     * @brief Best candidate of a closest-point search
     *
     * The point is always plain 2D (z = 0) whatever the layout of the ring it came from.
     * A default constructed value is the unbounded best.
     */
    struct ClosestPoint {
        datapod::Point point{0.0, 0.0, 0.0};
        double squared_distance = std::numeric_limits<double>::infinity();

        bool found() const { return squared_distance < std::numeric_limits<double>::infinity(); }
    };

    /**
     * @brief Largest squared length of any edge of the ring, closing edge included
     */
    double max_squared_delta(const FlatRing &ring);

    /**
     * @brief Walk the edges of a ring looking for a point closer than best
     *
     * A candidate replaces best only when strictly closer. When an edge is not closer, the walk
     * skips as many edges as cannot possibly beat best given max_delta.
     *
     * @param ring Ring to search
     * @param max_delta Upper bound on edge length, sqrt(max_squared_delta(ring)); 0 means all
     *        vertices coincide and only the first one is tested
     * @param x Query x
     * @param y Query y
     * @param best Best candidate found so far
     * @return The better of best and the closest point on the ring
     */
    ClosestPoint assign_closest_point(const FlatRing &ring, double max_delta, double x, double y, ClosestPoint best);

    /**
     * @brief Closest point on the ring boundary, gated by the ring extent
     *
     * If the extent is already farther than best the ring is not walked at all.
     */
    ClosestPoint find_closest(const FlatRing &ring, const datapod::AABB &extent, double max_delta, double x, double y,
                              ClosestPoint best);

    /**
     * @brief max_delta memoized per buffer revision
     *
     * Readers share the lock; a stale entry is recomputed outside the lock and published under
     * the exclusive lock. Two threads racing on the same revision compute the same value.
     */
    class MaxDeltaCache {
      public:
        MaxDeltaCache() = default;
        MaxDeltaCache(const MaxDeltaCache &other);
        MaxDeltaCache &operator=(const MaxDeltaCache &other);

        /**
         * @brief max_delta of ring, recomputed if revision differs from the cached one
         */
        double get(const FlatRing &ring, std::uint64_t revision) const;

        /**
         * @brief Revision the cached value belongs to, if any
         */
        bool holds(std::uint64_t revision) const;

        /// Number of times the value was actually computed
        std::uint64_t computations() const;

      private:
        mutable std::shared_mutex mutex_;
        mutable bool valid_ = false;
        mutable std::uint64_t revision_ = 0;
        mutable double max_delta_ = 0.0;
        mutable std::uint64_t computations_ = 0;
    };

} // namespace flatring
