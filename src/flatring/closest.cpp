#include "flatring/closest.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

#include "flatring/extent.hpp"

namespace flatring {

    namespace {

        inline double squared_distance(double x1, double y1, double x2, double y2) {
            const double dx = x2 - x1;
            const double dy = y2 - y1;
            return dx * dx + dy * dy;
        }

        // Closest point of segment [offset1, offset2] to (x, y), projection parameter clamped to [0, 1].
        inline datapod::Point closest_on_segment(const std::vector<double> &flat, std::size_t offset1,
                                                 std::size_t offset2, double x, double y) {
            const double x1 = flat[offset1];
            const double y1 = flat[offset1 + 1];
            const double dx = flat[offset2] - x1;
            const double dy = flat[offset2 + 1] - y1;
            if (dx == 0.0 && dy == 0.0) {
                return datapod::Point{x1, y1, 0.0};
            }

            const double t = ((x - x1) * dx + (y - y1) * dy) / (dx * dx + dy * dy);
            if (t > 1.0) {
                return datapod::Point{flat[offset2], flat[offset2 + 1], 0.0};
            }
            if (t > 0.0) {
                return datapod::Point{x1 + dx * t, y1 + dy * t, 0.0};
            }
            return datapod::Point{x1, y1, 0.0};
        }

    } // namespace

    double max_squared_delta(const FlatRing &ring) {
        const std::size_t n = ring.vertex_count();
        const auto &flat = ring.flat_coordinates();

        double max_squared = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            const auto [start, end] = ring.edge_offsets(i);
            const double d = squared_distance(flat[start], flat[start + 1], flat[end], flat[end + 1]);
            if (d > max_squared) {
                max_squared = d;
            }
        }
        return max_squared;
    }

    ClosestPoint assign_closest_point(const FlatRing &ring, double max_delta, double x, double y, ClosestPoint best) {
        const std::size_t n = ring.vertex_count();
        if (n == 0) {
            return best;
        }

        const auto &flat = ring.flat_coordinates();

        if (max_delta == 0.0) {
            // Every vertex sits on the same spot
            const double d = squared_distance(x, y, flat[0], flat[1]);
            if (d < best.squared_distance) {
                best.point = datapod::Point{flat[0], flat[1], 0.0};
                best.squared_distance = d;
            }
            return best;
        }

        std::size_t i = 0;
        while (i < n) {
            const auto [start, end] = ring.edge_offsets(i);
            const datapod::Point candidate = closest_on_segment(flat, start, end, x, y);
            const double d = squared_distance(x, y, candidate.x, candidate.y);
            if (d < best.squared_distance) {
                best.point = candidate;
                best.squared_distance = d;
                ++i;
                continue;
            }

            // The next k edges all lie within k * max_delta of the end of this one, which is at
            // least sqrt(d) away, so none of them can beat best before k reaches this bound.
            const double skip = (std::sqrt(d) - std::sqrt(best.squared_distance)) / max_delta;
            if (skip >= static_cast<double>(n - i)) {
                break;
            }
            // NaN and anything below one edge (infinite query, NaN vertex) advance by one
            if (!(skip >= 1.0)) {
                ++i;
                continue;
            }
            i += static_cast<std::size_t>(skip);
        }
        return best;
    }

    ClosestPoint find_closest(const FlatRing &ring, const datapod::AABB &extent, double max_delta, double x, double y,
                              ClosestPoint best) {
        if (best.squared_distance < squared_distance_to_extent(extent, x, y)) {
            return best;
        }
        return assign_closest_point(ring, max_delta, x, y, best);
    }

    MaxDeltaCache::MaxDeltaCache(const MaxDeltaCache &other) {
        std::shared_lock lock(other.mutex_);
        valid_ = other.valid_;
        revision_ = other.revision_;
        max_delta_ = other.max_delta_;
        computations_ = other.computations_;
    }

    MaxDeltaCache &MaxDeltaCache::operator=(const MaxDeltaCache &other) {
        if (this == &other) {
            return *this;
        }
        std::unique_lock lock(mutex_, std::defer_lock);
        std::shared_lock other_lock(other.mutex_, std::defer_lock);
        std::lock(lock, other_lock);
        valid_ = other.valid_;
        revision_ = other.revision_;
        max_delta_ = other.max_delta_;
        computations_ = other.computations_;
        return *this;
    }

    double MaxDeltaCache::get(const FlatRing &ring, std::uint64_t revision) const {
        {
            std::shared_lock lock(mutex_);
            if (valid_ && revision_ == revision) {
                return max_delta_;
            }
        }

        const double computed = std::sqrt(max_squared_delta(ring));

        std::unique_lock lock(mutex_);
        valid_ = true;
        revision_ = revision;
        max_delta_ = computed;
        ++computations_;
        return computed;
    }

    bool MaxDeltaCache::holds(std::uint64_t revision) const {
        std::shared_lock lock(mutex_);
        return valid_ && revision_ == revision;
    }

    std::uint64_t MaxDeltaCache::computations() const {
        std::shared_lock lock(mutex_);
        return computations_;
    }

} // namespace flatring
