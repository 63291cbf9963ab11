#include "flatring/simplify.hpp"

#include <stdexcept>
#include <utility>

namespace flatring {

    namespace {

        inline double squared_segment_distance(double x, double y, double x1, double y1, double x2, double y2) {
            const double dx = x2 - x1;
            const double dy = y2 - y1;
            if (dx != 0.0 || dy != 0.0) {
                const double t = ((x - x1) * dx + (y - y1) * dy) / (dx * dx + dy * dy);
                if (t > 1.0) {
                    x1 = x2;
                    y1 = y2;
                } else if (t > 0.0) {
                    x1 += dx * t;
                    y1 += dy * t;
                }
            }
            const double ex = x - x1;
            const double ey = y - y1;
            return ex * ex + ey * ey;
        }

        inline void copy_xy(const std::vector<double> &flat, std::size_t offset, std::size_t end, std::size_t stride,
                            std::vector<double> &out) {
            for (; offset < end; offset += stride) {
                out.push_back(flat[offset]);
                out.push_back(flat[offset + 1]);
            }
        }

    } // namespace

    void douglas_peucker(const std::vector<double> &flat, std::size_t offset, std::size_t end, std::size_t stride,
                         double squared_tolerance, std::vector<double> &out) {
        const std::size_t n = (end - offset) / stride;
        if (n < 3) {
            copy_xy(flat, offset, end, stride, out);
            return;
        }

        std::vector<char> keep(n, 0);
        keep[0] = 1;
        keep[n - 1] = 1;

        // Pending sub-ranges as pairs of vertex indices; both ends are already kept
        std::vector<std::pair<std::size_t, std::size_t>> stack;
        stack.emplace_back(0, n - 1);
        while (!stack.empty()) {
            const auto [first, last] = stack.back();
            stack.pop_back();

            const double x1 = flat[offset + first * stride];
            const double y1 = flat[offset + first * stride + 1];
            const double x2 = flat[offset + last * stride];
            const double y2 = flat[offset + last * stride + 1];

            double max_squared_distance = 0.0;
            std::size_t index = first;
            for (std::size_t i = first + 1; i < last; ++i) {
                const double d =
                    squared_segment_distance(flat[offset + i * stride], flat[offset + i * stride + 1], x1, y1, x2, y2);
                // Strict comparison keeps the lowest index among equal maxima
                if (d > max_squared_distance) {
                    index = i;
                    max_squared_distance = d;
                }
            }

            if (max_squared_distance > squared_tolerance) {
                keep[index] = 1;
                if (first + 1 < index) {
                    stack.emplace_back(first, index);
                }
                if (index + 1 < last) {
                    stack.emplace_back(index, last);
                }
            }
        }

        for (std::size_t i = 0; i < n; ++i) {
            if (keep[i]) {
                out.push_back(flat[offset + i * stride]);
                out.push_back(flat[offset + i * stride + 1]);
            }
        }
    }

    FlatRing simplify(const FlatRing &ring, double squared_tolerance) {
        if (squared_tolerance < 0.0) {
            throw std::invalid_argument("negative squared tolerance");
        }

        const auto &flat = ring.flat_coordinates();
        std::vector<double> simplified;
        simplified.reserve(ring.vertex_count() * 2);

        if (squared_tolerance == 0.0) {
            copy_xy(flat, 0, flat.size(), ring.stride(), simplified);
        } else {
            douglas_peucker(flat, 0, flat.size(), ring.stride(), squared_tolerance, simplified);
        }

        return FlatRing(Layout::XY, std::move(simplified));
    }

} // namespace flatring
