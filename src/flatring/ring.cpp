#include "flatring/ring.hpp"

#include <iostream>
#include <utility>

#include "flatring/area.hpp"
#include "flatring/simplify.hpp"
#include "flatring/utils/utils.hpp"

namespace flatring {

    Ring::Ring(const Coordinates &points, Layout layout) { set_coordinates(points, layout); }

    Ring::Ring(Layout layout, std::vector<double> flat) { set_flat_coordinates(layout, std::move(flat)); }

    void Ring::set_coordinates(const Coordinates &points, Layout layout) {
        if (!points.empty()) {
            resolve_layout(layout, points.front());
        }
        buffer_.set_from_nested_coordinates(points, layout);
        changed();
    }

    void Ring::set_coordinates(const Coordinates &points) {
        const Layout layout = points.empty() ? Layout::XY : layout_for_stride(points.front().size());
        set_coordinates(points, layout);
    }

    void Ring::set_flat_coordinates(Layout layout, std::vector<double> flat) {
        buffer_.set_flat_coordinates(layout, std::move(flat));
        changed();
    }

    void Ring::changed() {
        bounding_box_ = compute_extent(buffer_);
        ++revision_;

        if (buffer_.vertex_count() > 1 && !utils::is_closed(buffer_)) {
            std::cerr << "Warning: ring of " << buffer_.vertex_count()
                      << " vertices is not closed, the last vertex differs from the first" << std::endl;
        }
    }

    double Ring::signed_area() const { return flatring::signed_area(buffer_); }

    double Ring::area() const { return flatring::area(buffer_); }

    ClosestPoint Ring::closest_point_xy(double x, double y, ClosestPoint best) const {
        if (best.squared_distance < squared_distance_to_extent(bounding_box_, x, y)) {
            return best;
        }
        const double max_delta = max_delta_.get(buffer_, revision_);
        return assign_closest_point(buffer_, max_delta, x, y, best);
    }

    Ring Ring::simplified(double squared_tolerance) const {
        FlatRing simple = simplify(buffer_, squared_tolerance);
        return Ring(simple.layout(), simple.flat_coordinates());
    }

    Ring Ring::clone() const { return Ring(buffer_.layout(), buffer_.flat_coordinates()); }

    Ring create_ring(const Coordinates &points, Layout layout) { return Ring(utils::close_ring(points), layout); }

    ClosestPoint closest_point_on_rings(const std::vector<Ring> &rings, double x, double y, ClosestPoint best) {
        for (const auto &ring : rings) {
            best = ring.closest_point_xy(x, y, best);
        }
        return best;
    }

} // namespace flatring
