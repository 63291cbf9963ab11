#include <cmath>
#include <iomanip>
#include <iostream>
#include <vector>

#include <datapod/datapod.hpp>

#include "flatring/flatring.hpp"

int main() {
    // Field boundary in local ENU metres, the last vertex is left open on purpose
    datapod::Polygon poly;
    poly.vertices.push_back(datapod::Point{-136.5, -209.3, 0.0});
    poly.vertices.push_back(datapod::Point{-16.8, -152.5, 0.0});
    poly.vertices.push_back(datapod::Point{-122.5, 34.3, 0.0});
    poly.vertices.push_back(datapod::Point{-3.8, 120.5, 0.0});
    poly.vertices.push_back(datapod::Point{-79.2, 170.8, 0.0});
    poly.vertices.push_back(datapod::Point{-198.5, 58.3, 0.0});
    poly.vertices.push_back(datapod::Point{-139.8, -87.2, 0.0});

    flatring::FlatRing open = flatring::utils::from_polygon(poly);
    flatring::Ring boundary = flatring::create_ring(open.to_nested_coordinates(), flatring::Layout::XY);

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Boundary: " << boundary.vertex_count() << " vertices, revision " << boundary.revision() << "\n";
    std::cout << "Signed area: " << boundary.signed_area() << " m^2 ("
              << (flatring::is_ccw(boundary.buffer()) ? "CCW" : "CW") << ")\n";

    const auto &box = boundary.bounding_box();
    std::cout << "Extent: [" << box.min_point.x << ", " << box.min_point.y << "] - [" << box.max_point.x << ", "
              << box.max_point.y << "]\n";

    // A second ring, so the query fans out and keeps a running best
    std::vector<flatring::Ring> rings;
    rings.push_back(boundary);
    rings.push_back(flatring::create_ring({{0.0, 0.0}, {40.0, 0.0}, {40.0, 40.0}, {0.0, 40.0}}, flatring::Layout::XY));

    const double queries[][2] = {{0.0, 0.0}, {-250.0, 0.0}, {-60.0, -20.0}, {100.0, 100.0}};
    for (const auto &q : queries) {
        auto closest = flatring::closest_point_on_rings(rings, q[0], q[1]);
        std::cout << "Closest to (" << q[0] << ", " << q[1] << "): (" << closest.point.x << ", " << closest.point.y
                  << ") at " << std::sqrt(closest.squared_distance) << " m\n";
    }

    for (double tolerance : {0.0, 10.0, 50.0, 100.0}) {
        auto simple = boundary.simplified(tolerance * tolerance);
        std::cout << "Simplified at " << tolerance << " m: " << simple.vertex_count() << " vertices, area "
                  << simple.area() << " m^2\n";
    }

    try {
        flatring::Ring bad;
        bad.set_coordinates({{0.0, 0.0}, {1.0, 0.0, 2.0}, {0.0, 0.0}}, flatring::Layout::XY);
    } catch (const flatring::InvalidCoordinate &e) {
        std::cerr << "Rejected ring: " << e.what() << std::endl;
    }

    return 0;
}
