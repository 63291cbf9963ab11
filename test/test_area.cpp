#include "doctest/doctest.h"
#include "flatring/area.hpp"
#include "flatring/utils/utils.hpp"

#include <algorithm>

namespace {

    // Rotate the start vertex of a closed ring by k, keeping it closed
    flatring::Coordinates rotate_closed(const flatring::Coordinates &closed, std::size_t k) {
        flatring::Coordinates open(closed.begin(), closed.end() - 1);
        std::rotate(open.begin(), open.begin() + static_cast<std::ptrdiff_t>(k % open.size()), open.end());
        return flatring::utils::close_ring(open);
    }

    flatring::Coordinates pentagon() {
        return {{0.0, 0.0}, {4.0, 0.0}, {5.0, 3.0}, {2.0, 5.0}, {-1.0, 3.0}, {0.0, 0.0}};
    }

} // namespace

TEST_CASE("Signed area of the unit square") {
    flatring::FlatRing square({{0.0, 0.0}, {0.0, 1.0}, {1.0, 1.0}, {1.0, 0.0}, {0.0, 0.0}}, flatring::Layout::XY);

    CHECK(std::abs(flatring::signed_area(square)) == doctest::Approx(1.0));
    // (0,0) -> (0,1) -> (1,1) runs clockwise
    CHECK(flatring::signed_area(square) == doctest::Approx(-1.0));
    CHECK_FALSE(flatring::is_ccw(square));
    CHECK(flatring::area(square) == doctest::Approx(1.0));
}

TEST_CASE("Rings with fewer than 3 vertices have no area") {
    CHECK(flatring::signed_area(flatring::FlatRing{}) == 0.0);
    CHECK(flatring::signed_area(flatring::FlatRing({{3.0, 4.0}}, flatring::Layout::XY)) == 0.0);
    CHECK(flatring::signed_area(flatring::FlatRing({{3.0, 4.0}, {5.0, 9.0}}, flatring::Layout::XY)) == 0.0);
}

TEST_CASE("Signed area under rotation and reversal") {
    auto points = pentagon();
    flatring::FlatRing ring(points, flatring::Layout::XY);
    const double expected = flatring::signed_area(ring);
    CHECK(expected > 0.0);

    for (std::size_t k = 1; k < points.size() - 1; ++k) {
        flatring::FlatRing rotated(rotate_closed(points, k), flatring::Layout::XY);
        CHECK(flatring::signed_area(rotated) == doctest::Approx(expected));
    }

    flatring::Coordinates reversed(points.rbegin(), points.rend());
    flatring::FlatRing backwards(reversed, flatring::Layout::XY);
    CHECK(flatring::signed_area(backwards) == doctest::Approx(-expected));
}

TEST_CASE("Area ignores Z and M") {
    flatring::FlatRing flat2d({{0.0, 0.0}, {3.0, 0.0}, {3.0, 2.0}, {0.0, 2.0}, {0.0, 0.0}}, flatring::Layout::XY);
    flatring::FlatRing flat4d({{0.0, 0.0, 10.0, 1.0},
                               {3.0, 0.0, -4.0, 2.0},
                               {3.0, 2.0, 99.0, 3.0},
                               {0.0, 2.0, 7.0, 4.0},
                               {0.0, 0.0, 10.0, 1.0}},
                              flatring::Layout::XYZM);

    CHECK(flatring::signed_area(flat2d) == doctest::Approx(6.0));
    CHECK(flatring::signed_area(flat4d) == doctest::Approx(6.0));
}

TEST_CASE("Self-touching ring") {
    // Two triangles sharing the vertex (2,2); both wound counter-clockwise
    flatring::FlatRing bowtie({{0.0, 0.0}, {4.0, 0.0}, {2.0, 2.0}, {4.0, 4.0}, {0.0, 4.0}, {2.0, 2.0}, {0.0, 0.0}},
                              flatring::Layout::XY);
    CHECK(flatring::signed_area(bowtie) == doctest::Approx(8.0));
}
