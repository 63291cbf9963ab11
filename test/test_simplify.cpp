#include "doctest/doctest.h"
#include "flatring/simplify.hpp"

#include <stdexcept>
#include <vector>

namespace {

    // Square with a slight bump on the bottom side
    flatring::FlatRing bumped_square() {
        return flatring::FlatRing({{0.0, 0.0}, {1.0, 0.01}, {2.0, 0.0}, {2.0, 2.0}, {0.0, 2.0}, {0.0, 0.0}},
                                  flatring::Layout::XY);
    }

    flatring::FlatRing wiggly_ring() {
        flatring::Coordinates points{{0.0, 0.0},  {1.0, 0.2},  {2.0, -0.1}, {3.0, 0.4},  {4.0, 0.0},  {4.3, 1.0},
                                     {3.9, 2.0},  {4.1, 3.0},  {4.0, 4.0},  {3.0, 4.05}, {2.0, 3.7},  {1.0, 4.2},
                                     {0.0, 4.0},  {0.2, 3.0},  {-0.3, 2.0}, {0.1, 1.0},  {0.0, 0.0}};
        return flatring::FlatRing(points, flatring::Layout::XY);
    }

} // namespace

TEST_CASE("Simplify removes vertices within tolerance") {
    auto ring = bumped_square();

    SUBCASE("Bump below tolerance") {
        auto simple = flatring::simplify(ring, 0.5);
        flatring::Coordinates expected{{0.0, 0.0}, {2.0, 0.0}, {2.0, 2.0}, {0.0, 2.0}, {0.0, 0.0}};
        CHECK(simple.to_nested_coordinates() == expected);
        CHECK(simple.layout() == flatring::Layout::XY);
    }

    SUBCASE("Bump above tolerance") {
        auto simple = flatring::simplify(ring, 0.00001);
        CHECK(simple.vertex_count() == 6);
    }

    SUBCASE("Everything within tolerance") {
        auto simple = flatring::simplify(ring, 10.0);
        flatring::Coordinates expected{{0.0, 0.0}, {0.0, 0.0}};
        CHECK(simple.to_nested_coordinates() == expected);
    }

    // Input is left untouched
    CHECK(ring.vertex_count() == 6);
}

TEST_CASE("Zero tolerance keeps every vertex") {
    auto ring = wiggly_ring();
    auto simple = flatring::simplify(ring, 0.0);
    CHECK(simple.vertex_count() == ring.vertex_count());
    CHECK(simple.flat_coordinates() == ring.flat_coordinates());

    SUBCASE("Collinear and repeated vertices survive too") {
        flatring::FlatRing line({{0.0, 0.0}, {1.0, 0.0}, {1.0, 0.0}, {2.0, 0.0}, {2.0, 1.0}, {0.0, 0.0}},
                                flatring::Layout::XY);
        CHECK(flatring::simplify(line, 0.0).vertex_count() == 6);
    }
}

TEST_CASE("Simplified output is always XY") {
    flatring::FlatRing ring({{0.0, 0.0, 1.0, 10.0},
                             {1.0, 0.01, 2.0, 11.0},
                             {2.0, 0.0, 3.0, 12.0},
                             {2.0, 2.0, 4.0, 13.0},
                             {0.0, 2.0, 5.0, 14.0},
                             {0.0, 0.0, 1.0, 10.0}},
                            flatring::Layout::XYZM);

    auto unchanged = flatring::simplify(ring, 0.0);
    CHECK(unchanged.stride() == 2);
    flatring::Coordinates expected{{0.0, 0.0}, {1.0, 0.01}, {2.0, 0.0}, {2.0, 2.0}, {0.0, 2.0}, {0.0, 0.0}};
    CHECK(unchanged.to_nested_coordinates() == expected);

    auto simple = flatring::simplify(ring, 0.5);
    CHECK(simple.stride() == 2);
    CHECK(simple.vertex_count() == 5);
}

TEST_CASE("Tiny rings are returned as they are") {
    flatring::FlatRing empty;
    CHECK(flatring::simplify(empty, 1.0).empty());

    flatring::FlatRing single({{1.0, 2.0, 3.0}}, flatring::Layout::XYZ);
    auto s1 = flatring::simplify(single, 1.0);
    CHECK(s1.to_nested_coordinates() == flatring::Coordinates{{1.0, 2.0}});

    flatring::FlatRing pair({{1.0, 2.0}, {5.0, 6.0}}, flatring::Layout::XY);
    auto s2 = flatring::simplify(pair, 100.0);
    CHECK(s2.flat_coordinates() == pair.flat_coordinates());
}

TEST_CASE("First and last vertex are always kept") {
    auto ring = wiggly_ring();
    const std::size_t last = ring.vertex_count() - 1;
    for (double tolerance : {0.0, 0.01, 0.1, 0.5, 1.0, 4.0, 100.0}) {
        auto simple = flatring::simplify(ring, tolerance);
        REQUIRE(simple.vertex_count() >= 2);
        const std::size_t simple_last = simple.vertex_count() - 1;
        CHECK(simple.x(0) == ring.x(0));
        CHECK(simple.y(0) == ring.y(0));
        CHECK(simple.x(simple_last) == ring.x(last));
        CHECK(simple.y(simple_last) == ring.y(last));
    }
}

TEST_CASE("Vertex count does not grow with tolerance") {
    auto ring = wiggly_ring();
    std::size_t previous = ring.vertex_count();
    for (double tolerance : {0.0, 0.001, 0.01, 0.05, 0.1, 0.2, 0.5, 1.0, 2.0, 5.0, 50.0}) {
        std::size_t count = flatring::simplify(ring, tolerance).vertex_count();
        CHECK(count <= previous);
        previous = count;
    }
    CHECK(previous == 2);
}

TEST_CASE("Retained vertices keep input order") {
    auto ring = wiggly_ring();
    auto simple = flatring::simplify(ring, 0.05);

    std::size_t cursor = 0;
    for (std::size_t i = 0; i < simple.vertex_count(); ++i) {
        while (cursor < ring.vertex_count() && (ring.x(cursor) != simple.x(i) || ring.y(cursor) != simple.y(i))) {
            ++cursor;
        }
        CHECK(cursor < ring.vertex_count());
        ++cursor;
    }
}

TEST_CASE("Equal distances favour the lower index") {
    // (1,1) and (2,1) are both 1 away from the chord (0,0)-(3,0)
    std::vector<double> flat{0.0, 0.0, 1.0, 1.0, 2.0, 1.0, 3.0, 0.0};
    std::vector<double> out;
    flatring::douglas_peucker(flat, 0, flat.size(), 2, 0.5, out);
    CHECK(out == std::vector<double>{0.0, 0.0, 1.0, 1.0, 3.0, 0.0});
}

TEST_CASE("Douglas-Peucker on a sub-range with stride") {
    // Two XYZ vertices of padding on each side
    std::vector<double> flat{9.0, 9.0, 9.0, 0.0, 0.0, 1.0, 5.0, 0.1, 1.0, 10.0, 0.0, 1.0, 9.0, 9.0, 9.0};
    std::vector<double> out{-1.0, -1.0};
    flatring::douglas_peucker(flat, 3, 12, 3, 1.0, out);
    CHECK(out == std::vector<double>{-1.0, -1.0, 0.0, 0.0, 10.0, 0.0});
}

TEST_CASE("Negative tolerance is rejected") {
    auto ring = bumped_square();
    CHECK_THROWS_AS(flatring::simplify(ring, -1.0), std::invalid_argument);
}
