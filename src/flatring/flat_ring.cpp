#include "flatring/flat_ring.hpp"

#include <stdexcept>
#include <string>

namespace flatring {

    FlatRing::FlatRing(const Coordinates &points, Layout layout) { set_from_nested_coordinates(points, layout); }

    FlatRing::FlatRing(Layout layout, std::vector<double> flat) { set_flat_coordinates(layout, std::move(flat)); }

    void FlatRing::set_from_nested_coordinates(const Coordinates &points, std::size_t stride) {
        set_from_nested_coordinates(points, layout_for_stride(stride));
    }

    void FlatRing::set_from_nested_coordinates(const Coordinates &points, Layout layout) {
        const LayoutInfo info = flatring::layout_info(layout);

        std::vector<double> flat;
        flat.reserve(points.size() * info.stride);
        for (std::size_t i = 0; i < points.size(); ++i) {
            const auto &point = points[i];
            if (point.size() != info.stride) {
                throw InvalidCoordinate("vertex " + std::to_string(i) + " has " + std::to_string(point.size()) +
                                        " components, layout " + to_string(layout) + " needs " +
                                        std::to_string(info.stride));
            }
            flat.insert(flat.end(), point.begin(), point.end());
        }

        coordinates_.swap(flat);
        info_ = info;
    }

    void FlatRing::set_flat_coordinates(Layout layout, std::vector<double> flat) {
        const LayoutInfo info = flatring::layout_info(layout);
        if (flat.size() % info.stride != 0) {
            throw InvalidCoordinate("flat buffer of " + std::to_string(flat.size()) +
                                    " numbers is not a multiple of stride " + std::to_string(info.stride));
        }
        coordinates_ = std::move(flat);
        info_ = info;
    }

    Coordinates FlatRing::to_nested_coordinates() const {
        Coordinates points;
        points.reserve(vertex_count());
        for (std::size_t offset = 0; offset < coordinates_.size(); offset += info_.stride) {
            points.emplace_back(coordinates_.begin() + static_cast<std::ptrdiff_t>(offset),
                                coordinates_.begin() + static_cast<std::ptrdiff_t>(offset + info_.stride));
        }
        return points;
    }

    std::pair<std::size_t, std::size_t> FlatRing::edge_offsets(std::size_t i) const {
        const std::size_t n = vertex_count();
        if (i >= n) {
            throw std::out_of_range("edge " + std::to_string(i) + " out of range for ring of " + std::to_string(n) +
                                    " vertices");
        }
        return {i * info_.stride, ((i + 1) % n) * info_.stride};
    }

    datapod::Segment FlatRing::edge_at(std::size_t i) const {
        const auto [start, end] = edge_offsets(i);
        return datapod::Segment{point_at_offset(start), point_at_offset(end)};
    }

    datapod::Point FlatRing::point_at_offset(std::size_t offset) const {
        const double z = info_.has_z ? coordinates_[offset + info_.z_index] : 0.0;
        return datapod::Point{coordinates_[offset], coordinates_[offset + 1], z};
    }

} // namespace flatring
