#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include <datapod/datapod.hpp>

#include "flatring/errors.hpp"
#include "flatring/layout.hpp"

namespace flatring {

    /**
     * @brief Closed ring stored as one contiguous run of numbers
     *
     * Vertex i occupies [i * stride, (i + 1) * stride). By convention the last vertex repeats
     * the first one; nothing here enforces that, the algorithms only assume it.
     * The buffer is replaced wholesale, never edited vertex by vertex.
     */
    class FlatRing {
      public:
        FlatRing() = default;

        /**
         * @brief Build from vertex tuples, stride taken from the layout
         */
        FlatRing(const Coordinates &points, Layout layout);

        /**
         * @brief Adopt an already flat sequence
         */
        FlatRing(Layout layout, std::vector<double> flat);

        /**
         * @brief Replace the buffer with the flattened tuples
         *
         * Every tuple must carry exactly stride numbers. The old buffer is only dropped once the
         * new one is complete, so a failure leaves this ring as it was.
         *
         * @param points Vertex tuples in ring order
         * @param stride Components per vertex (2 -> XY, 3 -> XYZ, 4 -> XYZM)
         * @throws InvalidLayout if stride is not 2, 3 or 4
         * @throws InvalidCoordinate if a tuple has the wrong number of components
         */
        void set_from_nested_coordinates(const Coordinates &points, std::size_t stride);
        void set_from_nested_coordinates(const Coordinates &points, Layout layout);

        /**
         * @brief Replace the buffer with an already flat sequence
         *
         * @throws InvalidCoordinate if flat.size() is not a multiple of the stride
         */
        void set_flat_coordinates(Layout layout, std::vector<double> flat);

        /**
         * @brief Expand the buffer back into one tuple per vertex
         */
        Coordinates to_nested_coordinates() const;

        std::size_t vertex_count() const { return coordinates_.size() / info_.stride; }
        bool empty() const { return coordinates_.empty(); }
        std::size_t stride() const { return info_.stride; }
        Layout layout() const { return info_.layout; }
        const LayoutInfo &layout_info() const { return info_; }
        const std::vector<double> &flat_coordinates() const { return coordinates_; }

        double x(std::size_t i) const { return coordinates_[i * info_.stride]; }
        double y(std::size_t i) const { return coordinates_[i * info_.stride + 1]; }

        /**
         * @brief Buffer offsets of the vertices bounding edge i: (i, (i + 1) mod n)
         *
         * @throws std::out_of_range if i >= vertex_count()
         */
        std::pair<std::size_t, std::size_t> edge_offsets(std::size_t i) const;

        /**
         * @brief Edge i as a segment; z is filled when the layout has one
         */
        datapod::Segment edge_at(std::size_t i) const;

      private:
        datapod::Point point_at_offset(std::size_t offset) const;

        std::vector<double> coordinates_;
        LayoutInfo info_{};
    };

} // namespace flatring
