#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "flatring/errors.hpp"

namespace flatring {

    /**
     * @brief Named per-vertex coordinate layout
     */
    enum class Layout : std::uint8_t {
        XY,   ///< x, y
        XYZ,  ///< x, y, z
        XYM,  ///< x, y, measure
        XYZM, ///< x, y, z, measure
    };

    /**
     * @brief Resolved shape of a layout
     *
     * z_index and m_index are offsets inside one vertex; they are only meaningful when
     * has_z / has_m are set.
     */
    struct LayoutInfo {
        Layout layout = Layout::XY;
        std::size_t stride = 2;
        bool has_z = false;
        bool has_m = false;
        std::size_t z_index = 0;
        std::size_t m_index = 0;
    };

    /// A single vertex tuple, 2 to 4 numbers
    using Coordinate = std::vector<double>;
    using Coordinates = std::vector<Coordinate>;

    inline std::string to_string(Layout layout) {
        switch (layout) {
        case Layout::XY:
            return "XY";
        case Layout::XYZ:
            return "XYZ";
        case Layout::XYM:
            return "XYM";
        case Layout::XYZM:
            return "XYZM";
        }
        return "unknown(" + std::to_string(static_cast<int>(layout)) + ")";
    }

    /**
     * @brief Resolve a layout tag to its stride and Z/M positions
     *
     * @throws InvalidLayout if the tag is not one of the known enumerators
     */
    inline LayoutInfo layout_info(Layout layout) {
        switch (layout) {
        case Layout::XY:
            return LayoutInfo{Layout::XY, 2, false, false, 0, 0};
        case Layout::XYZ:
            return LayoutInfo{Layout::XYZ, 3, true, false, 2, 0};
        case Layout::XYM:
            return LayoutInfo{Layout::XYM, 3, false, true, 0, 2};
        case Layout::XYZM:
            return LayoutInfo{Layout::XYZM, 4, true, true, 2, 3};
        }
        throw InvalidLayout("unrecognized layout " + to_string(layout));
    }

    /**
     * @brief Resolve a layout tag against a sample vertex
     *
     * @param layout Requested layout
     * @param sample A vertex tuple the layout will be applied to
     * @return Stride and Z/M flags of the layout
     * @throws InvalidLayout if the tag is unknown or the sample has a different number of components
     */
    inline LayoutInfo resolve_layout(Layout layout, const Coordinate &sample) {
        LayoutInfo info = layout_info(layout);
        if (sample.size() != info.stride) {
            throw InvalidLayout("layout " + to_string(layout) + " expects " + std::to_string(info.stride) +
                                " components, sample has " + std::to_string(sample.size()));
        }
        return info;
    }

    /**
     * @brief Default layout for a stride: 2 -> XY, 3 -> XYZ, 4 -> XYZM
     *
     * A stride of 3 is read as XYZ; measured 3D data has to name XYM explicitly.
     */
    inline Layout layout_for_stride(std::size_t stride) {
        switch (stride) {
        case 2:
            return Layout::XY;
        case 3:
            return Layout::XYZ;
        case 4:
            return Layout::XYZM;
        default:
            throw InvalidLayout("unsupported stride " + std::to_string(stride));
        }
    }

    inline Layout parse_layout(std::string_view name) {
        if (name == "XY")
            return Layout::XY;
        if (name == "XYZ")
            return Layout::XYZ;
        if (name == "XYM")
            return Layout::XYM;
        if (name == "XYZM")
            return Layout::XYZM;
        throw InvalidLayout("unrecognized layout name '" + std::string(name) + "'");
    }

} // namespace flatring
