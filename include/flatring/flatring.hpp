#pragma once

/**
 * @file flatring.hpp
 * @brief Flat-buffer ring geometry
 *
 * Includes:
 * - layout.hpp: coordinate layouts and their strides
 * - flat_ring.hpp: the flat vertex buffer
 * - extent.hpp: bounding boxes and point-to-box distance
 * - area.hpp: signed area
 * - closest.hpp: closest point on the ring boundary
 * - simplify.hpp: Douglas-Peucker simplification
 * - ring.hpp: ring owning its buffer, extent and revision
 * - utils/utils.hpp: closing rings, datapod polygon conversion
 */

#include "flatring/area.hpp"
#include "flatring/closest.hpp"
#include "flatring/errors.hpp"
#include "flatring/extent.hpp"
#include "flatring/flat_ring.hpp"
#include "flatring/layout.hpp"
#include "flatring/ring.hpp"
#include "flatring/simplify.hpp"
#include "flatring/utils/utils.hpp"
