// =====================================================================
//  src/libtakeoff/takeoff/geometry/types.h — Basic geometry types
// =====================================================================
//
//  Fundamental geometric types used throughout libtakeoff.  All
//  coordinates are in image pixel space (origin top-left, y down).
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_GEOMETRY_TYPES_H
#define TAKEOFF_GEOMETRY_TYPES_H

#include "../core.h"

#include <QPointF>
#include <QVector>
#include <QtMath>

namespace takeoff {
namespace geometry {

// =====================================================================
//  Constants
// =====================================================================

/// Default tolerance for geometric comparisons (in pixels)
constexpr double DEFAULT_TOLERANCE = 1e-9;

/// Regions with less area than this (in square pixels) are degenerate
constexpr double MIN_REGION_AREA = 1e-6;

// =====================================================================
//  Vertex Sequences
// =====================================================================

/// Ordered vertex list.  Treated as a closed polygon by area
/// operations and as an open polyline or closed loop by perimeter
/// operations, depending on the caller.
using VertexSequence = QVector<QPointF>;

// =====================================================================
//  Bounding Box
// =====================================================================

/// Axis-aligned bounding box with utility methods
struct BoundingBox {
    double minX = 0.0;
    double minY = 0.0;
    double maxX = 0.0;
    double maxY = 0.0;
    bool valid = false;

    BoundingBox() = default;
    BoundingBox(double x1, double y1, double x2, double y2);

    /// Box from a detector's center-based representation
    static BoundingBox fromCenter(double cx, double cy, double w, double h);

    /// Expand to include a point
    void include(const QPointF& point);

    /// Get center point
    QPointF center() const;

    /// Get width
    double width() const { return maxX - minX; }

    /// Get height
    double height() const { return maxY - minY; }

    /// Get area (0 for an invalid box)
    double area() const { return valid ? width() * height() : 0.0; }

    /// Corners in clockwise screen order starting top-left
    VertexSequence toPolygon() const;

    /// Check if another box intersects
    bool intersects(const BoundingBox& other) const;
};

}  // namespace geometry
}  // namespace takeoff

#endif  // TAKEOFF_GEOMETRY_TYPES_H
