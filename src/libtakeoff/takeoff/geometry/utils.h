// =====================================================================
//  src/libtakeoff/takeoff/geometry/utils.h — Geometry kernel
// =====================================================================
//
//  Pure numeric functions over ordered vertex lists: area, perimeter,
//  distances and containment.  Every function is total for finite
//  input.  Degenerate sequences (too few points for the operation)
//  yield 0 rather than an error, since in-progress annotations
//  legitimately have 0-2 points.
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_GEOMETRY_UTILS_H
#define TAKEOFF_GEOMETRY_UTILS_H

#include "types.h"

namespace takeoff {
namespace geometry {

// =====================================================================
//  Vector Operations
// =====================================================================

/// Compute the dot product of two vectors (as QPointF)
TAKEOFF_EXPORT double dot(const QPointF& a, const QPointF& b);

/// Compute the cross product (z-component) of two 2D vectors
TAKEOFF_EXPORT double cross(const QPointF& a, const QPointF& b);

/// Compute the length of a vector
TAKEOFF_EXPORT double length(const QPointF& v);

/// Compute the squared length of a vector (faster, no sqrt)
TAKEOFF_EXPORT double lengthSquared(const QPointF& v);

/// Linear interpolation between two points
TAKEOFF_EXPORT QPointF lerp(const QPointF& a, const QPointF& b, double t);

// =====================================================================
//  Distance Operations
// =====================================================================

/// Euclidean distance between two points
TAKEOFF_EXPORT double distance(const QPointF& p1, const QPointF& p2);

/// Project a point onto segment [a,b], returning the clamped
/// parameter t in [0,1].  Returns 0 when a == b.
TAKEOFF_EXPORT double projectPointOnSegment(
    const QPointF& point,
    const QPointF& a, const QPointF& b);

/// Distance from p to the closest point on segment [a,b].
/// A degenerate segment (a == b) reduces to point-to-point distance.
TAKEOFF_EXPORT double pointToSegmentDistance(
    const QPointF& p,
    const QPointF& a, const QPointF& b);

// =====================================================================
//  Polygon Operations
// =====================================================================

/// Signed shoelace area (positive = CCW in a y-up frame).
/// Returns 0 for fewer than 3 points.
TAKEOFF_EXPORT double signedPolygonArea(const VertexSequence& polygon);

/// Unsigned polygon area over the closed loop (last wraps to first).
/// Independent of winding direction and starting vertex.
/// Returns 0 for fewer than 3 points.
TAKEOFF_EXPORT double polygonArea(const VertexSequence& polygon);

/// Check if a polygon's signed area is positive
TAKEOFF_EXPORT bool polygonIsCCW(const VertexSequence& polygon);

/// Sum of consecutive edge lengths.  When closed is true the
/// last-to-first edge is included.  Returns 0 for fewer than 2 points.
///
/// Rooms are closed loops; wall runs and linear measurements are open.
TAKEOFF_EXPORT double perimeter(const VertexSequence& points, bool closed);

/// Check if a point is inside a polygon (using ray casting)
TAKEOFF_EXPORT bool pointInPolygon(
    const QPointF& point,
    const VertexSequence& polygon);

/// Compute the area centroid of a polygon.  Falls back to the vertex
/// average for zero-area input.
TAKEOFF_EXPORT QPointF polygonCentroid(const VertexSequence& polygon);

/// Point halfway along an open polyline (by arc length)
TAKEOFF_EXPORT QPointF pathMidpoint(const VertexSequence& points);

/// Compute the bounding box of a vertex sequence
TAKEOFF_EXPORT BoundingBox polygonBounds(const VertexSequence& polygon);

/// True if every coordinate is finite (no NaN or infinity)
TAKEOFF_EXPORT bool allFinite(const VertexSequence& points);

}  // namespace geometry
}  // namespace takeoff

#endif  // TAKEOFF_GEOMETRY_UTILS_H
