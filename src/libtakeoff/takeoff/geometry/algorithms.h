// =====================================================================
//  src/libtakeoff/takeoff/geometry/algorithms.h — Polygon overlap
// =====================================================================
//
//  Triangulation and clipping used to measure how much two detection
//  regions overlap.  Regions are simple polygons (not necessarily
//  convex), so overlap is computed by decomposing both polygons into
//  triangles and clipping every triangle pair, which is exact for
//  simple polygons.
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_GEOMETRY_ALGORITHMS_H
#define TAKEOFF_GEOMETRY_ALGORITHMS_H

#include "types.h"
#include "../core.h"

namespace takeoff {
namespace geometry {

// =====================================================================
//  Cleanup
// =====================================================================

/// Remove consecutive duplicate vertices (including a closing vertex
/// equal to the first one).
TAKEOFF_EXPORT VertexSequence removeDuplicateVertices(
    const VertexSequence& polygon,
    double tolerance = DEFAULT_TOLERANCE);

// =====================================================================
//  Triangulation
// =====================================================================

/// Triangle represented by three indices into a point array
struct Triangle {
    int i0, i1, i2;
};

/// Triangulate a simple polygon using ear clipping.
/// Collinear vertices are dropped without emitting a triangle.
/// @param polygon Input polygon (either winding)
/// @return Triangles as indices into the input polygon
TAKEOFF_EXPORT QVector<Triangle> triangulatePolygon(
    const VertexSequence& polygon);

// =====================================================================
//  Clipping
// =====================================================================

/// Clip a polygon against a convex CCW clip polygon
/// (Sutherland-Hodgman).  The result may have fewer than 3 vertices
/// when the polygons do not overlap.
TAKEOFF_EXPORT VertexSequence clipToConvex(
    const VertexSequence& subject,
    const VertexSequence& convexClip);

// =====================================================================
//  Overlap Measures
// =====================================================================

/// Area of the intersection of two simple polygons
TAKEOFF_EXPORT double polygonIntersectionArea(
    const VertexSequence& a,
    const VertexSequence& b);

/// Intersection-over-union of two simple polygons, in [0,1].
/// Returns 0 when either polygon has zero area.
TAKEOFF_EXPORT double intersectionOverUnion(
    const VertexSequence& a,
    const VertexSequence& b);

}  // namespace geometry
}  // namespace takeoff

#endif  // TAKEOFF_GEOMETRY_ALGORITHMS_H
