// =====================================================================
//  src/libtakeoff/geometry/algorithms.cpp — Polygon overlap
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/geometry/algorithms.h>
#include <takeoff/geometry/utils.h>

#include <algorithm>

namespace takeoff {
namespace geometry {

// =====================================================================
//  Cleanup
// =====================================================================

VertexSequence removeDuplicateVertices(
    const VertexSequence& polygon,
    double tolerance)
{
    VertexSequence result;
    result.reserve(polygon.size());

    for (const QPointF& p : polygon) {
        if (result.isEmpty() || distance(result.last(), p) > tolerance) {
            result.append(p);
        }
    }

    while (result.size() > 1 &&
           distance(result.first(), result.last()) <= tolerance) {
        result.removeLast();
    }

    return result;
}

// =====================================================================
//  Triangulation - Ear Clipping
// =====================================================================

namespace {

int prevActive(int i, const QVector<bool>& removed)
{
    int n = removed.size();
    int prev = (i + n - 1) % n;
    while (removed[prev]) prev = (prev + n - 1) % n;
    return prev;
}

int nextActive(int i, const QVector<bool>& removed)
{
    int n = removed.size();
    int next = (i + 1) % n;
    while (removed[next]) next = (next + 1) % n;
    return next;
}

bool isEar(const VertexSequence& polygon, int i, const QVector<bool>& removed)
{
    int n = polygon.size();
    int prev = prevActive(i, removed);
    int next = nextActive(i, removed);

    const QPointF& a = polygon[prev];
    const QPointF& b = polygon[i];
    const QPointF& c = polygon[next];

    // Check if convex (CCW)
    if (cross(b - a, c - b) <= 0) return false;

    // Check that no other vertex is inside this triangle
    for (int j = 0; j < n; ++j) {
        if (removed[j] || j == prev || j == i || j == next) continue;

        const QPointF& p = polygon[j];

        // Point-in-triangle test
        double d1 = cross(b - a, p - a);
        double d2 = cross(c - b, p - b);
        double d3 = cross(a - c, p - c);

        bool hasNeg = (d1 < 0) || (d2 < 0) || (d3 < 0);
        bool hasPos = (d1 > 0) || (d2 > 0) || (d3 > 0);

        if (!(hasNeg && hasPos)) return false;  // Point is inside
    }

    return true;
}

// Triangle corners in CCW order
VertexSequence triangleCorners(const VertexSequence& polygon, const Triangle& t)
{
    VertexSequence tri = { polygon[t.i0], polygon[t.i1], polygon[t.i2] };
    if (signedPolygonArea(tri) < 0) {
        std::swap(tri[1], tri[2]);
    }
    return tri;
}

}  // anonymous namespace

QVector<Triangle> triangulatePolygon(const VertexSequence& polygon)
{
    QVector<Triangle> triangles;
    if (polygon.size() < 3) return triangles;

    // Work on a CCW copy; indices are mapped back at the end
    VertexSequence poly = polygon;
    bool reversed = !polygonIsCCW(poly);
    if (reversed) {
        std::reverse(poly.begin(), poly.end());
    }

    int n = poly.size();
    QVector<bool> removed(n, false);
    int remaining = n;

    while (remaining > 3) {
        bool progress = false;
        for (int i = 0; i < n; ++i) {
            if (removed[i]) continue;

            int prev = prevActive(i, removed);
            int next = nextActive(i, removed);

            // Collinear vertex: drop it, it adds no area
            if (qAbs(cross(poly[i] - poly[prev], poly[next] - poly[i]))
                    <= DEFAULT_TOLERANCE) {
                removed[i] = true;
                --remaining;
                progress = true;
                break;
            }

            if (isEar(poly, i, removed)) {
                triangles.append({prev, i, next});
                removed[i] = true;
                --remaining;
                progress = true;
                break;
            }
        }
        if (!progress) break;  // Degenerate (self-intersecting) polygon
    }

    // Add final triangle
    if (remaining == 3) {
        QVector<int> indices;
        for (int i = 0; i < n; ++i) {
            if (!removed[i]) indices.append(i);
        }
        triangles.append({indices[0], indices[1], indices[2]});
    }

    if (reversed) {
        for (Triangle& t : triangles) {
            t.i0 = n - 1 - t.i0;
            t.i1 = n - 1 - t.i1;
            t.i2 = n - 1 - t.i2;
        }
    }

    return triangles;
}

// =====================================================================
//  Clipping - Sutherland-Hodgman
// =====================================================================

namespace {

VertexSequence clipPolygonByEdge(
    const VertexSequence& polygon,
    const QPointF& edgeStart, const QPointF& edgeEnd)
{
    if (polygon.isEmpty()) return {};

    VertexSequence output;
    QPointF edgeDir = edgeEnd - edgeStart;

    auto inside = [&](const QPointF& p) {
        return cross(edgeDir, p - edgeStart) >= 0;
    };

    // Point where segment a->b crosses the clip edge's supporting line
    auto intersect = [&](const QPointF& a, const QPointF& b) -> QPointF {
        QPointF dir = b - a;
        double denom = cross(dir, edgeDir);
        if (qAbs(denom) < DEFAULT_TOLERANCE) return a;
        double t = cross(edgeDir, a - edgeStart) / denom;
        return a + t * dir;
    };

    for (int i = 0; i < polygon.size(); ++i) {
        const QPointF& current = polygon[i];
        const QPointF& next = polygon[(i + 1) % polygon.size()];

        bool currentInside = inside(current);
        bool nextInside = inside(next);

        if (currentInside) {
            output.append(current);
            if (!nextInside) {
                output.append(intersect(current, next));
            }
        } else if (nextInside) {
            output.append(intersect(current, next));
        }
    }

    return output;
}

}  // anonymous namespace

VertexSequence clipToConvex(
    const VertexSequence& subject,
    const VertexSequence& convexClip)
{
    VertexSequence clipped = subject;
    int n = convexClip.size();

    for (int i = 0; i < n && !clipped.isEmpty(); ++i) {
        clipped = clipPolygonByEdge(clipped, convexClip[i], convexClip[(i + 1) % n]);
    }

    return clipped;
}

// =====================================================================
//  Overlap Measures
// =====================================================================

double polygonIntersectionArea(const VertexSequence& a, const VertexSequence& b)
{
    VertexSequence polyA = removeDuplicateVertices(a);
    VertexSequence polyB = removeDuplicateVertices(b);

    if (polyA.size() < 3 || polyB.size() < 3) return 0.0;
    if (!polygonBounds(polyA).intersects(polygonBounds(polyB))) return 0.0;

    QVector<Triangle> trisA = triangulatePolygon(polyA);
    QVector<Triangle> trisB = triangulatePolygon(polyB);

    QVector<VertexSequence> cornersB;
    QVector<BoundingBox> boundsB;
    cornersB.reserve(trisB.size());
    boundsB.reserve(trisB.size());
    for (const Triangle& t : trisB) {
        cornersB.append(triangleCorners(polyB, t));
        boundsB.append(polygonBounds(cornersB.last()));
    }

    double total = 0.0;
    for (const Triangle& ta : trisA) {
        VertexSequence triA = triangleCorners(polyA, ta);
        BoundingBox boundsA = polygonBounds(triA);

        for (int j = 0; j < cornersB.size(); ++j) {
            if (!boundsA.intersects(boundsB[j])) continue;
            total += polygonArea(clipToConvex(triA, cornersB[j]));
        }
    }

    return total;
}

double intersectionOverUnion(const VertexSequence& a, const VertexSequence& b)
{
    double areaA = polygonArea(a);
    double areaB = polygonArea(b);

    if (areaA < MIN_REGION_AREA || areaB < MIN_REGION_AREA) return 0.0;

    double inter = qMin(polygonIntersectionArea(a, b), qMin(areaA, areaB));
    double uni = areaA + areaB - inter;

    if (uni < MIN_REGION_AREA) return 0.0;

    return qBound(0.0, inter / uni, 1.0);
}

}  // namespace geometry
}  // namespace takeoff
