// =====================================================================
//  src/libtakeoff/geometry/utils.cpp — Geometry kernel
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/geometry/utils.h>

#include <cmath>

namespace takeoff {
namespace geometry {

// =====================================================================
//  Vector Operations
// =====================================================================

double dot(const QPointF& a, const QPointF& b)
{
    return a.x() * b.x() + a.y() * b.y();
}

double cross(const QPointF& a, const QPointF& b)
{
    return a.x() * b.y() - a.y() * b.x();
}

double length(const QPointF& v)
{
    return qSqrt(v.x() * v.x() + v.y() * v.y());
}

double lengthSquared(const QPointF& v)
{
    return v.x() * v.x() + v.y() * v.y();
}

QPointF lerp(const QPointF& a, const QPointF& b, double t)
{
    return QPointF(
        a.x() + t * (b.x() - a.x()),
        a.y() + t * (b.y() - a.y())
    );
}

// =====================================================================
//  Distance Operations
// =====================================================================

double distance(const QPointF& p1, const QPointF& p2)
{
    return length(p2 - p1);
}

double projectPointOnSegment(
    const QPointF& point,
    const QPointF& a, const QPointF& b)
{
    QPointF d = b - a;
    double lenSq = lengthSquared(d);

    // Exact comparison: only a truly coincident segment is degenerate
    if (lenSq == 0.0) {
        return 0.0;
    }

    return qBound(0.0, dot(point - a, d) / lenSq, 1.0);
}

double pointToSegmentDistance(
    const QPointF& p,
    const QPointF& a, const QPointF& b)
{
    double t = projectPointOnSegment(p, a, b);
    return distance(p, lerp(a, b, t));
}

// =====================================================================
//  Polygon Operations
// =====================================================================

double signedPolygonArea(const VertexSequence& polygon)
{
    if (polygon.size() < 3) return 0.0;

    double area = 0.0;
    int n = polygon.size();

    for (int i = 0; i < n; ++i) {
        int j = (i + 1) % n;
        area += polygon[i].x() * polygon[j].y();
        area -= polygon[j].x() * polygon[i].y();
    }

    return area / 2.0;
}

double polygonArea(const VertexSequence& polygon)
{
    return qAbs(signedPolygonArea(polygon));
}

bool polygonIsCCW(const VertexSequence& polygon)
{
    return signedPolygonArea(polygon) > 0;
}

double perimeter(const VertexSequence& points, bool closed)
{
    if (points.size() < 2) return 0.0;

    double total = 0.0;
    for (int i = 1; i < points.size(); ++i) {
        total += distance(points[i - 1], points[i]);
    }

    if (closed) {
        total += distance(points.last(), points.first());
    }

    return total;
}

bool pointInPolygon(const QPointF& point, const VertexSequence& polygon)
{
    if (polygon.size() < 3) return false;

    // Ray casting algorithm
    bool inside = false;
    int n = polygon.size();

    for (int i = 0, j = n - 1; i < n; j = i++) {
        double xi = polygon[i].x(), yi = polygon[i].y();
        double xj = polygon[j].x(), yj = polygon[j].y();

        if (((yi > point.y()) != (yj > point.y())) &&
            (point.x() < (xj - xi) * (point.y() - yi) / (yj - yi) + xi)) {
            inside = !inside;
        }
    }

    return inside;
}

QPointF polygonCentroid(const VertexSequence& polygon)
{
    if (polygon.isEmpty()) return QPointF();
    if (polygon.size() == 1) return polygon[0];
    if (polygon.size() == 2) return lerp(polygon[0], polygon[1], 0.5);

    double cx = 0.0, cy = 0.0;
    double area = 0.0;
    int n = polygon.size();

    for (int i = 0; i < n; ++i) {
        int j = (i + 1) % n;
        double c = polygon[i].x() * polygon[j].y() -
                   polygon[j].x() * polygon[i].y();
        area += c;
        cx += (polygon[i].x() + polygon[j].x()) * c;
        cy += (polygon[i].y() + polygon[j].y()) * c;
    }

    area /= 2.0;

    if (qAbs(area) < MIN_REGION_AREA) {
        // Degenerate polygon - return average of points
        cx = 0.0;
        cy = 0.0;
        for (const QPointF& p : polygon) {
            cx += p.x();
            cy += p.y();
        }
        return QPointF(cx / n, cy / n);
    }

    return QPointF(cx / (6.0 * area), cy / (6.0 * area));
}

QPointF pathMidpoint(const VertexSequence& points)
{
    if (points.isEmpty()) return QPointF();

    double half = perimeter(points, false) / 2.0;
    double walked = 0.0;

    for (int i = 1; i < points.size(); ++i) {
        double seg = distance(points[i - 1], points[i]);
        if (walked + seg >= half && seg > 0.0) {
            return lerp(points[i - 1], points[i], (half - walked) / seg);
        }
        walked += seg;
    }

    return points.last();
}

BoundingBox polygonBounds(const VertexSequence& polygon)
{
    BoundingBox bbox;
    for (const QPointF& p : polygon) {
        bbox.include(p);
    }
    return bbox;
}

bool allFinite(const VertexSequence& points)
{
    for (const QPointF& p : points) {
        if (!std::isfinite(p.x()) || !std::isfinite(p.y())) {
            return false;
        }
    }
    return true;
}

}  // namespace geometry
}  // namespace takeoff
