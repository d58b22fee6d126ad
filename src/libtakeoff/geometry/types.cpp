// =====================================================================
//  src/libtakeoff/geometry/types.cpp — Basic geometry types implementation
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/geometry/types.h>

namespace takeoff {
namespace geometry {

// =====================================================================
//  BoundingBox Implementation
// =====================================================================

BoundingBox::BoundingBox(double x1, double y1, double x2, double y2)
    : minX(qMin(x1, x2))
    , minY(qMin(y1, y2))
    , maxX(qMax(x1, x2))
    , maxY(qMax(y1, y2))
    , valid(true)
{
}

BoundingBox BoundingBox::fromCenter(double cx, double cy, double w, double h)
{
    double halfW = qAbs(w) / 2.0;
    double halfH = qAbs(h) / 2.0;
    return BoundingBox(cx - halfW, cy - halfH, cx + halfW, cy + halfH);
}

void BoundingBox::include(const QPointF& point)
{
    if (!valid) {
        minX = maxX = point.x();
        minY = maxY = point.y();
        valid = true;
    } else {
        minX = qMin(minX, point.x());
        minY = qMin(minY, point.y());
        maxX = qMax(maxX, point.x());
        maxY = qMax(maxY, point.y());
    }
}

QPointF BoundingBox::center() const
{
    return QPointF((minX + maxX) / 2.0, (minY + maxY) / 2.0);
}

VertexSequence BoundingBox::toPolygon() const
{
    if (!valid) return {};

    return {
        QPointF(minX, minY),
        QPointF(maxX, minY),
        QPointF(maxX, maxY),
        QPointF(minX, maxY)
    };
}

bool BoundingBox::intersects(const BoundingBox& other) const
{
    if (!valid || !other.valid) return false;
    return !(maxX < other.minX || other.maxX < minX ||
             maxY < other.minY || other.maxY < minY);
}

}  // namespace geometry
}  // namespace takeoff
