// =====================================================================
//  src/libtakeoff/detection/detection.cpp — Detection model
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/detection/detection.h>
#include <takeoff/geometry/utils.h>

namespace takeoff {
namespace detection {

// =====================================================================
//  Sources
// =====================================================================

QString sourceToString(Source source)
{
    return source == Source::Secondary ? QStringLiteral("secondary")
                                       : QStringLiteral("primary");
}

std::optional<Source> sourceFromString(const QString& text)
{
    QString name = text.trimmed().toLower();
    if (name == QLatin1String("primary"))   return Source::Primary;
    if (name == QLatin1String("secondary")) return Source::Secondary;
    return std::nullopt;
}

bool sameClass(const QString& a, const QString& b)
{
    return a.trimmed().compare(b.trimmed(), Qt::CaseInsensitive) == 0;
}

// =====================================================================
//  Vertex Editing
// =====================================================================

bool Detection::moveVertex(int index, const QPointF& point)
{
    if (index < 0 || index >= region.size()) return false;
    region[index] = point;
    return true;
}

bool Detection::insertVertex(int index, const QPointF& point)
{
    if (index < 0 || index > region.size()) return false;
    region.insert(index, point);
    return true;
}

bool Detection::removeVertex(int index)
{
    if (index < 0 || index >= region.size()) return false;
    region.remove(index);
    return true;
}

std::optional<EdgeHit> Detection::nearestEdge(const QPointF& point) const
{
    int n = region.size();
    if (n < 2) return std::nullopt;

    bool closed = category != measure::Category::Wall && n >= 3;
    int edgeCount = closed ? n : n - 1;

    EdgeHit best;
    for (int i = 0; i < edgeCount; ++i) {
        double d = geometry::pointToSegmentDistance(
            point, region[i], region[(i + 1) % n]);
        if (best.index < 0 || d < best.distance) {
            best.index = i;
            best.distance = d;
        }
    }

    return best;
}

void Detection::recalculate(double pixelsPerFoot)
{
    pixels = measure::pixelMetrics(region);
    display = measure::recalcDimensions(region, pixelsPerFoot, category, display);
}

bool Detection::operator==(const Detection& other) const
{
    auto sameBox = [](const std::optional<geometry::BoundingBox>& a,
                      const std::optional<geometry::BoundingBox>& b) {
        if (a.has_value() != b.has_value()) return false;
        if (!a) return true;
        return a->minX == b->minX && a->minY == b->minY &&
               a->maxX == b->maxX && a->maxY == b->maxY;
    };

    return id == other.id &&
           label == other.label &&
           category == other.category &&
           confidence == other.confidence &&
           source == other.source &&
           region == other.region &&
           sameBox(box, other.box) &&
           pixels.areaPx == other.pixels.areaPx &&
           pixels.perimeterPx == other.pixels.perimeterPx &&
           display == other.display;
}

// =====================================================================
//  Detection Runs
// =====================================================================

DetectionRun DetectionRun::unavailable(Source source, const QString& error)
{
    DetectionRun run;
    run.source = source;
    run.available = false;
    run.error = error;
    return run;
}

}  // namespace detection
}  // namespace takeoff
