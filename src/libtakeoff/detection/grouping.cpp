// =====================================================================
//  src/libtakeoff/detection/grouping.cpp — Room membership
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/detection/grouping.h>
#include <takeoff/geometry/utils.h>
#include <takeoff/logging.h>

#include <cmath>

namespace takeoff {
namespace detection {

QPointF representativePoint(const Detection& item)
{
    if (item.region.isEmpty()) {
        return item.box ? item.box->center() : QPointF();
    }

    if (item.category == measure::Category::Wall) {
        return geometry::pathMidpoint(item.region);
    }
    return geometry::polygonCentroid(item.region);
}

RoomGrouping groupByRoom(
    const DetectionList& rooms,
    const DetectionList& items,
    std::optional<double> pixelsPerFoot)
{
    RoomGrouping grouping;
    grouping.rooms.reserve(rooms.size());

    bool scaled = pixelsPerFoot && *pixelsPerFoot > 0.0 && std::isfinite(*pixelsPerFoot);

    for (const Detection& room : rooms) {
        RoomSummary summary;
        summary.roomId = room.id;
        summary.label = room.label;
        summary.areaPx = geometry::polygonArea(room.region);
        summary.perimeterPx = geometry::perimeter(room.region, true);
        if (scaled) {
            double s = *pixelsPerFoot;
            summary.areaSqft = summary.areaPx / (s * s);
            summary.perimeterFt = summary.perimeterPx / s;
        }
        grouping.rooms.append(summary);
    }

    for (const Detection& item : items) {
        QPointF at = representativePoint(item);

        int owner = -1;
        for (int r = 0; r < rooms.size(); ++r) {
            const RoomSummary& candidate = grouping.rooms[r];
            if (candidate.areaPx < geometry::MIN_REGION_AREA) continue;
            if (!geometry::pointInPolygon(at, rooms[r].region)) continue;

            if (owner < 0 || candidate.areaPx < grouping.rooms[owner].areaPx) {
                owner = r;
            }
        }

        if (owner < 0) {
            grouping.unassigned.append(item.id);
            continue;
        }

        RoomSummary& summary = grouping.rooms[owner];
        summary.itemIds.append(item.id);

        QString label = item.label.toLower();
        if (item.category == measure::Category::Wall) {
            summary.wallIds.append(item.id);
        } else if (label.contains(QLatin1String("door"))) {
            ++summary.doorCount;
        } else if (label.contains(QLatin1String("window"))) {
            ++summary.windowCount;
        }
    }

    qCDebug(lcDetection) << "Grouped" << items.size() << "items into"
                         << rooms.size() << "rooms," << grouping.unassigned.size()
                         << "unassigned";

    return grouping;
}

}  // namespace detection
}  // namespace takeoff
