// =====================================================================
//  src/libtakeoff/takeoff/detection/grouping.h — Room membership
// =====================================================================
//
//  Assigns walls and openings to the room that contains them, giving a
//  per-room takeoff.  Membership is a point-in-polygon test on each
//  item's representative point.
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_DETECTION_GROUPING_H
#define TAKEOFF_DETECTION_GROUPING_H

#include "detection.h"
#include "../core.h"

#include <QPointF>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

namespace takeoff {
namespace detection {

/// Quantities for one room
struct RoomSummary {
    QString roomId;
    QString label;
    double areaPx = 0.0;
    double perimeterPx = 0.0;
    std::optional<double> areaSqft;       ///< Set when a scale is known
    std::optional<double> perimeterFt;
    int doorCount = 0;
    int windowCount = 0;
    QStringList wallIds;
    QStringList itemIds;                  ///< Every assigned item, in input order
};

struct RoomGrouping {
    QVector<RoomSummary> rooms;           ///< Same order as the input rooms
    QStringList unassigned;               ///< Items inside no room
};

/// Point used to locate an item: the area centroid of a region, or the
/// midpoint along a wall run.  Falls back to the box center.
TAKEOFF_EXPORT QPointF representativePoint(const Detection& item);

/// Group items into rooms.  An item belongs to the room containing its
/// representative point; if rooms overlap, the smallest one wins.
/// Rooms with zero area never receive items.
TAKEOFF_EXPORT RoomGrouping groupByRoom(
    const DetectionList& rooms,
    const DetectionList& items,
    std::optional<double> pixelsPerFoot = std::nullopt);

}  // namespace detection
}  // namespace takeoff

#endif  // TAKEOFF_DETECTION_GROUPING_H
