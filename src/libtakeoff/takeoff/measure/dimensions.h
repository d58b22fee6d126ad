// =====================================================================
//  src/libtakeoff/takeoff/measure/dimensions.h — Real-world dimensions
// =====================================================================
//
//  Converts pixel geometry into the display quantities of a takeoff
//  (square feet, linear feet) using a calibrated scale factor.  All
//  functions are pure: the same inputs always give the same metrics.
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_MEASURE_DIMENSIONS_H
#define TAKEOFF_MEASURE_DIMENSIONS_H

#include "../core.h"
#include "../geometry/types.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace takeoff {
namespace measure {

// =====================================================================
//  Categories
// =====================================================================

/// Semantic category deciding which metrics apply
enum class Category {
    Room,     ///< Closed area: floor area and perimeter
    Wall,     ///< Open run: linear length
    Opening,  ///< Door or window: counted, not measured
    Other
};

/// Infer a category from a detector class label.
/// "room" -> Room, "wall" -> Wall, "door"/"window" -> Opening.
TAKEOFF_EXPORT Category categoryFromLabel(const QString& label);

TAKEOFF_EXPORT QString categoryToString(Category category);
TAKEOFF_EXPORT std::optional<Category> categoryFromString(const QString& text);

// =====================================================================
//  Metrics
// =====================================================================

/// Measurements in image pixels
struct PixelMetrics {
    double areaPx = 0.0;
    double perimeterPx = 0.0;
};

/// Derived real-world metrics.  Unset fields are not applicable or
/// not yet computed.
struct DisplayMetrics {
    std::optional<double> areaSqft;
    std::optional<double> perimeterFt;  ///< Total linear run for walls
    std::optional<double> widthFt;
    std::optional<double> heightFt;

    bool isEmpty() const;
    bool operator==(const DisplayMetrics& other) const;
    bool operator!=(const DisplayMetrics& other) const { return !(*this == other); }
};

/// Overlay the fields set in update onto base
TAKEOFF_EXPORT DisplayMetrics mergeMetrics(
    const DisplayMetrics& base,
    const DisplayMetrics& update);

TAKEOFF_EXPORT QJsonObject metricsToJson(const DisplayMetrics& metrics);
TAKEOFF_EXPORT DisplayMetrics metricsFromJson(const QJsonObject& obj);

// =====================================================================
//  Recalculation
// =====================================================================

/// Pixel area and perimeter of a detector mask, both over the
/// closed loop
TAKEOFF_EXPORT PixelMetrics pixelMetrics(const geometry::VertexSequence& points);

/// Recompute display metrics after a vertex edit or a scale change.
///
/// - Room (and Other): area_sqft = area / scale^2,
///   perimeter_ft = closed perimeter / scale
/// - Wall: perimeter_ft = open perimeter / scale; area is left as is
/// - Opening: current is returned unchanged
///
/// @param points Current vertices in pixels
/// @param pixelsPerFoot Scale factor; a non-positive or non-finite
///        scale returns current unchanged
/// @param category Semantic category
/// @param current Existing display block, merged with the result
TAKEOFF_EXPORT DisplayMetrics recalcDimensions(
    const geometry::VertexSequence& points,
    double pixelsPerFoot,
    Category category,
    const DisplayMetrics& current = DisplayMetrics());

/// Width and height in feet of a box-shaped opening
TAKEOFF_EXPORT DisplayMetrics boxDimensions(
    const geometry::BoundingBox& box,
    double pixelsPerFoot);

}  // namespace measure
}  // namespace takeoff

#endif  // TAKEOFF_MEASURE_DIMENSIONS_H
