// =====================================================================
//  src/libtakeoff/takeoff/detection/detection.h — Detection model
// =====================================================================
//
//  A detection is one object found on a drawing by a detector: a class
//  label, a confidence and a pixel-space region.  Users refine the
//  region by editing vertices; edits never change the detection's id.
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_DETECTION_DETECTION_H
#define TAKEOFF_DETECTION_DETECTION_H

#include "../core.h"
#include "../geometry/types.h"
#include "../measure/dimensions.h"

#include <QString>
#include <QVector>

#include <optional>

namespace takeoff {
namespace detection {

// =====================================================================
//  Sources
// =====================================================================

/// Which detector produced a detection
enum class Source {
    Primary,    ///< Hosted detector
    Secondary   ///< Local detector
};

TAKEOFF_EXPORT QString sourceToString(Source source);
TAKEOFF_EXPORT std::optional<Source> sourceFromString(const QString& text);

// =====================================================================
//  Detection
// =====================================================================

/// Result of hit-testing the edges of a region
struct EdgeHit {
    int index = -1;          ///< Edge from vertex index to index + 1
    double distance = 0.0;   ///< Pixel distance to the edge
};

/// One detected object
struct Detection {
    QString id;
    QString label;                                ///< Detector class, e.g. "door"
    measure::Category category = measure::Category::Other;
    double confidence = 0.0;                      ///< In [0,1]
    Source source = Source::Primary;

    geometry::VertexSequence region;              ///< Polygon in pixels
    std::optional<geometry::BoundingBox> box;     ///< Set when the detector reported a box

    measure::PixelMetrics pixels;
    measure::DisplayMetrics display;

    /// Move vertex index to point.  Returns false if out of range.
    bool moveVertex(int index, const QPointF& point);

    /// Insert a vertex before index (index == size appends).
    /// Returns false if out of range.
    bool insertVertex(int index, const QPointF& point);

    /// Remove vertex index.  Returns false if out of range.
    bool removeVertex(int index);

    /// Closest edge of the region to point.  Walls are open runs; every
    /// other category includes the closing edge.  Empty for fewer than
    /// two vertices.
    std::optional<EdgeHit> nearestEdge(const QPointF& point) const;

    /// Recompute pixel and display metrics from the current region
    void recalculate(double pixelsPerFoot);

    bool operator==(const Detection& other) const;
    bool operator!=(const Detection& other) const { return !(*this == other); }
};

/// Ordered detector output
using DetectionList = QVector<Detection>;

/// Labels are the same class when equal ignoring case and surrounding
/// whitespace
TAKEOFF_EXPORT bool sameClass(const QString& a, const QString& b);

// =====================================================================
//  Detection Runs
// =====================================================================

/// Output of one detector invocation
struct DetectionRun {
    Source source = Source::Primary;
    bool available = false;     ///< False if the detector could not run
    QString error;              ///< Why the run is unavailable
    DetectionList detections;
    quint64 token = 0;          ///< Request token from RunSequencer

    static DetectionRun unavailable(Source source, const QString& error);
};

}  // namespace detection
}  // namespace takeoff

#endif  // TAKEOFF_DETECTION_DETECTION_H
