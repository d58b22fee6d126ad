// =====================================================================
//  src/libtakeoff/takeoff/detection/normalize.h — Detector output import
// =====================================================================
//
//  Converts a hosted detector's JSON prediction response into a
//  DetectionList.  Two prediction shapes are understood:
//
//    { "class": "room", "confidence": 0.9,
//      "points": [ {"x": 1, "y": 2}, ... ] }              polygon mask
//
//    { "class": "door", "confidence": 0.8,
//      "x": 50, "y": 40, "width": 20, "height": 6 }      centered box
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_DETECTION_NORMALIZE_H
#define TAKEOFF_DETECTION_NORMALIZE_H

#include "detection.h"
#include "../core.h"

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>

namespace takeoff {
namespace detection {

struct NormalizeOptions {
    Source source = Source::Primary;
    QStringList classFilter;                 ///< Keep only these classes (empty keeps all)
    double minConfidence = 0.0;              ///< Drop predictions below this
    std::optional<double> pixelsPerFoot;     ///< Derive display metrics when set
};

struct NormalizeResult {
    bool success = false;
    QString error;
    DetectionList detections;
    int skipped = 0;        ///< Entries that are not prediction objects
    int filtered = 0;       ///< Dropped by class filter or confidence
};

/// Normalize a parsed detector response.  Predictions are read from
/// "predictions" or "data.predictions".
TAKEOFF_EXPORT NormalizeResult normalizePredictions(
    const QJsonObject& response,
    const NormalizeOptions& options = NormalizeOptions());

/// Parse and normalize a detector response.  A bare JSON array is
/// accepted as the prediction list.
TAKEOFF_EXPORT NormalizeResult normalizePredictionsJson(
    const QByteArray& json,
    const NormalizeOptions& options = NormalizeOptions());

}  // namespace detection
}  // namespace takeoff

#endif  // TAKEOFF_DETECTION_NORMALIZE_H
