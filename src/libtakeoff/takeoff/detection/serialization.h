// =====================================================================
//  src/libtakeoff/takeoff/detection/serialization.h — Detection JSON
// =====================================================================
//
//  JSON form of detections and reconciliation results.  Output is
//  deterministic: identical results serialize to identical bytes.
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_DETECTION_SERIALIZATION_H
#define TAKEOFF_DETECTION_SERIALIZATION_H

#include "detection.h"
#include "reconciler.h"
#include "../core.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>

#include <optional>

namespace takeoff {
namespace detection {

// =====================================================================
//  Detections
// =====================================================================

TAKEOFF_EXPORT QJsonObject detectionToJson(const Detection& detection);

/// Read a detection written by detectionToJson().  Returns nullopt and
/// sets errorMsg if the object has no id or an unreadable region.
TAKEOFF_EXPORT std::optional<Detection> detectionFromJson(
    const QJsonObject& obj,
    QString* errorMsg = nullptr);

TAKEOFF_EXPORT QJsonArray detectionsToJson(const DetectionList& detections);

// =====================================================================
//  Reconciliation Results
// =====================================================================

TAKEOFF_EXPORT QJsonObject reconciledToJson(const ReconciledDetection& reconciled);

/// { "detections": [...], "summary": {...} }
TAKEOFF_EXPORT QJsonObject reconcileResultToJson(const ReconcileResult& result);

// =====================================================================
//  Files
// =====================================================================

/// Write a JSON document (indented).  Returns true on success.
TAKEOFF_EXPORT bool saveJsonFile(
    const QString& path,
    const QJsonDocument& doc,
    QString* errorMsg = nullptr);

/// Read detections from a file holding either a bare array of
/// detections or an object with a "detections" array (as written by
/// reconcileResultToJson()).
TAKEOFF_EXPORT bool loadDetections(
    const QString& path,
    DetectionList& detections,
    QString* errorMsg = nullptr);

}  // namespace detection
}  // namespace takeoff

#endif  // TAKEOFF_DETECTION_SERIALIZATION_H
