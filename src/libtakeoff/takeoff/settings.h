// =====================================================================
//  src/libtakeoff/takeoff/settings.h — Engine settings
// =====================================================================
//
//  Tunables for measurement and reconciliation, stored as a JSON
//  object.  Missing keys keep their defaults.
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_SETTINGS_H
#define TAKEOFF_SETTINGS_H

#include "core.h"
#include "measure/calibration.h"
#include "measure/parsing.h"
#include "detection/reconciler.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace takeoff {

struct EngineSettings {
    double iouThreshold = detection::DEFAULT_IOU_THRESHOLD;
    double minConfidence = 0.0;
    QStringList classFilter;          ///< Empty keeps every class
    measure::DistanceUnit defaultUnit = measure::DistanceUnit::Feet;
    double dpi = measure::DEFAULT_DPI;

    detection::ReconcileOptions reconcileOptions() const;
};

/// Setting keys accepted by settingsFromJson() and setSetting()
TAKEOFF_EXPORT QStringList settingKeys();

TAKEOFF_EXPORT QJsonObject settingsToJson(const EngineSettings& settings);

/// Read settings from JSON.  Returns false and sets errorMsg on an
/// out-of-range or mistyped value; settings is left unchanged then.
TAKEOFF_EXPORT bool settingsFromJson(
    const QJsonObject& obj,
    EngineSettings& settings,
    QString* errorMsg = nullptr);

/// Set one setting from text, e.g. ("iou_threshold", "0.5").
/// classes take a comma-separated list.
TAKEOFF_EXPORT bool setSetting(
    EngineSettings& settings,
    const QString& key,
    const QString& value,
    QString* errorMsg = nullptr);

TAKEOFF_EXPORT bool loadSettings(
    const QString& path,
    EngineSettings& settings,
    QString* errorMsg = nullptr);

TAKEOFF_EXPORT bool saveSettings(
    const QString& path,
    const EngineSettings& settings,
    QString* errorMsg = nullptr);

}  // namespace takeoff

#endif  // TAKEOFF_SETTINGS_H
