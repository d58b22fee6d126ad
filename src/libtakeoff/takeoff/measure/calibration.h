// =====================================================================
//  src/libtakeoff/takeoff/measure/calibration.h — Reference-line calibration
// =====================================================================
//
//  Turns two points on a drawing and a known real-world distance
//  between them into a scale factor (pixels per foot).  The scale is
//  owned by a CalibrationSession, one per drawing, and is passed
//  explicitly into every measurement.
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_MEASURE_CALIBRATION_H
#define TAKEOFF_MEASURE_CALIBRATION_H

#include "../core.h"

#include <QPointF>
#include <QString>

#include <optional>

namespace takeoff {
namespace measure {

// =====================================================================
//  Units and Results
// =====================================================================

/// Unit of an entered reference distance
enum class DistanceUnit {
    Feet,
    Inches
};

/// Parse "ft"/"feet"/"'" or "in"/"inches"/"\"" (case-insensitive)
TAKEOFF_EXPORT std::optional<DistanceUnit> distanceUnitFromString(const QString& text);

/// Short unit name ("ft" or "in")
TAKEOFF_EXPORT QString distanceUnitToString(DistanceUnit unit);

/// Why a scale could not be computed
enum class CalibrationError {
    None,
    ParseError,           ///< Distance text not recognized
    NonPositiveDistance,  ///< Entered distance <= 0
    ZeroPixelDistance,    ///< Reference points coincide
    IncompletePoints      ///< Fewer than two reference points
};

/// Result of computing a scale factor
struct ScaleResult {
    bool valid = false;
    double pixelsPerFoot = 0.0;
    double pixelDistance = 0.0;
    double distanceFeet = 0.0;
    CalibrationError error = CalibrationError::None;
    QString message;                 ///< User-facing validation message
};

/// Compute pixels per foot from two points and a distance string.
/// Stateless form of CalibrationSession::applyDistance().
TAKEOFF_EXPORT ScaleResult computeScale(
    const QPointF& p0,
    const QPointF& p1,
    const QString& distanceText,
    DistanceUnit unit = DistanceUnit::Feet);

// =====================================================================
//  Calibration Session
// =====================================================================

/// Progress of an interactive calibration
enum class CalibrationState {
    Empty,
    OnePoint,
    TwoPoints,
    Applied
};

TAKEOFF_EXPORT QString calibrationStateToString(CalibrationState state);

/// Interactive calibration for one drawing.
///
/// States advance Empty -> OnePoint -> TwoPoints -> Applied.  A failed
/// applyDistance() leaves the session where it was, so the user can
/// correct the distance without redrawing the line.  Starting a new
/// calibration discards unapplied points but keeps the previously
/// applied scale active until a new one is applied.
class TAKEOFF_EXPORT CalibrationSession {
public:
    CalibrationSession() = default;

    /// Start a new reference line (same as reset())
    void beginCalibration();

    /// Add a reference point.  Returns false unless the session is in
    /// Empty or OnePoint; a third point requires reset() first.
    bool addPoint(const QPointF& point);

    /// Parse the distance and commit the scale.  Only valid in TwoPoints.
    ScaleResult applyDistance(const QString& text, DistanceUnit unit = DistanceUnit::Feet);

    /// Return to Empty, discarding unapplied points
    void reset();

    CalibrationState state() const { return m_state; }
    int pointCount() const;
    QPointF point(int index) const;

    /// Active scale factor, if one has ever been applied
    std::optional<double> pixelsPerFoot() const { return m_scale; }
    bool hasScale() const { return m_scale.has_value(); }

    /// Install a scale directly (e.g. from a drawing scale).
    /// Returns false for a non-positive or non-finite value.
    bool setPixelsPerFoot(double pixelsPerFoot);

    /// Serialize the applied calibration
    QString toJson() const;

    /// Restore a session from toJson() output.  Returns an empty
    /// session for malformed input.
    static CalibrationSession fromJson(const QString& json);

private:
    CalibrationState m_state = CalibrationState::Empty;
    QPointF m_points[2];
    std::optional<double> m_scale;
    QString m_lastDistanceText;
    DistanceUnit m_lastUnit = DistanceUnit::Feet;
};

}  // namespace measure
}  // namespace takeoff

#endif  // TAKEOFF_MEASURE_CALIBRATION_H
