// =====================================================================
//  src/libtakeoff/measure/calibration.cpp — Reference-line calibration
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/measure/calibration.h>
#include <takeoff/measure/parsing.h>
#include <takeoff/geometry/utils.h>
#include <takeoff/logging.h>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <cmath>

namespace takeoff {
namespace measure {

// =====================================================================
//  Units
// =====================================================================

std::optional<DistanceUnit> distanceUnitFromString(const QString& text)
{
    QString unit = text.trimmed().toLower();

    if (unit == QLatin1String("ft") || unit == QLatin1String("feet") ||
        unit == QLatin1String("foot") || unit == QLatin1String("'")) {
        return DistanceUnit::Feet;
    }
    if (unit == QLatin1String("in") || unit == QLatin1String("inch") ||
        unit == QLatin1String("inches") || unit == QLatin1String("\"")) {
        return DistanceUnit::Inches;
    }
    return std::nullopt;
}

QString distanceUnitToString(DistanceUnit unit)
{
    return unit == DistanceUnit::Inches ? QStringLiteral("in") : QStringLiteral("ft");
}

QString calibrationStateToString(CalibrationState state)
{
    switch (state) {
    case CalibrationState::Empty:     return QStringLiteral("empty");
    case CalibrationState::OnePoint:  return QStringLiteral("one-point");
    case CalibrationState::TwoPoints: return QStringLiteral("two-points");
    case CalibrationState::Applied:   return QStringLiteral("applied");
    }
    return QString();
}

// =====================================================================
//  Scale Computation
// =====================================================================

namespace {

ScaleResult scaleError(CalibrationError error, const QString& message)
{
    ScaleResult result;
    result.error = error;
    result.message = message;
    return result;
}

}  // anonymous namespace

ScaleResult computeScale(
    const QPointF& p0,
    const QPointF& p1,
    const QString& distanceText,
    DistanceUnit unit)
{
    ParsedDistance parsed = parseDistance(distanceText);
    if (!parsed.valid) {
        return scaleError(CalibrationError::ParseError, parsed.error);
    }

    double feet = unit == DistanceUnit::Inches ? parsed.value / 12.0 : parsed.value;
    if (!(feet > 0.0) || !std::isfinite(feet)) {
        return scaleError(CalibrationError::NonPositiveDistance,
                          QStringLiteral("Distance must be greater than zero"));
    }

    double pixels = geometry::distance(p0, p1);
    if (!(pixels > 0.0) || !std::isfinite(pixels)) {
        return scaleError(CalibrationError::ZeroPixelDistance,
                          QStringLiteral("Reference points must be distinct"));
    }

    ScaleResult result;
    result.valid = true;
    result.pixelDistance = pixels;
    result.distanceFeet = feet;
    result.pixelsPerFoot = pixels / feet;
    return result;
}

// =====================================================================
//  CalibrationSession
// =====================================================================

void CalibrationSession::beginCalibration()
{
    reset();
}

void CalibrationSession::reset()
{
    m_state = CalibrationState::Empty;
    m_points[0] = QPointF();
    m_points[1] = QPointF();
}

bool CalibrationSession::addPoint(const QPointF& point)
{
    switch (m_state) {
    case CalibrationState::Empty:
        m_points[0] = point;
        m_state = CalibrationState::OnePoint;
        return true;
    case CalibrationState::OnePoint:
        m_points[1] = point;
        m_state = CalibrationState::TwoPoints;
        return true;
    default:
        qCDebug(lcCalibration) << "addPoint rejected in state"
                               << calibrationStateToString(m_state);
        return false;
    }
}

int CalibrationSession::pointCount() const
{
    switch (m_state) {
    case CalibrationState::Empty:    return 0;
    case CalibrationState::OnePoint: return 1;
    default:                         return 2;
    }
}

QPointF CalibrationSession::point(int index) const
{
    if (index < 0 || index >= pointCount()) return QPointF();
    return m_points[index];
}

ScaleResult CalibrationSession::applyDistance(const QString& text, DistanceUnit unit)
{
    if (m_state != CalibrationState::TwoPoints) {
        return scaleError(CalibrationError::IncompletePoints,
                          QStringLiteral("Place two reference points first"));
    }

    ScaleResult result = computeScale(m_points[0], m_points[1], text, unit);
    if (!result.valid) {
        qCDebug(lcCalibration) << "Calibration rejected:" << result.message;
        return result;
    }

    m_scale = result.pixelsPerFoot;
    m_lastDistanceText = text.trimmed();
    m_lastUnit = unit;
    m_state = CalibrationState::Applied;

    qCInfo(lcCalibration).nospace()
        << "Calibrated " << result.pixelDistance << " px = "
        << result.distanceFeet << " ft (" << result.pixelsPerFoot << " px/ft)";

    return result;
}

bool CalibrationSession::setPixelsPerFoot(double pixelsPerFoot)
{
    if (!(pixelsPerFoot > 0.0) || !std::isfinite(pixelsPerFoot)) {
        return false;
    }
    m_scale = pixelsPerFoot;
    return true;
}

// =====================================================================
//  Serialization
// =====================================================================

QString CalibrationSession::toJson() const
{
    QJsonObject obj;

    obj["state"] = calibrationStateToString(m_state);

    QJsonArray points;
    for (int i = 0; i < pointCount(); ++i) {
        points.append(QJsonArray{ m_points[i].x(), m_points[i].y() });
    }
    obj["points"] = points;

    if (m_scale) {
        obj["pixelsPerFoot"] = *m_scale;
    }
    if (!m_lastDistanceText.isEmpty()) {
        obj["distance"] = m_lastDistanceText;
        obj["unit"] = distanceUnitToString(m_lastUnit);
    }

    QJsonDocument doc(obj);
    return QString::fromUtf8(doc.toJson(QJsonDocument::Compact));
}

CalibrationSession CalibrationSession::fromJson(const QString& json)
{
    CalibrationSession session;

    QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8());
    if (!doc.isObject()) {
        return session;
    }

    QJsonObject obj = doc.object();

    const QJsonArray points = obj["points"].toArray();
    for (const QJsonValue& value : points) {
        QJsonArray xy = value.toArray();
        if (xy.size() != 2) break;
        if (!session.addPoint(QPointF(xy[0].toDouble(), xy[1].toDouble()))) break;
    }

    if (obj.contains("pixelsPerFoot")) {
        session.setPixelsPerFoot(obj["pixelsPerFoot"].toDouble(0.0));
    }

    session.m_lastDistanceText = obj["distance"].toString();
    session.m_lastUnit = distanceUnitFromString(obj["unit"].toString())
                             .value_or(DistanceUnit::Feet);

    if (obj["state"].toString() == QLatin1String("applied") &&
        session.m_state == CalibrationState::TwoPoints && session.m_scale) {
        session.m_state = CalibrationState::Applied;
    }

    return session;
}

}  // namespace measure
}  // namespace takeoff
