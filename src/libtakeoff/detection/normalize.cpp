// =====================================================================
//  src/libtakeoff/detection/normalize.cpp — Detector output import
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/detection/normalize.h>
#include <takeoff/logging.h>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <cmath>

namespace takeoff {
namespace detection {

namespace {

bool hasNumber(const QJsonObject& obj, const char* key)
{
    return obj.value(QLatin1String(key)).isDouble();
}

// Id for a prediction: the detector's own id when present, otherwise
// stable across runs on identical input
QString predictionId(const QJsonObject& p, Source source, int index)
{
    QJsonValue id = p.value(QLatin1String("detection_id"));
    if (id.isString() && !id.toString().isEmpty()) {
        return id.toString();
    }
    return QStringLiteral("%1-%2").arg(sourceToString(source)).arg(index);
}

bool passesFilter(const QString& label, const QStringList& filter)
{
    if (filter.isEmpty()) return true;
    for (const QString& cls : filter) {
        if (sameClass(cls, label)) return true;
    }
    return false;
}

geometry::VertexSequence readPoints(const QJsonArray& points)
{
    geometry::VertexSequence region;
    region.reserve(points.size());
    for (const QJsonValue& v : points) {
        QJsonObject pt = v.toObject();
        if (!hasNumber(pt, "x") || !hasNumber(pt, "y")) continue;
        region.append(QPointF(pt["x"].toDouble(), pt["y"].toDouble()));
    }
    return region;
}

void deriveDisplay(Detection& d, double pixelsPerFoot)
{
    if (!(pixelsPerFoot > 0.0) || !std::isfinite(pixelsPerFoot)) return;

    if (d.category == measure::Category::Opening) {
        if (d.box) {
            d.display = measure::boxDimensions(*d.box, pixelsPerFoot);
        }
        return;
    }

    if (d.region.size() < 3) return;

    // Detector masks are closed outlines, walls included
    d.display.perimeterFt = d.pixels.perimeterPx / pixelsPerFoot;
    d.display.areaSqft = d.pixels.areaPx / (pixelsPerFoot * pixelsPerFoot);
}

}  // anonymous namespace

NormalizeResult normalizePredictions(
    const QJsonObject& response,
    const NormalizeOptions& options)
{
    NormalizeResult result;

    QJsonValue preds = response.value(QLatin1String("predictions"));
    if (!preds.isArray()) {
        preds = response.value(QLatin1String("data")).toObject()
                    .value(QLatin1String("predictions"));
    }
    if (!preds.isArray()) {
        result.error = QStringLiteral("Response has no predictions array");
        return result;
    }

    const QJsonArray list = preds.toArray();
    for (int i = 0; i < list.size(); ++i) {
        if (!list[i].isObject()) {
            ++result.skipped;
            continue;
        }

        QJsonObject p = list[i].toObject();

        QString label = p.value(QLatin1String("class")).toString();
        if (label.isEmpty()) {
            label = p.value(QLatin1String("label")).toString();
        }

        if (!passesFilter(label, options.classFilter)) {
            ++result.filtered;
            continue;
        }

        double confidence = p.value(QLatin1String("confidence")).toDouble(0.0);
        if (confidence < options.minConfidence) {
            ++result.filtered;
            continue;
        }

        Detection d;
        d.id = predictionId(p, options.source, i);
        d.label = label;
        d.category = measure::categoryFromLabel(label);
        d.confidence = confidence;
        d.source = options.source;

        if (p.value(QLatin1String("points")).isArray()) {
            d.region = readPoints(p.value(QLatin1String("points")).toArray());
        }

        if (hasNumber(p, "x") && hasNumber(p, "y") &&
            hasNumber(p, "width") && hasNumber(p, "height")) {
            d.box = geometry::BoundingBox::fromCenter(
                p["x"].toDouble(), p["y"].toDouble(),
                p["width"].toDouble(), p["height"].toDouble());
            if (d.region.isEmpty()) {
                d.region = d.box->toPolygon();
            }
        }

        if (d.region.size() >= 3) {
            d.pixels = measure::pixelMetrics(d.region);
        }
        if (options.pixelsPerFoot) {
            deriveDisplay(d, *options.pixelsPerFoot);
        }

        result.detections.append(d);
    }

    if (result.skipped > 0) {
        qCWarning(lcDetection) << "Skipped" << result.skipped
                               << "prediction entries that are not objects";
    }
    qCDebug(lcDetection) << "Normalized" << result.detections.size()
                         << sourceToString(options.source) << "detections,"
                         << result.filtered << "filtered";

    result.success = true;
    return result;
}

NormalizeResult normalizePredictionsJson(
    const QByteArray& json,
    const NormalizeOptions& options)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        NormalizeResult result;
        result.error = QStringLiteral("Invalid JSON at offset %1: %2")
                           .arg(parseError.offset)
                           .arg(parseError.errorString());
        return result;
    }

    if (doc.isArray()) {
        QJsonObject wrapped;
        wrapped["predictions"] = doc.array();
        return normalizePredictions(wrapped, options);
    }

    return normalizePredictions(doc.object(), options);
}

}  // namespace detection
}  // namespace takeoff
