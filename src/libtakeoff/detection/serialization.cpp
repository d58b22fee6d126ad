// =====================================================================
//  src/libtakeoff/detection/serialization.cpp — Detection JSON
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/detection/serialization.h>

#include <QFile>
#include <QJsonParseError>

namespace takeoff {
namespace detection {

// =====================================================================
//  Detections
// =====================================================================

QJsonObject detectionToJson(const Detection& detection)
{
    QJsonObject obj;

    obj["id"] = detection.id;
    obj["class"] = detection.label;
    obj["category"] = measure::categoryToString(detection.category);
    obj["confidence"] = detection.confidence;
    obj["source"] = sourceToString(detection.source);

    QJsonArray points;
    for (const QPointF& p : detection.region) {
        QJsonObject pt;
        pt["x"] = p.x();
        pt["y"] = p.y();
        points.append(pt);
    }
    obj["points"] = points;

    if (detection.box) {
        QPointF c = detection.box->center();
        QJsonObject bbox;
        bbox["x"] = c.x();
        bbox["y"] = c.y();
        bbox["width"] = detection.box->width();
        bbox["height"] = detection.box->height();
        obj["bbox"] = bbox;
    }

    QJsonObject metrics;
    metrics["area_px"] = detection.pixels.areaPx;
    metrics["perimeter_px"] = detection.pixels.perimeterPx;
    obj["metrics"] = metrics;

    obj["display"] = measure::metricsToJson(detection.display);

    return obj;
}

std::optional<Detection> detectionFromJson(const QJsonObject& obj, QString* errorMsg)
{
    Detection d;

    d.id = obj["id"].toString();
    if (d.id.isEmpty()) {
        if (errorMsg) *errorMsg = QStringLiteral("Detection has no id");
        return std::nullopt;
    }

    d.label = obj["class"].toString();
    d.category = measure::categoryFromString(obj["category"].toString())
                     .value_or(measure::categoryFromLabel(d.label));
    d.confidence = obj["confidence"].toDouble(0.0);
    d.source = sourceFromString(obj["source"].toString()).value_or(Source::Primary);

    const QJsonArray points = obj["points"].toArray();
    for (const QJsonValue& v : points) {
        QJsonObject pt = v.toObject();
        if (!pt["x"].isDouble() || !pt["y"].isDouble()) {
            if (errorMsg) *errorMsg = QStringLiteral("Detection %1 has an invalid point").arg(d.id);
            return std::nullopt;
        }
        d.region.append(QPointF(pt["x"].toDouble(), pt["y"].toDouble()));
    }

    if (obj["bbox"].isObject()) {
        QJsonObject bbox = obj["bbox"].toObject();
        d.box = geometry::BoundingBox::fromCenter(
            bbox["x"].toDouble(), bbox["y"].toDouble(),
            bbox["width"].toDouble(), bbox["height"].toDouble());
    }

    QJsonObject metrics = obj["metrics"].toObject();
    d.pixels.areaPx = metrics["area_px"].toDouble(0.0);
    d.pixels.perimeterPx = metrics["perimeter_px"].toDouble(0.0);

    d.display = measure::metricsFromJson(obj["display"].toObject());

    return d;
}

QJsonArray detectionsToJson(const DetectionList& detections)
{
    QJsonArray array;
    for (const Detection& d : detections) {
        array.append(detectionToJson(d));
    }
    return array;
}

// =====================================================================
//  Reconciliation Results
// =====================================================================

QJsonObject reconciledToJson(const ReconciledDetection& reconciled)
{
    QJsonObject obj = detectionToJson(reconciled.detection);

    obj["confidence"] = reconciled.confidence;
    obj["provenance"] = provenanceToString(reconciled.provenance);

    QJsonArray sources;
    for (Source s : reconciled.provenance.sources) {
        sources.append(sourceToString(s));
    }
    obj["sources"] = sources;

    if (reconciled.primaryIndex >= 0) {
        obj["primary_index"] = reconciled.primaryIndex;
    }
    if (reconciled.secondaryIndex >= 0) {
        obj["secondary_index"] = reconciled.secondaryIndex;
    }
    if (reconciled.provenance.kind == ProvenanceKind::Merged) {
        obj["iou"] = reconciled.iou;
        obj["superseded_id"] = reconciled.supersededId;
    }

    return obj;
}

QJsonObject reconcileResultToJson(const ReconcileResult& result)
{
    QJsonArray detections;
    for (const ReconciledDetection& r : result.detections) {
        detections.append(reconciledToJson(r));
    }

    QJsonObject summary;
    summary["count"] = result.detections.size();
    summary["merged"] = result.mergedPairs;
    summary["skipped_malformed"] = result.skippedMalformed;
    summary["skipped_zero_area"] = result.skippedZeroArea;
    summary["secondary_available"] = result.secondaryAvailable;

    QJsonObject obj;
    obj["detections"] = detections;
    obj["summary"] = summary;
    return obj;
}

// =====================================================================
//  Files
// =====================================================================

bool saveJsonFile(const QString& path, const QJsonDocument& doc, QString* errorMsg)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to write %1: %2").arg(path, file.errorString());
        return false;
    }

    if (file.write(doc.toJson(QJsonDocument::Indented)) < 0) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to write %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

bool loadDetections(const QString& path, DetectionList& detections, QString* errorMsg)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMsg) *errorMsg = QStringLiteral("Failed to read %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMsg) *errorMsg = QStringLiteral("Invalid JSON in %1: %2").arg(path, parseError.errorString());
        return false;
    }

    QJsonArray array = doc.isArray() ? doc.array()
                                     : doc.object()["detections"].toArray();

    DetectionList loaded;
    for (const QJsonValue& v : array) {
        std::optional<Detection> d = detectionFromJson(v.toObject(), errorMsg);
        if (!d) return false;
        loaded.append(*d);
    }

    detections = loaded;
    return true;
}

}  // namespace detection
}  // namespace takeoff
