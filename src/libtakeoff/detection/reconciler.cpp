// =====================================================================
//  src/libtakeoff/detection/reconciler.cpp — Multi-detector merge
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/detection/reconciler.h>
#include <takeoff/geometry/algorithms.h>
#include <takeoff/geometry/utils.h>
#include <takeoff/logging.h>

#include <cmath>

namespace takeoff {
namespace detection {

// =====================================================================
//  Provenance
// =====================================================================

Provenance Provenance::fromSource(Source source)
{
    Provenance p;
    p.kind = source == Source::Secondary ? ProvenanceKind::Secondary
                                         : ProvenanceKind::Primary;
    p.sources = { source };
    return p;
}

Provenance Provenance::merged()
{
    Provenance p;
    p.kind = ProvenanceKind::Merged;
    p.sources = { Source::Primary, Source::Secondary };
    return p;
}

QString provenanceToString(const Provenance& provenance)
{
    switch (provenance.kind) {
    case ProvenanceKind::Primary:   return QStringLiteral("primary");
    case ProvenanceKind::Secondary: return QStringLiteral("secondary");
    case ProvenanceKind::Merged:    return QStringLiteral("merged");
    }
    return QString();
}

bool ReconciledDetection::operator==(const ReconciledDetection& other) const
{
    return detection == other.detection &&
           provenance == other.provenance &&
           confidence == other.confidence &&
           primaryIndex == other.primaryIndex &&
           secondaryIndex == other.secondaryIndex &&
           iou == other.iou &&
           supersededId == other.supersededId;
}

DetectionList ReconcileResult::toDetectionList() const
{
    DetectionList list;
    list.reserve(detections.size());
    for (const ReconciledDetection& r : detections) {
        list.append(r.detection);
    }
    return list;
}

// =====================================================================
//  Validation
// =====================================================================

QString malformedReason(const Detection& detection)
{
    if (detection.label.trimmed().isEmpty()) {
        return QStringLiteral("missing class");
    }
    if (detection.region.size() < 3) {
        return QStringLiteral("region has fewer than 3 vertices");
    }
    if (!geometry::allFinite(detection.region)) {
        return QStringLiteral("region has non-finite coordinates");
    }
    if (!std::isfinite(detection.confidence) ||
        detection.confidence < 0.0 || detection.confidence > 1.0) {
        return QStringLiteral("confidence outside [0,1]");
    }
    return QString();
}

namespace {

// Marks which detections of one input take part in matching
QVector<bool> screen(
    const DetectionList& list,
    Source source,
    ReconcileResult& result)
{
    QVector<bool> usable(list.size(), false);

    for (int i = 0; i < list.size(); ++i) {
        const Detection& d = list[i];

        QString reason = malformedReason(d);
        if (!reason.isEmpty()) {
            ++result.skippedMalformed;
            qCWarning(lcReconcile).noquote()
                << "Skipping malformed" << sourceToString(source)
                << "detection" << i << QStringLiteral("(%1)").arg(d.id) << "-" << reason;
            continue;
        }

        if (geometry::polygonArea(d.region) < geometry::MIN_REGION_AREA) {
            ++result.skippedZeroArea;
            qCDebug(lcReconcile).noquote()
                << "Skipping zero-area" << sourceToString(source)
                << "detection" << d.id;
            continue;
        }

        usable[i] = true;
    }

    return usable;
}

double effectiveThreshold(double threshold)
{
    if (!std::isfinite(threshold) || threshold <= 0.0 || threshold > 1.0) {
        qCWarning(lcReconcile) << "Invalid IoU threshold" << threshold
                               << "- using" << DEFAULT_IOU_THRESHOLD;
        return DEFAULT_IOU_THRESHOLD;
    }
    return threshold;
}

}  // anonymous namespace

// =====================================================================
//  Reconciliation
// =====================================================================

ReconcileResult reconcile(
    const DetectionList& primary,
    const DetectionList& secondary,
    const ReconcileOptions& options)
{
    ReconcileResult result;
    const double threshold = effectiveThreshold(options.iouThreshold);

    QVector<bool> primaryOk = screen(primary, Source::Primary, result);
    QVector<bool> secondaryOk = screen(secondary, Source::Secondary, result);

    QVector<bool> claimed(primary.size(), false);

    for (int s = 0; s < secondary.size(); ++s) {
        if (!secondaryOk[s]) continue;

        const Detection& sd = secondary[s];

        int bestIndex = -1;
        double bestIou = 0.0;

        for (int p = 0; p < primary.size(); ++p) {
            if (claimed[p] || !primaryOk[p]) continue;
            if (!sameClass(primary[p].label, sd.label)) continue;

            double iou = geometry::intersectionOverUnion(primary[p].region, sd.region);

            // Strictly greater: equal overlaps resolve to the lowest index
            if (iou > bestIou) {
                bestIou = iou;
                bestIndex = p;
            }
        }

        ReconciledDetection out;
        out.secondaryIndex = s;

        if (bestIndex >= 0 && bestIou >= threshold) {
            const Detection& pd = primary[bestIndex];
            bool primaryWins = pd.confidence >= sd.confidence;

            claimed[bestIndex] = true;

            out.detection = primaryWins ? pd : sd;
            out.supersededId = primaryWins ? sd.id : pd.id;
            out.provenance = Provenance::merged();
            out.primaryIndex = bestIndex;
            out.iou = bestIou;
            ++result.mergedPairs;

            qCDebug(lcReconcile).noquote()
                << "Merged" << pd.id << "and" << sd.id
                << QStringLiteral("(%1, IoU %2), kept").arg(sd.label).arg(bestIou)
                << out.detection.id;
        } else {
            out.detection = sd;
            out.provenance = Provenance::fromSource(Source::Secondary);
        }

        out.confidence = out.detection.confidence;
        result.detections.append(out);
    }

    for (int p = 0; p < primary.size(); ++p) {
        if (claimed[p] || !primaryOk[p]) continue;

        ReconciledDetection out;
        out.detection = primary[p];
        out.provenance = Provenance::fromSource(Source::Primary);
        out.confidence = primary[p].confidence;
        out.primaryIndex = p;
        result.detections.append(out);
    }

    qCInfo(lcReconcile).nospace()
        << "Reconciled " << primary.size() << " primary + " << secondary.size()
        << " secondary -> " << result.detections.size() << " ("
        << result.mergedPairs << " merged, " << result.skippedMalformed
        << " malformed, " << result.skippedZeroArea << " zero-area)";

    return result;
}

ReconcileResult reconcileRuns(
    const DetectionRun& primary,
    const DetectionRun& secondary,
    const ReconcileOptions& options)
{
    if (!primary.available) {
        qCWarning(lcReconcile).noquote()
            << "Primary detector unavailable:" << primary.error;
    }

    if (!secondary.available) {
        qCInfo(lcReconcile).noquote()
            << "Secondary detector unavailable, passing primary through:"
            << secondary.error;

        ReconcileResult result = reconcile(
            primary.available ? primary.detections : DetectionList(),
            DetectionList(), options);
        result.secondaryAvailable = false;
        return result;
    }

    return reconcile(primary.available ? primary.detections : DetectionList(),
                     secondary.detections, options);
}

}  // namespace detection
}  // namespace takeoff
