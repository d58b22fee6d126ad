// =====================================================================
//  src/libtakeoff/takeoff/detection/reconciler.h — Multi-detector merge
// =====================================================================
//
//  Merges the output of a primary and a secondary detector into one
//  canonical list.  Detections of the same class whose regions overlap
//  by at least the IoU threshold are treated as one physical object;
//  the more confident of the pair is kept.
//
//  The merge is deterministic: secondary detections are visited in
//  order, and unmatched primary detections follow in their original
//  order.
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_DETECTION_RECONCILER_H
#define TAKEOFF_DETECTION_RECONCILER_H

#include "detection.h"
#include "../core.h"

#include <QString>
#include <QVector>

namespace takeoff {
namespace detection {

// =====================================================================
//  Provenance
// =====================================================================

/// Which detectors agreed on a reconciled detection
enum class ProvenanceKind {
    Primary,
    Secondary,
    Merged
};

struct Provenance {
    ProvenanceKind kind = ProvenanceKind::Primary;
    QVector<Source> sources;     ///< Contributing detectors, primary first

    static Provenance fromSource(Source source);
    static Provenance merged();

    bool operator==(const Provenance& other) const {
        return kind == other.kind && sources == other.sources;
    }
};

TAKEOFF_EXPORT QString provenanceToString(const Provenance& provenance);

/// One canonical detection per physical object
struct ReconciledDetection {
    Detection detection;          ///< The kept (winning) detection
    Provenance provenance;
    double confidence = 0.0;      ///< Winner's confidence
    int primaryIndex = -1;        ///< Index into the primary input, or -1
    int secondaryIndex = -1;      ///< Index into the secondary input, or -1
    double iou = 0.0;             ///< Overlap of a merged pair
    QString supersededId;         ///< Id of the discarded counterpart

    bool operator==(const ReconciledDetection& other) const;
};

// =====================================================================
//  Reconciliation
// =====================================================================

/// Default overlap above which two detections are the same object
constexpr double DEFAULT_IOU_THRESHOLD = 0.4;

struct ReconcileOptions {
    double iouThreshold = DEFAULT_IOU_THRESHOLD;
};

struct ReconcileResult {
    QVector<ReconciledDetection> detections;
    int skippedMalformed = 0;      ///< Missing class, region or confidence
    int skippedZeroArea = 0;       ///< Region encloses no area
    int mergedPairs = 0;
    bool secondaryAvailable = true;

    /// Just the kept detections, in output order
    DetectionList toDetectionList() const;
};

/// Why a detection cannot take part in reconciliation, or an empty
/// string if it can
TAKEOFF_EXPORT QString malformedReason(const Detection& detection);

/// Merge primary and secondary detections.
///
/// 1. For each secondary detection, in order, find the unclaimed
///    primary detection of the same class with the highest IoU.
/// 2. If that IoU is at least the threshold, emit one merged detection
///    carrying the more confident of the two (ties favor primary) and
///    claim the primary index.
/// 3. Otherwise emit the secondary detection on its own.
/// 4. Finally emit every unclaimed primary detection in order.
///
/// Malformed and zero-area detections are skipped and counted.  An
/// invalid threshold falls back to DEFAULT_IOU_THRESHOLD.
TAKEOFF_EXPORT ReconcileResult reconcile(
    const DetectionList& primary,
    const DetectionList& secondary,
    const ReconcileOptions& options = ReconcileOptions());

/// Merge two detector runs.  An unavailable secondary run degrades to a
/// passthrough of the primary run; this is logged, not an error.
TAKEOFF_EXPORT ReconcileResult reconcileRuns(
    const DetectionRun& primary,
    const DetectionRun& secondary,
    const ReconcileOptions& options = ReconcileOptions());

}  // namespace detection
}  // namespace takeoff

#endif  // TAKEOFF_DETECTION_RECONCILER_H
