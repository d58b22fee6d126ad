// =====================================================================
//  src/libtakeoff/takeoff/detection/provider.h — Detector sources
// =====================================================================
//
//  A DetectionProvider produces one DetectionRun per analysis.  The
//  reconciler only sees completed runs, so any number of providers can
//  sit behind this interface.
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_DETECTION_PROVIDER_H
#define TAKEOFF_DETECTION_PROVIDER_H

#include "detection.h"
#include "normalize.h"
#include "../core.h"

#include <QString>

namespace takeoff {
namespace detection {

// =====================================================================
//  Providers
// =====================================================================

/// Abstract detector
class TAKEOFF_EXPORT DetectionProvider {
public:
    virtual ~DetectionProvider() = default;

    /// Role of this detector in reconciliation
    virtual Source source() const = 0;

    /// Human-readable name for logs
    virtual QString name() const = 0;

    /// Run the detector.  Failure is reported as an unavailable run,
    /// never thrown.
    virtual DetectionRun fetch() = 0;
};

/// Detector whose output was saved as a prediction JSON file
class TAKEOFF_EXPORT JsonFileProvider : public DetectionProvider {
public:
    JsonFileProvider(const QString& path, const NormalizeOptions& options);

    Source source() const override { return m_options.source; }
    QString name() const override;
    DetectionRun fetch() override;

    const QString& path() const { return m_path; }

private:
    QString m_path;
    NormalizeOptions m_options;
};

// =====================================================================
//  Run Sequencing
// =====================================================================

/// Last-started, last-applied ordering of analysis runs.
///
/// Each run takes a token from begin().  When a run completes, its
/// result is applied only if shouldApply() accepts the token, so a slow
/// earlier run never overwrites a later one.
class TAKEOFF_EXPORT RunSequencer {
public:
    /// Issue the token for a newly started run
    quint64 begin();

    /// True if token belongs to the most recently started run and
    /// nothing newer has been applied
    bool shouldApply(quint64 token) const;

    /// Record that the run with token was applied
    void markApplied(quint64 token);

    quint64 latestStarted() const { return m_started; }
    quint64 lastApplied() const { return m_applied; }

private:
    quint64 m_started = 0;
    quint64 m_applied = 0;
};

}  // namespace detection
}  // namespace takeoff

#endif  // TAKEOFF_DETECTION_PROVIDER_H
