// =====================================================================
//  src/libtakeoff/detection/provider.cpp — Detector sources
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/detection/provider.h>
#include <takeoff/logging.h>

#include <QFile>
#include <QFileInfo>

namespace takeoff {
namespace detection {

// =====================================================================
//  JsonFileProvider
// =====================================================================

JsonFileProvider::JsonFileProvider(const QString& path, const NormalizeOptions& options)
    : m_path(path)
    , m_options(options)
{
}

QString JsonFileProvider::name() const
{
    return QStringLiteral("%1 (%2)").arg(QFileInfo(m_path).fileName(),
                                         sourceToString(m_options.source));
}

DetectionRun JsonFileProvider::fetch()
{
    QFile file(m_path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        QString error = QStringLiteral("Failed to read %1: %2").arg(m_path, file.errorString());
        qCWarning(lcDetection).noquote() << error;
        return DetectionRun::unavailable(m_options.source, error);
    }

    NormalizeResult normalized = normalizePredictionsJson(file.readAll(), m_options);
    if (!normalized.success) {
        QString error = QStringLiteral("%1: %2").arg(m_path, normalized.error);
        qCWarning(lcDetection).noquote() << error;
        return DetectionRun::unavailable(m_options.source, error);
    }

    DetectionRun run;
    run.source = m_options.source;
    run.available = true;
    run.detections = normalized.detections;

    qCDebug(lcDetection).noquote() << name() << "returned"
                                   << run.detections.size() << "detections";
    return run;
}

// =====================================================================
//  RunSequencer
// =====================================================================

quint64 RunSequencer::begin()
{
    return ++m_started;
}

bool RunSequencer::shouldApply(quint64 token) const
{
    return token != 0 && token == m_started && token > m_applied;
}

void RunSequencer::markApplied(quint64 token)
{
    if (token > m_applied) {
        m_applied = token;
    }
}

}  // namespace detection
}  // namespace takeoff
