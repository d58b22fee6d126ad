// =====================================================================
//  src/takeoff/cli/cliengine.h — Command dispatch engine
// =====================================================================
//
//  Parses and executes takeoff commands for the REPL and for scripts.
//  All output is returned as QString rather than printed, so callers
//  decide where it goes.
//
//  The engine owns the session state: engine settings, the drawing's
//  calibration, and the result of the last reconciliation.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_CLIENGINE_H
#define TAKEOFF_CLIENGINE_H

#include <takeoff/settings.h>
#include <takeoff/detection/provider.h>
#include <takeoff/detection/reconciler.h>
#include <takeoff/measure/calibration.h>

#include <QString>
#include <QStringList>

#include <optional>

namespace takeoff {

class SessionLog;

/// Result of executing a command.
struct CliResult {
    int     exitCode = 0;    ///< 0 = success, non-zero = error
    QString output;          ///< Normal output text
    QString error;           ///< Error output text (if any)
    bool    requestExit = false;  ///< True if exit/quit was entered
};

class CliEngine {
public:
    explicit CliEngine(SessionLog& log);
    ~CliEngine();

    /// Execute a single command line.  Returns result with output.
    /// Every command except history and exit is recorded in the
    /// session log.
    CliResult execute(const QString& line);

    /// Known command names
    QStringList commandNames() const;

    QString buildPrompt() const;

    EngineSettings& settings() { return m_settings; }
    const EngineSettings& settings() const { return m_settings; }

    /// Fetch both detector files and reconcile them with the current
    /// settings.  An empty secondaryPath means no secondary detector.
    /// Returns nullopt and sets errorMsg if no detector produced a run.
    std::optional<detection::ReconcileResult> reconcileFiles(
        const QString& primaryPath,
        const QString& secondaryPath,
        QString* errorMsg = nullptr);

    /// Last reconciliation result, if any
    const std::optional<detection::ReconcileResult>& lastResult() const { return m_lastResult; }

private:
    CliResult dispatch(const QString& cmd, const QStringList& args);

    CliResult cmdHelp() const;
    CliResult cmdVersion() const;
    CliResult cmdSettings() const;
    CliResult cmdSet(const QStringList& args);
    CliResult cmdHistory(const QStringList& args);
    CliResult cmdCalibrate(const QStringList& args);
    CliResult cmdScale(const QStringList& args);
    CliResult cmdArea(const QStringList& args) const;
    CliResult cmdPerimeter(const QStringList& args) const;
    CliResult cmdDistance(const QStringList& args) const;
    CliResult cmdRecalc(const QStringList& args) const;
    CliResult cmdReconcile(const QStringList& args);
    CliResult cmdRooms(const QStringList& args) const;
    CliResult cmdSave(const QStringList& args) const;

    QString scaleSummary() const;

    SessionLog& m_log;

    EngineSettings m_settings;
    measure::CalibrationSession m_calibration;
    detection::RunSequencer m_sequencer;
    std::optional<detection::ReconcileResult> m_lastResult;
};

}  // namespace takeoff

#endif  // TAKEOFF_CLIENGINE_H
