// =====================================================================
//  src/takeoff/cli/climode.h — Command-line mode
// =====================================================================
//
//  Provides headless operation: single-command mode (reconcile,
//  script) and the interactive REPL.  Uses libtakeoff directly.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_CLIMODE_H
#define TAKEOFF_CLIMODE_H

#include <QString>

#include "sessionlog.h"
#include "cliengine.h"

namespace takeoff {

class CliMode {
public:
    CliMode();
    ~CliMode();

    CliEngine& engine() { return m_engine; }

    /// Reconcile two detector files and print or save the result.
    /// An empty secondary means the primary runs alone; an empty
    /// outPath prints the JSON to stdout.
    /// Returns 0 on success, 1 on failure.
    int runReconcile(const QString& primary,
                     const QString& secondary,
                     const QString& outPath);

    /// Run a command script ("-" or empty reads stdin) and exit.
    /// Stops at the first failing command.
    /// Returns 0 on success, 1 on failure.
    int runScript(const QString& scriptPath);

    /// Run the interactive REPL.
    /// Returns 0 on normal exit.
    int runInteractive();

private:
    void saveLog() const;

    SessionLog m_log;
    CliEngine  m_engine;
};

}  // namespace takeoff

#endif  // TAKEOFF_CLIMODE_H
