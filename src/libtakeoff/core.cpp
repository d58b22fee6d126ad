// =====================================================================
//  src/libtakeoff/core.cpp -- Library initialization
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/core.h>
#include <takeoff/logging.h>

#include <QLoggingCategory>

namespace takeoff {

const char* version()
{
    return "0.3.0";
}

bool initialize(bool verbose)
{
    // QT_LOGGING_RULES from the environment still takes precedence
    // over filter rules set here.
    if (verbose) {
        QLoggingCategory::setFilterRules(
            QStringLiteral("takeoff.*.debug=true"));
    }

    qCDebug(lcCli) << "libtakeoff" << version() << "initialized";
    return true;
}

void shutdown()
{
    // Nothing to tear down: the library keeps no global state.
}

}  // namespace takeoff
