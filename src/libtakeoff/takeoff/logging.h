// =====================================================================
//  src/libtakeoff/takeoff/logging.h — Logging categories
// =====================================================================
//
//  Qt categorized logging for libtakeoff.  Enable debug output with
//  the standard Qt rules, e.g.:
//
//    QT_LOGGING_RULES="takeoff.reconcile.debug=true"
//
//  The geometry kernel is pure and never logs.
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#ifndef TAKEOFF_LOGGING_H
#define TAKEOFF_LOGGING_H

#include "core.h"

#include <QLoggingCategory>

TAKEOFF_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCalibration)
TAKEOFF_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcReconcile)
TAKEOFF_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDetection)
TAKEOFF_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCli)

#endif  // TAKEOFF_LOGGING_H
