// =====================================================================
//  src/libtakeoff/logging.cpp — Logging categories
// =====================================================================
//
//  Part of libtakeoff.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/logging.h>

Q_LOGGING_CATEGORY(lcCalibration, "takeoff.calibration", QtInfoMsg)
Q_LOGGING_CATEGORY(lcReconcile,   "takeoff.reconcile",   QtInfoMsg)
Q_LOGGING_CATEGORY(lcDetection,   "takeoff.detection",   QtInfoMsg)
Q_LOGGING_CATEGORY(lcCli,         "takeoff.cli",         QtInfoMsg)
