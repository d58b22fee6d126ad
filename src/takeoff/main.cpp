// =====================================================================
//  src/takeoff/main.cpp — takeoff startup dispatcher
// =====================================================================
//
//  Determines the startup mode:
//
//    1. --reconcile <primary> [<secondary>]  → one-shot reconciliation
//    2. --script <file|->                    → run a command script
//    3. otherwise                            → interactive REPL
//
//  --config loads engine settings from a JSON file before any mode
//  runs; --iou overrides the overlap threshold from that file.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <takeoff/core.h>
#include <takeoff/settings.h>

#include "cli/climode.h"

#include <QCoreApplication>

#include <iostream>

// ---- Helper: parse command-line flags --------------------------------

struct StartupFlags {
    bool reconcile = false;
    bool script    = false;
    bool verbose   = false;
    bool help      = false;
    bool version   = false;
    QString primaryPath;
    QString secondaryPath;
    QString scriptPath;
    QString outPath;       // --out <file.json>
    QString configPath;    // --config <settings.json>
    QString iou;           // --iou <threshold>
    QString badFlag;
};

static StartupFlags parseFlags(int argc, char* argv[])
{
    StartupFlags flags;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == QLatin1String("--reconcile") && i + 1 < argc) {
            flags.reconcile   = true;
            flags.primaryPath = QString::fromLocal8Bit(argv[++i]);
            if (i + 1 < argc && !QString::fromLocal8Bit(argv[i + 1]).startsWith(QLatin1String("--"))) {
                flags.secondaryPath = QString::fromLocal8Bit(argv[++i]);
            }
        }
        else if (arg == QLatin1String("--script") && i + 1 < argc) {
            flags.script     = true;
            flags.scriptPath = QString::fromLocal8Bit(argv[++i]);
        }
        else if (arg == QLatin1String("--out") && i + 1 < argc) {
            flags.outPath = QString::fromLocal8Bit(argv[++i]);
        }
        else if (arg == QLatin1String("--config") && i + 1 < argc) {
            flags.configPath = QString::fromLocal8Bit(argv[++i]);
        }
        else if (arg == QLatin1String("--iou") && i + 1 < argc) {
            flags.iou = QString::fromLocal8Bit(argv[++i]);
        }
        else if (arg == QLatin1String("--verbose") || arg == QLatin1String("-v")) {
            flags.verbose = true;
        }
        else if (arg == QLatin1String("--help") || arg == QLatin1String("-h")) {
            flags.help = true;
        }
        else if (arg == QLatin1String("--version")) {
            flags.version = true;
        }
        else if (flags.badFlag.isEmpty()) {
            flags.badFlag = arg;
        }
    }

    return flags;
}

static void printUsage()
{
    std::cout <<
        "Usage: takeoff [options]\n"
        "\n"
        "  --reconcile <primary.json> [<secondary.json>]\n"
        "                        Merge detector predictions and exit\n"
        "  --out <file.json>     Write the reconciled result to a file\n"
        "  --iou <threshold>     Overlap threshold in (0, 1] (default 0.4)\n"
        "  --script <file|->     Run takeoff commands from a file or stdin\n"
        "  --config <file.json>  Load engine settings\n"
        "  --verbose, -v         Enable debug logging\n"
        "  --version             Print version and exit\n"
        "  --help, -h            Print this help and exit\n"
        "\n"
        "With no mode flag, takeoff starts an interactive shell.\n";
}

// ---- main ------------------------------------------------------------

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("takeoff"));
    app.setApplicationVersion(QString::fromLatin1(takeoff::version()));

    StartupFlags flags = parseFlags(argc, argv);

    if (!flags.badFlag.isEmpty()) {
        std::cerr << "Unknown or incomplete option: "
                  << flags.badFlag.toStdString() << std::endl;
        printUsage();
        return 2;
    }
    if (flags.help) {
        printUsage();
        return 0;
    }
    if (flags.version) {
        std::cout << "takeoff " << takeoff::version() << std::endl;
        return 0;
    }

    if (!takeoff::initialize(flags.verbose)) {
        std::cerr << "Fatal: failed to initialize takeoff core library."
                  << std::endl;
        return 1;
    }

    int result = 0;
    {
        takeoff::CliMode cli;
        QString errorMsg;

        if (!flags.configPath.isEmpty() &&
            !takeoff::loadSettings(flags.configPath, cli.engine().settings(), &errorMsg)) {
            std::cerr << "Error: " << errorMsg.toStdString() << std::endl;
            takeoff::shutdown();
            return 1;
        }

        if (!flags.iou.isEmpty() &&
            !takeoff::setSetting(cli.engine().settings(),
                                 QStringLiteral("iou_threshold"), flags.iou, &errorMsg)) {
            std::cerr << "Error: " << errorMsg.toStdString() << std::endl;
            takeoff::shutdown();
            return 1;
        }

        if (flags.reconcile) {
            result = cli.runReconcile(flags.primaryPath, flags.secondaryPath, flags.outPath);
        } else if (flags.script) {
            result = cli.runScript(flags.scriptPath);
        } else {
            result = cli.runInteractive();
        }
    }

    takeoff::shutdown();
    return result;
}
