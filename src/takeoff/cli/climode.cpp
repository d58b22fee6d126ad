// =====================================================================
//  src/takeoff/cli/climode.cpp — Command-line mode
// =====================================================================
//
//  The standalone CLI REPL.  Delegates command dispatch to CliEngine
//  and reads lines through QTextStream.
//
// =====================================================================

#include "climode.h"

#include <takeoff/core.h>
#include <takeoff/logging.h>
#include <takeoff/detection/serialization.h>

#include <QFile>
#include <QJsonDocument>
#include <QTextStream>

#include <iostream>

namespace takeoff {

CliMode::CliMode()
    : m_engine(m_log)
{
    QString errorMsg;
    if (!m_log.load(&errorMsg)) {
        qCWarning(lcCli).noquote() << "Could not read session log:" << errorMsg;
    }
}

CliMode::~CliMode()
{
    saveLog();
}

void CliMode::saveLog() const
{
    QString errorMsg;
    if (!m_log.save(&errorMsg)) {
        qCWarning(lcCli).noquote() << "Could not write session log:" << errorMsg;
    }
}

// ---- Single-command: reconcile --------------------------------------

int CliMode::runReconcile(const QString& primary,
                          const QString& secondary,
                          const QString& outPath)
{
    QString errorMsg;
    auto result = m_engine.reconcileFiles(primary, secondary, &errorMsg);
    if (!result) {
        std::cerr << "Error: " << errorMsg.toStdString() << std::endl;
        return 1;
    }

    QJsonDocument doc(detection::reconcileResultToJson(*result));

    if (outPath.isEmpty()) {
        std::cout << doc.toJson(QJsonDocument::Indented).toStdString();
        return 0;
    }

    if (!detection::saveJsonFile(outPath, doc, &errorMsg)) {
        std::cerr << "Error writing output: "
                  << errorMsg.toStdString() << std::endl;
        return 1;
    }

    std::cout << "Done. Wrote " << result->detections.size()
              << " detection(s) to " << outPath.toStdString() << std::endl;
    return 0;
}

// ---- Single-command: script -----------------------------------------

int CliMode::runScript(const QString& scriptPath)
{
    // "takeoff --script -" reads the script from stdin
    bool readFromStdin = scriptPath.isEmpty() || scriptPath == QLatin1String("-");

    QFile file;
    QTextStream in;

    if (readFromStdin) {
        if (!file.open(stdin, QIODevice::ReadOnly | QIODevice::Text)) {
            std::cerr << "Error: Could not open stdin for reading."
                      << std::endl;
            return 1;
        }
        in.setDevice(&file);
        std::cerr << "Reading script from stdin..." << std::endl;
    } else {
        file.setFileName(scriptPath);

        if (!file.exists()) {
            std::cerr << "Error: Script file not found: "
                      << scriptPath.toStdString() << std::endl;
            return 1;
        }

        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            std::cerr << "Error: Could not open script file: "
                      << file.errorString().toStdString() << std::endl;
            return 1;
        }
        in.setDevice(&file);

        std::cout << "Running script: " << scriptPath.toStdString() << std::endl;
    }

    int lineNum = 0;
    int commandCount = 0;

    while (!in.atEnd()) {
        QString line = in.readLine().trimmed();
        lineNum++;

        // Skip empty lines and comments
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) {
            continue;
        }

        commandCount++;

        CliResult result = m_engine.execute(line);

        if (!result.output.isEmpty()) {
            std::cout << "[" << lineNum << "] "
                      << result.output.toStdString() << std::endl;
        }

        if (result.exitCode != 0) {
            std::cerr << "Error at line " << lineNum << ": "
                      << result.error.toStdString() << std::endl;
            return 1;
        }

        if (result.requestExit) {
            break;
        }
    }

    std::cout << "\nScript completed: " << commandCount
              << " command(s) executed." << std::endl;
    return 0;
}

// ---- Interactive REPL -----------------------------------------------

int CliMode::runInteractive()
{
    std::cout << "takeoff " << takeoff::version()
              << " - Command-Line Mode" << std::endl;
    std::cout << "Type 'help' for available commands, "
                 "or 'exit' to quit." << std::endl;
    std::cout << "Session log: " << m_log.count() << " entries loaded from "
              << m_log.filePath().toStdString() << std::endl;
    std::cout << std::endl;

    QTextStream in(stdin);

    while (true) {
        std::cout << m_engine.buildPrompt().toStdString() << std::flush;

        QString line = in.readLine();
        if (line.isNull()) {
            // EOF
            std::cout << std::endl;
            break;
        }

        QString cmd = line.trimmed();
        if (cmd.isEmpty()) continue;

        CliResult result = m_engine.execute(cmd);

        if (!result.output.isEmpty()) {
            std::cout << result.output.toStdString() << std::endl;
        }
        if (!result.error.isEmpty()) {
            std::cerr << result.error.toStdString() << std::endl;
        }
        if (result.requestExit) {
            break;
        }
    }

    return 0;
}

}  // namespace takeoff
