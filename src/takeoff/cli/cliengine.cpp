// =====================================================================
//  src/takeoff/cli/cliengine.cpp — Command dispatch engine
// =====================================================================

#include "cliengine.h"
#include "sessionlog.h"

#include <takeoff/core.h>
#include <takeoff/logging.h>
#include <takeoff/detection/grouping.h>
#include <takeoff/detection/serialization.h>
#include <takeoff/geometry/utils.h>
#include <takeoff/measure/dimensions.h>
#include <takeoff/measure/parsing.h>

#include <QJsonDocument>
#include <QRegularExpression>
#include <QSaveFile>

namespace takeoff {

namespace {

QString num(double value)
{
    return QString::number(value, 'f', 2);
}


CliResult failure(const QString& text)
{
    CliResult r;
    r.exitCode = 1;
    r.error = text;
    return r;
}

const QString POINTS_HINT = QStringLiteral(
    "Points are x,y pixel pairs separated by spaces or ';' "
    "(e.g., 0,0 100,0 100,50)");

}  // anonymous namespace

CliEngine::CliEngine(SessionLog& log)
    : m_log(log)
{
}

CliEngine::~CliEngine() = default;

QStringList CliEngine::commandNames() const
{
    return {
        QStringLiteral("help"),
        QStringLiteral("version"),
        QStringLiteral("settings"),
        QStringLiteral("set"),
        QStringLiteral("history"),
        QStringLiteral("calibrate"),
        QStringLiteral("scale"),
        QStringLiteral("area"),
        QStringLiteral("perimeter"),
        QStringLiteral("distance"),
        QStringLiteral("recalc"),
        QStringLiteral("reconcile"),
        QStringLiteral("rooms"),
        QStringLiteral("save"),
        QStringLiteral("exit"),
        QStringLiteral("quit"),
    };
}

QString CliEngine::buildPrompt() const
{
    if (m_calibration.hasScale()) {
        return QStringLiteral("takeoff[%1 px/ft]> ").arg(num(*m_calibration.pixelsPerFoot()));
    }
    return QStringLiteral("takeoff> ");
}

QString CliEngine::scaleSummary() const
{
    if (!m_calibration.hasScale()) {
        return QStringLiteral("no scale");
    }
    return QStringLiteral("%1 px/ft").arg(num(*m_calibration.pixelsPerFoot()));
}

// ---- Main dispatch --------------------------------------------------

CliResult CliEngine::execute(const QString& line)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    QStringList tokens = line.split(whitespace, Qt::SkipEmptyParts);

    if (tokens.isEmpty()) return {};

    QString cmd = tokens.first().toLower();
    QStringList args = tokens.mid(1);

    qCDebug(lcCli) << "execute" << tokens;

    if (cmd == QLatin1String("exit") ||
        cmd == QLatin1String("quit")) {
        CliResult r;
        r.requestExit = true;
        return r;
    }

    CliResult result = dispatch(cmd, args);

    if (cmd != QLatin1String("history")) {
        SessionEntry entry;
        entry.command = tokens.join(QLatin1Char(' '));
        entry.ok = result.exitCode == 0;
        const QString& text = entry.ok ? result.output : result.error;
        entry.result = text.section(QLatin1Char('\n'), 0, 0);
        entry.pixelsPerFoot = m_calibration.pixelsPerFoot();
        m_log.record(entry);
    }

    return result;
}

CliResult CliEngine::dispatch(const QString& cmd, const QStringList& args)
{
    if (cmd == QLatin1String("help"))      return cmdHelp();
    if (cmd == QLatin1String("version"))   return cmdVersion();
    if (cmd == QLatin1String("settings"))  return cmdSettings();
    if (cmd == QLatin1String("set"))       return cmdSet(args);
    if (cmd == QLatin1String("history"))   return cmdHistory(args);
    if (cmd == QLatin1String("calibrate")) return cmdCalibrate(args);
    if (cmd == QLatin1String("scale"))     return cmdScale(args);
    if (cmd == QLatin1String("area"))      return cmdArea(args);
    if (cmd == QLatin1String("perimeter")) return cmdPerimeter(args);
    if (cmd == QLatin1String("distance"))  return cmdDistance(args);
    if (cmd == QLatin1String("recalc"))    return cmdRecalc(args);
    if (cmd == QLatin1String("reconcile")) return cmdReconcile(args);
    if (cmd == QLatin1String("rooms"))     return cmdRooms(args);
    if (cmd == QLatin1String("save"))      return cmdSave(args);

    CliResult r;
    r.exitCode = 1;
    r.error = QStringLiteral("Unknown command: ") + cmd +
              QStringLiteral("\nType 'help' for available commands.");
    return r;
}

// ---- Individual commands --------------------------------------------

CliResult CliEngine::cmdHelp() const
{
    CliResult r;
    r.output = QStringLiteral(
        "Available commands:\n"
        "\n"
        "Calibration:\n"
        "  calibrate begin              Start a new reference line\n"
        "  calibrate point <x>,<y>      Place a reference point (two needed)\n"
        "  calibrate apply <dist> [ft|in]\n"
        "                               Set the real length of the line\n"
        "                               (11.33, 11'4\", 11-4 or 11 4)\n"
        "  calibrate reset              Discard unapplied points\n"
        "  calibrate status             Show calibration state\n"
        "  scale <drawing scale>        Use a printed scale (1/4\" = 1' or 1:48)\n"
        "\n"
        "Measurement:\n"
        "  area <points>                Polygon area\n"
        "  perimeter [open|closed] <points>\n"
        "                               Perimeter (closed by default)\n"
        "  distance <p> <a> [<b>]       Point-to-point or point-to-segment\n"
        "  recalc room|wall|opening <points>\n"
        "                               Display metrics for a region\n"
        "\n"
        "Detections:\n"
        "  reconcile <primary> [<secondary>]\n"
        "                               Merge two detector JSON files\n"
        "  rooms [file]                 Group detections by room\n"
        "  save <file>                  Save the last reconciliation\n"
        "\n"
        "Session:\n"
        "  settings                     Show engine settings\n"
        "  set <key> <value>            Change a setting (%1)\n"
        "  history [clear|max <n>]      Show or manage the session log\n"
        "  history export <file>        Write a replay script of the session\n"
        "  version                      Show takeoff version\n"
        "  help                         Show this help message\n"
        "  exit / quit                  Exit\n"
        "\n"
        "%2\n")
        .arg(settingKeys().join(QStringLiteral(", ")), POINTS_HINT);
    return r;
}

CliResult CliEngine::cmdVersion() const
{
    CliResult r;
    r.output = QStringLiteral("takeoff ") + QString::fromLatin1(takeoff::version());
    return r;
}

CliResult CliEngine::cmdSettings() const
{
    CliResult r;
    QJsonDocument doc(settingsToJson(m_settings));
    r.output = QString::fromUtf8(doc.toJson(QJsonDocument::Indented)).trimmed();
    return r;
}

CliResult CliEngine::cmdSet(const QStringList& args)
{
    if (args.size() < 2) {
        return failure(QStringLiteral("Usage: set <key> <value>\n  Keys: ") +
                     settingKeys().join(QStringLiteral(", ")));
    }

    QString errorMsg;
    QString value = args.mid(1).join(QLatin1Char(' '));
    if (!setSetting(m_settings, args[0], value, &errorMsg)) {
        return failure(errorMsg);
    }

    CliResult r;
    r.output = QStringLiteral("%1 = %2").arg(args[0], value);
    return r;
}

CliResult CliEngine::cmdHistory(const QStringList& args)
{
    CliResult r;

    if (args.isEmpty()) {
        const QVector<SessionEntry>& entries = m_log.entries();
        QStringList lines;
        for (int i = 0; i < entries.size(); ++i) {
            const SessionEntry& entry = entries[i];
            QString line = QStringLiteral("%1  %2  %3")
                               .arg(i + 1, 4)
                               .arg(entry.ok ? QStringLiteral("ok  ") : QStringLiteral("FAIL"))
                               .arg(entry.command);
            if (!entry.result.isEmpty()) {
                line += QStringLiteral("  -> ") + entry.result;
            }
            lines << line;
        }
        r.output = lines.join(QLatin1Char('\n'));
        return r;
    }

    QString sub = args[0].toLower();
    if (sub == QLatin1String("clear")) {
        m_log.clear();
        r.output = QStringLiteral("History cleared.");
        return r;
    }
    if (sub == QLatin1String("max") && args.size() == 2) {
        bool ok = false;
        int n = args[1].toInt(&ok);
        if (!ok || n < 1) {
            return failure(QStringLiteral("history max expects a positive number"));
        }
        m_log.setMaxEntries(n);
        r.output = QStringLiteral("History limited to %1 entries.").arg(n);
        return r;
    }
    if (sub == QLatin1String("export") && args.size() == 2) {
        QSaveFile file(args[1]);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
            return failure(QStringLiteral("Cannot write %1: %2").arg(args[1], file.errorString()));
        }
        file.write(m_log.replayScript().toUtf8());
        if (!file.commit()) {
            return failure(QStringLiteral("Cannot write %1: %2").arg(args[1], file.errorString()));
        }
        r.output = QStringLiteral("Wrote replay script to %1 (run with: takeoff --script %1)")
                       .arg(args[1]);
        return r;
    }

    return failure(QStringLiteral("Usage: history [clear|max <n>|export <file>]"));
}

CliResult CliEngine::cmdCalibrate(const QStringList& args)
{
    static const QString calibrateUsage = QStringLiteral(
        "Usage: calibrate begin|point <x>,<y>|apply <distance> [ft|in]|reset|status\n"
        "\n"
        "Example:\n"
        "  calibrate begin\n"
        "  calibrate point 100,200\n"
        "  calibrate point 236,200\n"
        "  calibrate apply 11-4");

    if (args.isEmpty()) {
        return failure(calibrateUsage);
    }

    CliResult r;
    QString sub = args[0].toLower();

    if (sub == QLatin1String("begin")) {
        m_calibration.beginCalibration();
        r.output = QStringLiteral("Calibration started. Place two reference points.");
        return r;
    }

    if (sub == QLatin1String("reset")) {
        m_calibration.reset();
        r.output = QStringLiteral("Calibration reset (%1).").arg(scaleSummary());
        return r;
    }

    if (sub == QLatin1String("status")) {
        QStringList lines;
        lines << QStringLiteral("State: ") +
                     measure::calibrationStateToString(m_calibration.state());
        for (int i = 0; i < m_calibration.pointCount(); ++i) {
            QPointF p = m_calibration.point(i);
            lines << QStringLiteral("Point %1: (%2, %3)").arg(i + 1).arg(p.x()).arg(p.y());
        }
        lines << QStringLiteral("Scale: ") + scaleSummary();
        r.output = lines.join(QLatin1Char('\n'));
        return r;
    }

    if (sub == QLatin1String("point")) {
        if (args.size() != 2) {
            return failure(QStringLiteral("Usage: calibrate point <x>,<y>"));
        }
        std::optional<QPointF> p = measure::parsePoint(args[1]);
        if (!p) {
            return failure(QStringLiteral("Invalid coordinates. Use format: x,y (e.g., 10,20)"));
        }
        if (!m_calibration.addPoint(*p)) {
            return failure(QStringLiteral(
                "Calibration already has two points. Use 'calibrate reset' first."));
        }
        r.output = QStringLiteral("Point %1 at (%2, %3)")
                       .arg(m_calibration.pointCount()).arg(p->x()).arg(p->y());
        return r;
    }

    if (sub == QLatin1String("apply")) {
        QStringList distance = args.mid(1);
        measure::DistanceUnit unit = m_settings.defaultUnit;

        if (distance.size() > 1) {
            if (auto parsed = measure::distanceUnitFromString(distance.last())) {
                unit = *parsed;
                distance.removeLast();
            }
        }
        if (distance.isEmpty()) {
            return failure(QStringLiteral("Usage: calibrate apply <distance> [ft|in]"));
        }

        measure::ScaleResult result =
            m_calibration.applyDistance(distance.join(QLatin1Char(' ')), unit);
        if (!result.valid) {
            return failure(result.message);
        }

        r.output = QStringLiteral("Scale: %1 px/ft (%2 px = %3 ft)")
                       .arg(num(result.pixelsPerFoot), num(result.pixelDistance),
                            QString::number(result.distanceFeet, 'f', 4));
        return r;
    }

    return failure(calibrateUsage);
}

CliResult CliEngine::cmdScale(const QStringList& args)
{
    if (args.isEmpty()) {
        return failure(QStringLiteral(
            "Usage: scale <drawing scale>\n"
            "  e.g., scale 1/4\" = 1'   or   scale 1:48\n"
            "  Pixels per foot assume the 'dpi' setting."));
    }

    measure::ParsedDrawingScale parsed = measure::parseDrawingScale(args.join(QLatin1Char(' ')));
    if (!parsed.valid) {
        return failure(parsed.error);
    }

    double ppf = measure::pixelsPerFootFromDrawingScale(parsed.inchesPerFoot, m_settings.dpi);
    if (!m_calibration.setPixelsPerFoot(ppf)) {
        return failure(QStringLiteral("Drawing scale gives no usable pixels per foot"));
    }

    CliResult r;
    r.output = QStringLiteral("Scale: %1 px/ft (%2 in/ft at %3 dpi)")
                   .arg(num(ppf), QString::number(parsed.inchesPerFoot, 'g', 6),
                        QString::number(m_settings.dpi, 'g', 6));
    return r;
}

CliResult CliEngine::cmdArea(const QStringList& args) const
{
    std::optional<geometry::VertexSequence> points = measure::parsePointList(args);
    if (args.isEmpty() || !points) {
        return failure(QStringLiteral("Usage: area <points>\n") + POINTS_HINT);
    }

    double px = geometry::polygonArea(*points);

    CliResult r;
    r.output = QStringLiteral("Area: %1 px^2").arg(num(px));
    if (auto s = m_calibration.pixelsPerFoot()) {
        r.output += QStringLiteral(" = %1 sq ft").arg(num(px / (*s * *s)));
    }
    return r;
}

CliResult CliEngine::cmdPerimeter(const QStringList& args) const
{
    QStringList rest = args;
    bool closed = true;

    if (!rest.isEmpty()) {
        QString mode = rest.first().toLower();
        if (mode == QLatin1String("open") || mode == QLatin1String("closed")) {
            closed = mode == QLatin1String("closed");
            rest.removeFirst();
        }
    }

    std::optional<geometry::VertexSequence> points = measure::parsePointList(rest);
    if (rest.isEmpty() || !points) {
        return failure(QStringLiteral("Usage: perimeter [open|closed] <points>\n") + POINTS_HINT);
    }

    double px = geometry::perimeter(*points, closed);

    CliResult r;
    r.output = QStringLiteral("%1: %2 px")
                   .arg(closed ? QStringLiteral("Perimeter") : QStringLiteral("Length"), num(px));
    if (auto s = m_calibration.pixelsPerFoot()) {
        r.output += QStringLiteral(" = %1 ft").arg(num(px / *s));
    }
    return r;
}

CliResult CliEngine::cmdDistance(const QStringList& args) const
{
    std::optional<geometry::VertexSequence> points = measure::parsePointList(args);
    if (!points || points->size() < 2 || points->size() > 3) {
        return failure(QStringLiteral(
            "Usage: distance <p> <a> [<b>]\n"
            "  Two points: distance between them.\n"
            "  Three points: distance from p to segment a-b."));
    }

    const geometry::VertexSequence& p = *points;
    double px = p.size() == 2 ? geometry::distance(p[0], p[1])
                              : geometry::pointToSegmentDistance(p[0], p[1], p[2]);

    CliResult r;
    r.output = QStringLiteral("Distance: %1 px").arg(num(px));
    if (auto s = m_calibration.pixelsPerFoot()) {
        r.output += QStringLiteral(" = %1 ft").arg(num(px / *s));
    }
    return r;
}

CliResult CliEngine::cmdRecalc(const QStringList& args) const
{
    if (args.size() < 2) {
        return failure(QStringLiteral("Usage: recalc room|wall|opening <points>\n") + POINTS_HINT);
    }

    std::optional<measure::Category> category = measure::categoryFromString(args[0]);
    if (!category) {
        return failure(QStringLiteral("Unknown category: %1 (use room, wall or opening)").arg(args[0]));
    }

    std::optional<geometry::VertexSequence> points = measure::parsePointList(args.mid(1));
    if (!points) {
        return failure(POINTS_HINT);
    }

    if (!m_calibration.hasScale()) {
        return failure(QStringLiteral("No scale. Calibrate or set a drawing scale first."));
    }

    measure::DisplayMetrics metrics = measure::recalcDimensions(
        *points, *m_calibration.pixelsPerFoot(), *category);

    QStringList lines;
    if (metrics.areaSqft)    lines << QStringLiteral("area_sqft: %1").arg(num(*metrics.areaSqft));
    if (metrics.perimeterFt) lines << QStringLiteral("perimeter_ft: %1").arg(num(*metrics.perimeterFt));
    if (lines.isEmpty()) {
        lines << QStringLiteral("Openings are counted, not measured.");
    }

    CliResult r;
    r.output = lines.join(QLatin1Char('\n'));
    return r;
}

std::optional<detection::ReconcileResult> CliEngine::reconcileFiles(
    const QString& primaryPath,
    const QString& secondaryPath,
    QString* errorMsg)
{
    detection::NormalizeOptions options;
    options.classFilter = m_settings.classFilter;
    options.minConfidence = m_settings.minConfidence;
    options.pixelsPerFoot = m_calibration.pixelsPerFoot();

    quint64 token = m_sequencer.begin();

    options.source = detection::Source::Primary;
    detection::JsonFileProvider primaryProvider(primaryPath, options);
    detection::DetectionRun primary = primaryProvider.fetch();
    primary.token = token;

    detection::DetectionRun secondary;
    if (secondaryPath.isEmpty()) {
        secondary = detection::DetectionRun::unavailable(
            detection::Source::Secondary, QStringLiteral("no secondary detector configured"));
    } else {
        options.source = detection::Source::Secondary;
        detection::JsonFileProvider secondaryProvider(secondaryPath, options);
        secondary = secondaryProvider.fetch();
    }
    secondary.token = token;

    if (!primary.available && !secondary.available) {
        if (errorMsg) *errorMsg = primary.error;
        return std::nullopt;
    }

    detection::ReconcileResult result =
        detection::reconcileRuns(primary, secondary, m_settings.reconcileOptions());

    if (m_sequencer.shouldApply(token)) {
        m_sequencer.markApplied(token);
        m_lastResult = result;
    } else {
        qCDebug(lcCli) << "Discarding superseded run" << token;
    }

    return result;
}

CliResult CliEngine::cmdReconcile(const QStringList& args)
{
    if (args.isEmpty() || args.size() > 2) {
        return failure(QStringLiteral(
            "Usage: reconcile <primary.json> [<secondary.json>]\n"
            "  Files hold detector predictions ({\"predictions\": [...]})."));
    }

    QString errorMsg;
    auto result = reconcileFiles(args[0], args.value(1), &errorMsg);
    if (!result) {
        return failure(errorMsg);
    }

    QStringList lines;
    lines << QStringLiteral("%1 detection(s), %2 merged, %3 malformed, %4 zero-area%5")
                 .arg(result->detections.size())
                 .arg(result->mergedPairs)
                 .arg(result->skippedMalformed)
                 .arg(result->skippedZeroArea)
                 .arg(result->secondaryAvailable ? QString()
                                                 : QStringLiteral(" (secondary unavailable)"));

    for (const detection::ReconciledDetection& rd : result->detections) {
        lines << QStringLiteral("  %1  %2  %3  %4")
                     .arg(detection::provenanceToString(rd.provenance), -9)
                     .arg(rd.detection.label, -12)
                     .arg(num(rd.confidence))
                     .arg(rd.detection.id);
    }

    CliResult r;
    r.output = lines.join(QLatin1Char('\n'));
    return r;
}

CliResult CliEngine::cmdRooms(const QStringList& args) const
{
    detection::DetectionList detections;

    if (!args.isEmpty()) {
        QString errorMsg;
        if (!detection::loadDetections(args[0], detections, &errorMsg)) {
            return failure(errorMsg);
        }
    } else if (m_lastResult) {
        detections = m_lastResult->toDetectionList();
    } else {
        return failure(QStringLiteral("Nothing to group. Run 'reconcile' or give a file."));
    }

    detection::DetectionList rooms, items;
    for (const detection::Detection& d : detections) {
        if (d.category == measure::Category::Room) {
            rooms.append(d);
        } else {
            items.append(d);
        }
    }

    detection::RoomGrouping grouping =
        detection::groupByRoom(rooms, items, m_calibration.pixelsPerFoot());

    QStringList lines;
    for (const detection::RoomSummary& room : grouping.rooms) {
        QString size = room.areaSqft
            ? QStringLiteral("%1 sq ft, %2 ft").arg(num(*room.areaSqft), num(*room.perimeterFt))
            : QStringLiteral("%1 px^2, %2 px").arg(num(room.areaPx), num(room.perimeterPx));
        lines << QStringLiteral("%1 (%2): %3, %4 door(s), %5 window(s), %6 wall(s)")
                     .arg(room.roomId, room.label, size)
                     .arg(room.doorCount)
                     .arg(room.windowCount)
                     .arg(room.wallIds.size());
    }
    lines << QStringLiteral("Unassigned: %1").arg(grouping.unassigned.size());

    CliResult r;
    r.output = lines.join(QLatin1Char('\n'));
    return r;
}

CliResult CliEngine::cmdSave(const QStringList& args) const
{
    if (args.size() != 1) {
        return failure(QStringLiteral("Usage: save <file>"));
    }
    if (!m_lastResult) {
        return failure(QStringLiteral("Nothing to save. Run 'reconcile' first."));
    }

    QString errorMsg;
    QJsonDocument doc(detection::reconcileResultToJson(*m_lastResult));
    if (!detection::saveJsonFile(args[0], doc, &errorMsg)) {
        return failure(errorMsg);
    }

    CliResult r;
    r.output = QStringLiteral("Saved %1 detection(s) to %2")
                   .arg(m_lastResult->detections.size()).arg(args[0]);
    return r;
}

}  // namespace takeoff
