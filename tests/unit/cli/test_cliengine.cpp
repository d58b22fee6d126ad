/**
 * @file test_cliengine.cpp
 * @brief Unit tests for command dispatch in the takeoff shell
 */

#include "cli/cliengine.h"
#include "cli/sessionlog.h"

#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

using namespace takeoff;

namespace {

bool writeFile(const QString& path, const QByteArray& contents) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) return false;
    return file.write(contents) == contents.size();
}

const QByteArray PRIMARY_JSON =
    "{\"predictions\": ["
    " {\"class\": \"door\", \"confidence\": 0.9,"
    "  \"points\": [{\"x\":0,\"y\":0},{\"x\":10,\"y\":0},{\"x\":10,\"y\":10},{\"x\":0,\"y\":10}]},"
    " {\"class\": \"room\", \"confidence\": 0.8,"
    "  \"points\": [{\"x\":-50,\"y\":-50},{\"x\":150,\"y\":-50},{\"x\":150,\"y\":150},{\"x\":-50,\"y\":150}]}"
    "]}";

const QByteArray SECONDARY_JSON =
    "{\"predictions\": ["
    " {\"class\": \"door\", \"confidence\": 0.7,"
    "  \"points\": [{\"x\":2.5,\"y\":0},{\"x\":12.5,\"y\":0},{\"x\":12.5,\"y\":10},{\"x\":2.5,\"y\":10}]}"
    "]}";

}  // namespace

class CliEngineTest : public ::testing::Test {
protected:
    CliEngineTest()
        : log(dir.filePath(QStringLiteral("session.json")))
        , engine(log) {}

    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
    }

    CliResult run(const QString& line) {
        return engine.execute(line);
    }

    QTemporaryDir dir;
    SessionLog log;
    CliEngine engine;
};

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(CliEngineTest, EmptyLineDoesNothing) {
    CliResult r = run(QStringLiteral("   "));
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_TRUE(r.output.isEmpty());
}

TEST_F(CliEngineTest, UnknownCommand) {
    CliResult r = run(QStringLiteral("frobnicate"));
    EXPECT_EQ(r.exitCode, 1);
    EXPECT_TRUE(r.error.startsWith(QStringLiteral("Unknown command: frobnicate")));
}

TEST_F(CliEngineTest, ExitRequestsExit) {
    EXPECT_TRUE(run(QStringLiteral("exit")).requestExit);
    EXPECT_TRUE(run(QStringLiteral("QUIT")).requestExit);
}

TEST_F(CliEngineTest, HelpListsCommands) {
    CliResult r = run(QStringLiteral("help"));
    EXPECT_EQ(r.exitCode, 0);
    for (const QString& cmd : { QStringLiteral("calibrate"), QStringLiteral("reconcile"),
                                QStringLiteral("recalc"), QStringLiteral("rooms") }) {
        EXPECT_TRUE(r.output.contains(cmd)) << cmd.toStdString();
        EXPECT_TRUE(engine.commandNames().contains(cmd));
    }
}

// ============================================================================
// Calibration
// ============================================================================

TEST_F(CliEngineTest, CalibrationFlow) {
    EXPECT_EQ(engine.buildPrompt(), QStringLiteral("takeoff> "));

    EXPECT_EQ(run(QStringLiteral("calibrate begin")).exitCode, 0);
    EXPECT_EQ(run(QStringLiteral("calibrate point 0,0")).exitCode, 0);
    EXPECT_EQ(run(QStringLiteral("calibrate point 136,0")).exitCode, 0);

    CliResult r = run(QStringLiteral("calibrate apply 11-4"));
    ASSERT_EQ(r.exitCode, 0) << r.error.toStdString();
    EXPECT_TRUE(r.output.startsWith(QStringLiteral("Scale: 12.00 px/ft")));
    EXPECT_EQ(engine.buildPrompt(), QStringLiteral("takeoff[12.00 px/ft]> "));

    CliResult status = run(QStringLiteral("calibrate status"));
    EXPECT_TRUE(status.output.contains(QStringLiteral("State: applied")));
}

TEST_F(CliEngineTest, CalibrationWithInchUnit) {
    run(QStringLiteral("calibrate point 0,0"));
    run(QStringLiteral("calibrate point 100,0"));

    CliResult r = run(QStringLiteral("calibrate apply 120 in"));
    ASSERT_EQ(r.exitCode, 0) << r.error.toStdString();
    EXPECT_TRUE(r.output.startsWith(QStringLiteral("Scale: 10.00 px/ft")));
}

TEST_F(CliEngineTest, CalibrationErrors) {
    EXPECT_EQ(run(QStringLiteral("calibrate apply 10")).exitCode, 1);
    EXPECT_EQ(run(QStringLiteral("calibrate point ten,0")).exitCode, 1);

    run(QStringLiteral("calibrate point 0,0"));
    run(QStringLiteral("calibrate point 0,0"));
    CliResult r = run(QStringLiteral("calibrate apply 10"));
    EXPECT_EQ(r.exitCode, 1);
    EXPECT_FALSE(r.error.isEmpty());

    EXPECT_EQ(run(QStringLiteral("calibrate point 5,5")).exitCode, 1);
    EXPECT_EQ(run(QStringLiteral("calibrate reset")).exitCode, 0);
    EXPECT_EQ(run(QStringLiteral("calibrate point 5,5")).exitCode, 0);
}

TEST_F(CliEngineTest, DrawingScale) {
    CliResult r = run(QStringLiteral("scale 1/4\" = 1'"));
    ASSERT_EQ(r.exitCode, 0) << r.error.toStdString();
    EXPECT_TRUE(r.output.startsWith(QStringLiteral("Scale: 24.00 px/ft")));

    EXPECT_EQ(run(QStringLiteral("set dpi 192")).exitCode, 0);
    run(QStringLiteral("scale 1:48"));
    EXPECT_EQ(engine.buildPrompt(), QStringLiteral("takeoff[48.00 px/ft]> "));

    EXPECT_EQ(run(QStringLiteral("scale huge")).exitCode, 1);
}

// ============================================================================
// Measurement
// ============================================================================

TEST_F(CliEngineTest, AreaAndPerimeter) {
    CliResult area = run(QStringLiteral("area 0,0 10,0 10,10 0,10"));
    EXPECT_EQ(area.output, QStringLiteral("Area: 100.00 px^2"));

    EXPECT_EQ(run(QStringLiteral("perimeter 0,0 10,0 10,10 0,10")).output,
              QStringLiteral("Perimeter: 40.00 px"));
    EXPECT_EQ(run(QStringLiteral("perimeter open 0,0 10,0 10,10 0,10")).output,
              QStringLiteral("Length: 30.00 px"));

    run(QStringLiteral("scale 1:1.2"));
    EXPECT_EQ(run(QStringLiteral("area 0,0;10,0;10,10")).exitCode, 0);

    EXPECT_EQ(run(QStringLiteral("area")).exitCode, 1);
    EXPECT_EQ(run(QStringLiteral("area 0,0 nope")).exitCode, 1);
}

TEST_F(CliEngineTest, Distance) {
    EXPECT_EQ(run(QStringLiteral("distance 0,0 3,4")).output, QStringLiteral("Distance: 5.00 px"));
    EXPECT_EQ(run(QStringLiteral("distance 5,5 0,0 10,0")).output, QStringLiteral("Distance: 5.00 px"));
    EXPECT_EQ(run(QStringLiteral("distance 5,5")).exitCode, 1);
}

TEST_F(CliEngineTest, RecalcNeedsScale) {
    EXPECT_EQ(run(QStringLiteral("recalc room 0,0 20,0 20,20 0,20")).exitCode, 1);

    run(QStringLiteral("calibrate point 0,0"));
    run(QStringLiteral("calibrate point 100,0"));
    run(QStringLiteral("calibrate apply 10"));

    CliResult room = run(QStringLiteral("recalc room 0,0 20,0 20,20 0,20"));
    ASSERT_EQ(room.exitCode, 0) << room.error.toStdString();
    EXPECT_EQ(room.output, QStringLiteral("area_sqft: 4.00\nperimeter_ft: 8.00"));

    CliResult wall = run(QStringLiteral("recalc wall 0,0 100,0 100,50"));
    EXPECT_EQ(wall.output, QStringLiteral("perimeter_ft: 15.00"));

    CliResult door = run(QStringLiteral("recalc opening 0,0 30,0 30,70 0,70"));
    EXPECT_EQ(door.exitCode, 0);
    EXPECT_FALSE(door.output.contains(QStringLiteral("area_sqft")));

    EXPECT_EQ(run(QStringLiteral("recalc stairs 0,0 1,0 1,1")).exitCode, 1);
}

// ============================================================================
// Settings and history
// ============================================================================

TEST_F(CliEngineTest, SetUpdatesSettings) {
    EXPECT_EQ(run(QStringLiteral("set iou_threshold 0.5")).exitCode, 0);
    EXPECT_DOUBLE_EQ(engine.settings().iouThreshold, 0.5);

    EXPECT_EQ(run(QStringLiteral("set classes door, window")).exitCode, 0);
    EXPECT_EQ(engine.settings().classFilter.size(), 2);

    EXPECT_EQ(run(QStringLiteral("set iou_threshold 2")).exitCode, 1);
    EXPECT_EQ(run(QStringLiteral("set iou_threshold")).exitCode, 1);
    EXPECT_DOUBLE_EQ(engine.settings().iouThreshold, 0.5);

    EXPECT_TRUE(run(QStringLiteral("settings")).output.contains(QStringLiteral("\"iou_threshold\": 0.5")));
}

TEST_F(CliEngineTest, CommandsAreRecordedWithResults) {
    run(QStringLiteral("calibrate point 0,0"));
    run(QStringLiteral("calibrate   point 136,0"));
    run(QStringLiteral("calibrate apply 11-4"));
    run(QStringLiteral("area 0,0 oops"));

    ASSERT_EQ(log.count(), 4);
    const QVector<SessionEntry>& entries = log.entries();

    EXPECT_EQ(entries[1].command, QStringLiteral("calibrate point 136,0"));
    EXPECT_FALSE(entries[1].pixelsPerFoot.has_value());

    EXPECT_TRUE(entries[2].ok);
    EXPECT_TRUE(entries[2].result.startsWith(QStringLiteral("Scale: 12.00 px/ft")));
    ASSERT_TRUE(entries[2].pixelsPerFoot.has_value());
    EXPECT_NEAR(*entries[2].pixelsPerFoot, 12.0, 1e-9);

    EXPECT_FALSE(entries[3].ok);
    EXPECT_FALSE(entries[3].result.isEmpty());
    EXPECT_NEAR(*entries[3].pixelsPerFoot, 12.0, 1e-9);
}

TEST_F(CliEngineTest, HistoryCommands) {
    run(QStringLiteral("area 0,0 10,0 10,10"));
    run(QStringLiteral("frobnicate"));

    // History commands themselves are not recorded
    CliResult list = run(QStringLiteral("history"));
    EXPECT_EQ(log.count(), 2);
    EXPECT_TRUE(list.output.contains(QStringLiteral("ok    area 0,0 10,0 10,10  -> Area: 50.00 px^2")));
    EXPECT_TRUE(list.output.contains(QStringLiteral("FAIL  frobnicate")));

    EXPECT_EQ(run(QStringLiteral("history max 1")).exitCode, 0);
    EXPECT_EQ(log.count(), 1);

    EXPECT_EQ(run(QStringLiteral("history clear")).exitCode, 0);
    EXPECT_EQ(log.count(), 0);

    EXPECT_EQ(run(QStringLiteral("history max zero")).exitCode, 1);
    EXPECT_EQ(run(QStringLiteral("history rewind")).exitCode, 1);
}

TEST_F(CliEngineTest, ExportedSessionReplaysCalibration) {
    run(QStringLiteral("calibrate point 0,0"));
    run(QStringLiteral("calibrate point 0,0"));
    run(QStringLiteral("calibrate apply 10"));       // zero-length line, fails
    run(QStringLiteral("calibrate reset"));
    run(QStringLiteral("calibrate point 0,0"));
    run(QStringLiteral("calibrate point 136,0"));
    run(QStringLiteral("calibrate apply 11-4"));

    QString script = dir.filePath(QStringLiteral("replay.takeoff"));
    CliResult exported = run(QStringLiteral("history export ") + script);
    ASSERT_EQ(exported.exitCode, 0) << exported.error.toStdString();

    QFile file(script);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const QStringList lines = QString::fromUtf8(file.readAll()).split(QLatin1Char('\n'));

    SessionLog replayLog;
    CliEngine replay(replayLog);
    int commands = 0;
    for (const QString& raw : lines) {
        QString line = raw.trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) continue;
        EXPECT_FALSE(line == QStringLiteral("calibrate apply 10"));
        CliResult r = replay.execute(line);
        EXPECT_EQ(r.exitCode, 0) << line.toStdString() << ": " << r.error.toStdString();
        ++commands;
    }

    EXPECT_EQ(commands, 6);
    EXPECT_EQ(replay.buildPrompt(), QStringLiteral("takeoff[12.00 px/ft]> "));
}

// ============================================================================
// Reconciliation
// ============================================================================

TEST_F(CliEngineTest, ReconcileRoomsAndSave) {
    QString primary = dir.filePath(QStringLiteral("primary.json"));
    QString secondary = dir.filePath(QStringLiteral("secondary.json"));
    ASSERT_TRUE(writeFile(primary, PRIMARY_JSON));
    ASSERT_TRUE(writeFile(secondary, SECONDARY_JSON));

    CliResult r = run(QStringLiteral("reconcile %1 %2").arg(primary, secondary));
    ASSERT_EQ(r.exitCode, 0) << r.error.toStdString();
    EXPECT_TRUE(r.output.startsWith(QStringLiteral("2 detection(s), 1 merged")));

    ASSERT_TRUE(engine.lastResult().has_value());
    EXPECT_EQ(engine.lastResult()->mergedPairs, 1);
    EXPECT_EQ(engine.lastResult()->detections[0].detection.id, QStringLiteral("primary-0"));

    CliResult rooms = run(QStringLiteral("rooms"));
    ASSERT_EQ(rooms.exitCode, 0) << rooms.error.toStdString();
    EXPECT_TRUE(rooms.output.contains(QStringLiteral("1 door(s)")));
    EXPECT_TRUE(rooms.output.contains(QStringLiteral("Unassigned: 0")));

    QString out = dir.filePath(QStringLiteral("out.json"));
    EXPECT_EQ(run(QStringLiteral("save %1").arg(out)).exitCode, 0);
    EXPECT_TRUE(QFile::exists(out));

    CliResult fromFile = run(QStringLiteral("rooms %1").arg(out));
    EXPECT_EQ(fromFile.exitCode, 0);
    EXPECT_EQ(fromFile.output, rooms.output);
}

TEST_F(CliEngineTest, ReconcileWithoutSecondary) {
    QString primary = dir.filePath(QStringLiteral("primary.json"));
    ASSERT_TRUE(writeFile(primary, PRIMARY_JSON));

    CliResult r = run(QStringLiteral("reconcile %1").arg(primary));
    ASSERT_EQ(r.exitCode, 0) << r.error.toStdString();
    EXPECT_TRUE(r.output.contains(QStringLiteral("secondary unavailable")));
    EXPECT_FALSE(engine.lastResult()->secondaryAvailable);
}

TEST_F(CliEngineTest, ReconcileFailsWhenNoDetectorRuns) {
    CliResult r = run(QStringLiteral("reconcile %1").arg(dir.filePath(QStringLiteral("none.json"))));
    EXPECT_EQ(r.exitCode, 1);
    EXPECT_FALSE(r.error.isEmpty());
    EXPECT_FALSE(engine.lastResult().has_value());
}

TEST_F(CliEngineTest, SaveAndRoomsNeedAResult) {
    EXPECT_EQ(run(QStringLiteral("save %1").arg(dir.filePath(QStringLiteral("x.json")))).exitCode, 1);
    EXPECT_EQ(run(QStringLiteral("rooms")).exitCode, 1);
}
