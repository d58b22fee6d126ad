/**
 * @file test_sessionlog.cpp
 * @brief Unit tests for the persistent takeoff session log
 */

#include "cli/sessionlog.h"

#include <QFile>
#include <QJsonObject>
#include <QTemporaryDir>

#include <gtest/gtest.h>

using namespace takeoff;

namespace {

SessionEntry entry(const QString& command, bool ok, const QString& result,
                   std::optional<double> pixelsPerFoot = std::nullopt) {
    SessionEntry e;
    e.command = command;
    e.ok = ok;
    e.result = result;
    e.pixelsPerFoot = pixelsPerFoot;
    return e;
}

}  // namespace

class SessionLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        path = dir.filePath(QStringLiteral("takeoff/session.json"));
    }

    QTemporaryDir dir;
    QString path;
};

// ============================================================================
// Recording
// ============================================================================

TEST_F(SessionLogTest, RecordTrimsAndSkipsBlankCommands) {
    SessionLog log(path);
    log.record(entry(QStringLiteral("  calibrate begin "), true, QString()));
    log.record(entry(QStringLiteral("   "), true, QString()));

    ASSERT_EQ(log.count(), 1);
    EXPECT_EQ(log.entries()[0].command, QStringLiteral("calibrate begin"));
}

TEST_F(SessionLogTest, OldestEntriesDropPastTheLimit) {
    SessionLog log(path, 3);
    for (int i = 0; i < 5; ++i) {
        log.record(entry(QStringLiteral("distance 0,0 %1,0").arg(i), true, QString()));
    }

    ASSERT_EQ(log.count(), 3);
    EXPECT_EQ(log.entries().first().command, QStringLiteral("distance 0,0 2,0"));

    log.setMaxEntries(0);
    EXPECT_EQ(log.maxEntries(), 1);
    ASSERT_EQ(log.count(), 1);
    EXPECT_EQ(log.entries().first().command, QStringLiteral("distance 0,0 4,0"));
}

TEST_F(SessionLogTest, ReplayScriptKeepsSuccessfulCommands) {
    SessionLog log(path);
    log.record(entry(QStringLiteral("calibrate point 0,0"), true, QString()));
    log.record(entry(QStringLiteral("calibrate apply ten"), false, QStringLiteral("Not a distance")));
    log.record(entry(QStringLiteral("calibrate apply 10"), true,
                     QStringLiteral("Scale: 10.00 px/ft"), 10.0));

    EXPECT_EQ(log.replayScript(),
              QStringLiteral("# takeoff session replay\n"
                             "calibrate point 0,0\n"
                             "calibrate apply 10\n"
                             "#   Scale: 10.00 px/ft\n"));
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(SessionLogTest, SaveAndLoad) {
    SessionLog log(path);
    log.record(entry(QStringLiteral("calibrate apply 11-4"), true,
                     QStringLiteral("Scale: 12.00 px/ft"), 12.0));
    log.record(entry(QStringLiteral("reconcile a.json"), false,
                     QStringLiteral("Cannot open a.json")));

    QString error;
    ASSERT_TRUE(log.save(&error)) << error.toStdString();

    SessionLog loaded(path);
    ASSERT_TRUE(loaded.load(&error)) << error.toStdString();
    ASSERT_EQ(loaded.count(), 2);

    const SessionEntry& first = loaded.entries()[0];
    EXPECT_TRUE(first.ok);
    EXPECT_EQ(first.result, QStringLiteral("Scale: 12.00 px/ft"));
    ASSERT_TRUE(first.pixelsPerFoot.has_value());
    EXPECT_DOUBLE_EQ(*first.pixelsPerFoot, 12.0);

    const SessionEntry& second = loaded.entries()[1];
    EXPECT_FALSE(second.ok);
    EXPECT_FALSE(second.pixelsPerFoot.has_value());
}

TEST_F(SessionLogTest, MissingFileLoadsEmpty) {
    SessionLog log(path);
    EXPECT_TRUE(log.load());
    EXPECT_EQ(log.count(), 0);
}

TEST_F(SessionLogTest, MalformedFileLeavesEntriesUntouched) {
    SessionLog writer(path);
    writer.record(entry(QStringLiteral("help"), true, QString()));
    ASSERT_TRUE(writer.save());

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("[{\"command\": \"help\"}, {\"ok\": true}]");
    file.close();

    SessionLog log(path);
    log.record(entry(QStringLiteral("version"), true, QString()));

    QString error;
    EXPECT_FALSE(log.load(&error));
    EXPECT_TRUE(error.contains(QStringLiteral("entry 1")));
    ASSERT_EQ(log.count(), 1);
    EXPECT_EQ(log.entries()[0].command, QStringLiteral("version"));
}

TEST_F(SessionLogTest, NonPositiveScaleIsRejected) {
    QJsonObject bad;
    bad[QStringLiteral("command")] = QStringLiteral("calibrate apply 10");
    bad[QStringLiteral("pixels_per_foot")] = 0.0;

    SessionLog log(path);
    QString error;
    EXPECT_FALSE(log.fromJson(QJsonArray{ bad }, &error));
    EXPECT_FALSE(error.isEmpty());
}
