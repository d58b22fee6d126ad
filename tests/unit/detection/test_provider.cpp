/**
 * @file test_provider.cpp
 * @brief Unit tests for detector providers and run sequencing
 */

#include <takeoff/detection/provider.h>

#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include <memory>

using namespace takeoff::detection;

namespace {

bool writeFile(const QString& path, const QByteArray& contents) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) return false;
    return file.write(contents) == contents.size();
}

const QByteArray TWO_PREDICTIONS =
    "{\"predictions\": ["
    " {\"class\": \"door\", \"confidence\": 0.8, \"x\": 10, \"y\": 10, \"width\": 4, \"height\": 8},"
    " {\"class\": \"window\", \"confidence\": 0.3, \"x\": 40, \"y\": 10, \"width\": 6, \"height\": 2}"
    "]}";

}  // namespace

// ============================================================================
// RunSequencer
// ============================================================================

TEST(RunSequencerTest, OnlyLatestRunApplies) {
    RunSequencer seq;
    EXPECT_FALSE(seq.shouldApply(0));

    quint64 first = seq.begin();
    quint64 second = seq.begin();
    EXPECT_LT(first, second);
    EXPECT_EQ(seq.latestStarted(), second);

    // The first run finishes late and must be discarded
    EXPECT_FALSE(seq.shouldApply(first));
    EXPECT_TRUE(seq.shouldApply(second));

    seq.markApplied(second);
    EXPECT_EQ(seq.lastApplied(), second);
    EXPECT_FALSE(seq.shouldApply(second));
}

TEST(RunSequencerTest, StaleMarkDoesNotRewind) {
    RunSequencer seq;
    quint64 first = seq.begin();
    quint64 second = seq.begin();

    seq.markApplied(second);
    seq.markApplied(first);
    EXPECT_EQ(seq.lastApplied(), second);
}

// ============================================================================
// JsonFileProvider
// ============================================================================

class JsonFileProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
    }

    QTemporaryDir dir;
};

TEST_F(JsonFileProviderTest, FetchNormalizesFile) {
    QString path = dir.filePath(QStringLiteral("local.json"));
    ASSERT_TRUE(writeFile(path, TWO_PREDICTIONS));

    NormalizeOptions options;
    options.source = Source::Secondary;
    options.minConfidence = 0.5;

    std::unique_ptr<DetectionProvider> provider =
        std::make_unique<JsonFileProvider>(path, options);

    EXPECT_EQ(provider->source(), Source::Secondary);
    EXPECT_EQ(provider->name(), QStringLiteral("local.json (secondary)"));

    DetectionRun run = provider->fetch();
    ASSERT_TRUE(run.available);
    EXPECT_EQ(run.source, Source::Secondary);
    ASSERT_EQ(run.detections.size(), 1);
    EXPECT_EQ(run.detections[0].label, QStringLiteral("door"));
    EXPECT_EQ(run.detections[0].id, QStringLiteral("secondary-0"));
}

TEST_F(JsonFileProviderTest, MissingFileIsUnavailable) {
    JsonFileProvider provider(dir.filePath(QStringLiteral("nope.json")), NormalizeOptions());

    DetectionRun run = provider.fetch();
    EXPECT_FALSE(run.available);
    EXPECT_FALSE(run.error.isEmpty());
    EXPECT_TRUE(run.detections.isEmpty());
}

TEST_F(JsonFileProviderTest, MalformedFileIsUnavailable) {
    QString path = dir.filePath(QStringLiteral("bad.json"));
    ASSERT_TRUE(writeFile(path, "{\"result\": 1}"));

    JsonFileProvider provider(path, NormalizeOptions());
    DetectionRun run = provider.fetch();
    EXPECT_FALSE(run.available);
    EXPECT_TRUE(run.error.contains(QStringLiteral("bad.json")));
}
