/**
 * @file test_calibration.cpp
 * @brief Unit tests for scale computation and the calibration session
 */

#include <takeoff/measure/calibration.h>

#include <gtest/gtest.h>

#include <limits>

using namespace takeoff::measure;

// ============================================================================
// computeScale
// ============================================================================

TEST(ComputeScaleTest, DecimalFeet) {
    ScaleResult r = computeScale(QPointF(0, 0), QPointF(100, 0), QStringLiteral("10"));
    ASSERT_TRUE(r.valid);
    EXPECT_DOUBLE_EQ(r.pixelsPerFoot, 10.0);
    EXPECT_DOUBLE_EQ(r.pixelDistance, 100.0);
    EXPECT_DOUBLE_EQ(r.distanceFeet, 10.0);
    EXPECT_EQ(r.error, CalibrationError::None);
}

TEST(ComputeScaleTest, FeetAndInches) {
    ScaleResult r = computeScale(QPointF(0, 0), QPointF(136, 0), QStringLiteral("11-4"));
    ASSERT_TRUE(r.valid);
    EXPECT_NEAR(r.pixelsPerFoot, 12.0, 1e-9);
}

TEST(ComputeScaleTest, DiagonalReferenceLine) {
    ScaleResult r = computeScale(QPointF(10, 10), QPointF(40, 50), QStringLiteral("5'"));
    ASSERT_TRUE(r.valid);
    EXPECT_DOUBLE_EQ(r.pixelsPerFoot, 10.0);
}

TEST(ComputeScaleTest, InchUnit) {
    ScaleResult r = computeScale(QPointF(0, 0), QPointF(100, 0), QStringLiteral("120"),
                                 DistanceUnit::Inches);
    ASSERT_TRUE(r.valid);
    EXPECT_DOUBLE_EQ(r.distanceFeet, 10.0);
    EXPECT_DOUBLE_EQ(r.pixelsPerFoot, 10.0);
}

TEST(ComputeScaleTest, Errors) {
    QPointF a(0, 0), b(100, 0);

    EXPECT_EQ(computeScale(a, b, QStringLiteral("abc")).error, CalibrationError::ParseError);
    EXPECT_EQ(computeScale(a, b, QStringLiteral("0")).error, CalibrationError::NonPositiveDistance);
    EXPECT_EQ(computeScale(a, b, QStringLiteral("-5")).error, CalibrationError::NonPositiveDistance);
    EXPECT_EQ(computeScale(a, a, QStringLiteral("10")).error, CalibrationError::ZeroPixelDistance);

    ScaleResult r = computeScale(a, b, QString());
    EXPECT_FALSE(r.valid);
    EXPECT_FALSE(r.message.isEmpty());
}

TEST(ComputeScaleTest, UnitNames) {
    EXPECT_EQ(distanceUnitFromString(QStringLiteral("FT")), DistanceUnit::Feet);
    EXPECT_EQ(distanceUnitFromString(QStringLiteral("feet")), DistanceUnit::Feet);
    EXPECT_EQ(distanceUnitFromString(QStringLiteral("inches")), DistanceUnit::Inches);
    EXPECT_EQ(distanceUnitFromString(QStringLiteral("\"")), DistanceUnit::Inches);
    EXPECT_FALSE(distanceUnitFromString(QStringLiteral("m")).has_value());
    EXPECT_EQ(distanceUnitToString(DistanceUnit::Inches), QStringLiteral("in"));
}

// ============================================================================
// CalibrationSession
// ============================================================================

class CalibrationSessionTest : public ::testing::Test {
protected:
    void placeReferenceLine() {
        session.beginCalibration();
        ASSERT_TRUE(session.addPoint(QPointF(0, 0)));
        ASSERT_TRUE(session.addPoint(QPointF(100, 0)));
    }

    CalibrationSession session;
};

TEST_F(CalibrationSessionTest, StartsEmpty) {
    EXPECT_EQ(session.state(), CalibrationState::Empty);
    EXPECT_EQ(session.pointCount(), 0);
    EXPECT_FALSE(session.hasScale());
    EXPECT_FALSE(session.pixelsPerFoot().has_value());
}

TEST_F(CalibrationSessionTest, PointsAdvanceState) {
    EXPECT_TRUE(session.addPoint(QPointF(1, 2)));
    EXPECT_EQ(session.state(), CalibrationState::OnePoint);
    EXPECT_TRUE(session.addPoint(QPointF(3, 4)));
    EXPECT_EQ(session.state(), CalibrationState::TwoPoints);
    EXPECT_EQ(session.point(1), QPointF(3, 4));

    // A third point requires a reset
    EXPECT_FALSE(session.addPoint(QPointF(5, 6)));
    EXPECT_EQ(session.pointCount(), 2);
}

TEST_F(CalibrationSessionTest, ApplyRequiresTwoPoints) {
    session.addPoint(QPointF(0, 0));

    ScaleResult r = session.applyDistance(QStringLiteral("10"));
    EXPECT_FALSE(r.valid);
    EXPECT_EQ(r.error, CalibrationError::IncompletePoints);
    EXPECT_EQ(session.state(), CalibrationState::OnePoint);
    EXPECT_FALSE(session.hasScale());
}

TEST_F(CalibrationSessionTest, ApplyCommitsScale) {
    placeReferenceLine();

    ScaleResult r = session.applyDistance(QStringLiteral("10"));
    ASSERT_TRUE(r.valid);
    EXPECT_EQ(session.state(), CalibrationState::Applied);
    ASSERT_TRUE(session.pixelsPerFoot().has_value());
    EXPECT_DOUBLE_EQ(*session.pixelsPerFoot(), 10.0);

    EXPECT_FALSE(session.addPoint(QPointF(1, 1)));
}

TEST_F(CalibrationSessionTest, RejectedDistanceKeepsPoints) {
    placeReferenceLine();

    EXPECT_FALSE(session.applyDistance(QStringLiteral("0")).valid);
    EXPECT_EQ(session.state(), CalibrationState::TwoPoints);
    EXPECT_FALSE(session.hasScale());

    EXPECT_TRUE(session.applyDistance(QStringLiteral("5")).valid);
    EXPECT_DOUBLE_EQ(*session.pixelsPerFoot(), 20.0);
}

TEST_F(CalibrationSessionTest, RejectedDistanceKeepsPreviousScale) {
    placeReferenceLine();
    ASSERT_TRUE(session.applyDistance(QStringLiteral("10")).valid);

    placeReferenceLine();
    EXPECT_FALSE(session.applyDistance(QStringLiteral("nope")).valid);
    EXPECT_DOUBLE_EQ(*session.pixelsPerFoot(), 10.0);
}

TEST_F(CalibrationSessionTest, ResetKeepsAppliedScale) {
    placeReferenceLine();
    ASSERT_TRUE(session.applyDistance(QStringLiteral("10")).valid);

    session.reset();
    EXPECT_EQ(session.state(), CalibrationState::Empty);
    EXPECT_EQ(session.pointCount(), 0);
    EXPECT_DOUBLE_EQ(*session.pixelsPerFoot(), 10.0);
}

TEST_F(CalibrationSessionTest, SetPixelsPerFootValidates) {
    EXPECT_FALSE(session.setPixelsPerFoot(0.0));
    EXPECT_FALSE(session.setPixelsPerFoot(-3.0));
    EXPECT_FALSE(session.setPixelsPerFoot(std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(session.hasScale());

    EXPECT_TRUE(session.setPixelsPerFoot(24.0));
    EXPECT_DOUBLE_EQ(*session.pixelsPerFoot(), 24.0);
    EXPECT_EQ(session.state(), CalibrationState::Empty);
}

TEST_F(CalibrationSessionTest, JsonRestoresAppliedSession) {
    placeReferenceLine();
    ASSERT_TRUE(session.applyDistance(QStringLiteral("120"), DistanceUnit::Inches).valid);

    CalibrationSession restored = CalibrationSession::fromJson(session.toJson());
    EXPECT_EQ(restored.state(), CalibrationState::Applied);
    EXPECT_EQ(restored.point(1), QPointF(100, 0));
    EXPECT_DOUBLE_EQ(*restored.pixelsPerFoot(), 10.0);
    EXPECT_EQ(restored.toJson(), session.toJson());
}

TEST_F(CalibrationSessionTest, MalformedJsonGivesEmptySession) {
    CalibrationSession restored = CalibrationSession::fromJson(QStringLiteral("{not json"));
    EXPECT_EQ(restored.state(), CalibrationState::Empty);
    EXPECT_FALSE(restored.hasScale());
}

TEST_F(CalibrationSessionTest, StateNames) {
    EXPECT_EQ(calibrationStateToString(CalibrationState::Empty), QStringLiteral("empty"));
    EXPECT_EQ(calibrationStateToString(CalibrationState::TwoPoints), QStringLiteral("two-points"));
    EXPECT_EQ(calibrationStateToString(CalibrationState::Applied), QStringLiteral("applied"));
}
