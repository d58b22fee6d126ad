/**
 * @file test_algorithms.cpp
 * @brief Unit tests for triangulation, clipping and polygon IoU
 */

#include <takeoff/geometry/algorithms.h>
#include <takeoff/geometry/utils.h>

#include <gtest/gtest.h>

#include <algorithm>

using namespace takeoff::geometry;

namespace {

VertexSequence rect(double x0, double y0, double x1, double y1) {
    return { QPointF(x0, y0), QPointF(x1, y0), QPointF(x1, y1), QPointF(x0, y1) };
}

// 20x20 square with the 10x10 top-right quadrant removed
VertexSequence lShape() {
    return { QPointF(0, 0), QPointF(20, 0), QPointF(20, 10),
             QPointF(10, 10), QPointF(10, 20), QPointF(0, 20) };
}

double triangulatedArea(const VertexSequence& polygon) {
    double total = 0.0;
    for (const Triangle& t : triangulatePolygon(polygon)) {
        total += polygonArea({ polygon[t.i0], polygon[t.i1], polygon[t.i2] });
    }
    return total;
}

}  // namespace

// ============================================================================
// Cleanup and triangulation
// ============================================================================

TEST(GeometryAlgorithmsTest, RemoveDuplicateVertices) {
    VertexSequence poly = { QPointF(0, 0), QPointF(0, 0), QPointF(1, 0),
                            QPointF(1, 1), QPointF(0, 0) };
    VertexSequence clean = removeDuplicateVertices(poly);
    ASSERT_EQ(clean.size(), 3);
    EXPECT_EQ(clean[1], QPointF(1, 0));
}

TEST(GeometryAlgorithmsTest, TriangulateConvex) {
    VertexSequence pentagon = { QPointF(0, 0), QPointF(4, 0), QPointF(5, 3),
                                QPointF(2, 5), QPointF(-1, 3) };
    EXPECT_EQ(triangulatePolygon(pentagon).size(), 3);
    EXPECT_NEAR(triangulatedArea(pentagon), polygonArea(pentagon), 1e-9);
}

TEST(GeometryAlgorithmsTest, TriangulateConcaveEitherWinding) {
    VertexSequence l = lShape();
    EXPECT_EQ(triangulatePolygon(l).size(), 4);
    EXPECT_NEAR(triangulatedArea(l), 300.0, 1e-9);

    std::reverse(l.begin(), l.end());
    EXPECT_NEAR(triangulatedArea(l), 300.0, 1e-9);
}

TEST(GeometryAlgorithmsTest, TriangulateWithCollinearVertex) {
    VertexSequence poly = { QPointF(0, 0), QPointF(5, 0), QPointF(10, 0),
                            QPointF(10, 10), QPointF(0, 10) };
    EXPECT_NEAR(triangulatedArea(poly), 100.0, 1e-9);
}

TEST(GeometryAlgorithmsTest, ClipToConvex) {
    VertexSequence clipped = clipToConvex(rect(0, 0, 10, 10), rect(5, 5, 15, 15));
    EXPECT_NEAR(polygonArea(clipped), 25.0, 1e-9);

    EXPECT_TRUE(clipToConvex(rect(0, 0, 1, 1), rect(5, 5, 6, 6)).isEmpty());
}

// ============================================================================
// Intersection over union
// ============================================================================

TEST(GeometryAlgorithmsTest, IoUOfIdenticalRegionsIsOne) {
    EXPECT_NEAR(intersectionOverUnion(rect(0, 0, 10, 10), rect(0, 0, 10, 10)), 1.0, 1e-9);
    EXPECT_NEAR(intersectionOverUnion(lShape(), lShape()), 1.0, 1e-9);
}

TEST(GeometryAlgorithmsTest, IoUOfDisjointRegionsIsZero) {
    EXPECT_DOUBLE_EQ(intersectionOverUnion(rect(0, 0, 10, 10), rect(20, 0, 30, 10)), 0.0);
}

TEST(GeometryAlgorithmsTest, IoUOfShiftedSquares) {
    // Overlap 7.5 x 10 = 75, union 125
    EXPECT_NEAR(intersectionOverUnion(rect(0, 0, 10, 10), rect(2.5, 0, 12.5, 10)), 0.6, 1e-9);
    // Overlap 50, union 150
    EXPECT_NEAR(intersectionOverUnion(rect(0, 0, 10, 10), rect(5, 0, 15, 10)), 1.0 / 3.0, 1e-9);
}

TEST(GeometryAlgorithmsTest, IoUIsSymmetricAndWindingIndependent) {
    VertexSequence a = lShape();
    VertexSequence b = rect(5, 5, 25, 15);

    double ab = intersectionOverUnion(a, b);
    EXPECT_NEAR(ab, intersectionOverUnion(b, a), 1e-9);

    std::reverse(b.begin(), b.end());
    EXPECT_NEAR(ab, intersectionOverUnion(a, b), 1e-9);
}

TEST(GeometryAlgorithmsTest, IoUUsesTrueShapeOfConcaveRegion) {
    // Square sits in the notch of the L: boxes overlap, regions do not
    VertexSequence notch = rect(12, 12, 18, 18);
    EXPECT_NEAR(intersectionOverUnion(lShape(), notch), 0.0, 1e-9);

    // Square straddling the inner corner: 5x5 of it is in the notch
    VertexSequence straddle = rect(5, 5, 15, 15);
    double inter = 100.0 - 25.0;
    double expected = inter / (300.0 + 100.0 - inter);
    EXPECT_NEAR(intersectionOverUnion(lShape(), straddle), expected, 1e-9);
}

TEST(GeometryAlgorithmsTest, IoUOfZeroAreaRegionIsZero) {
    VertexSequence line = { QPointF(0, 0), QPointF(5, 0), QPointF(10, 0) };
    EXPECT_DOUBLE_EQ(intersectionOverUnion(line, rect(0, -1, 10, 1)), 0.0);
}

TEST(GeometryAlgorithmsTest, IoUStaysInUnitInterval) {
    VertexSequence a = rect(0, 0, 10, 10);
    VertexSequence contained = rect(2, 2, 4, 4);
    double iou = intersectionOverUnion(a, contained);
    EXPECT_GE(iou, 0.0);
    EXPECT_LE(iou, 1.0);
    EXPECT_NEAR(iou, 0.04, 1e-9);
}
