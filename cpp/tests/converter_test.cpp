#include <gtest/gtest.h>

#include "polyflat/converter.h"

#include <algorithm>
#include <limits>

using namespace polyflat;
using namespace polyflat::geom;

namespace {

Path linePath(std::uint32_t id, Point2 a, Point2 b) {
    Path p;
    p.id = id;
    p.segments.push_back(CurveSegment::line(a, b));
    return p;
}

ConvertOptions plainOptions() {
    ConvertOptions opt;
    opt.flipY = false;
    return opt;
}

} // namespace

TEST(ConverterTest, DefaultOptions) {
    const ConvertOptions opt;
    EXPECT_EQ(opt.method, FlattenMethod::Fixed);
    EXPECT_EQ(opt.steps, 1000);
    EXPECT_DOUBLE_EQ(opt.maxError, 0.01);
    EXPECT_FALSE(opt.targetWidth.has_value());
    EXPECT_TRUE(opt.flipY);
    EXPECT_EQ(opt.layer, 0);
    EXPECT_EQ(validateOptions(opt), ConvertError::Ok);
}

TEST(ConverterTest, ParsesMethodNames) {
    FlattenMethod m = FlattenMethod::Fixed;
    EXPECT_EQ(parseFlattenMethod("adaptive", m), ConvertError::Ok);
    EXPECT_EQ(m, FlattenMethod::Adaptive);
    EXPECT_EQ(parseFlattenMethod("fixed", m), ConvertError::Ok);
    EXPECT_EQ(m, FlattenMethod::Fixed);
    EXPECT_EQ(parseFlattenMethod("Adaptive", m), ConvertError::UnknownMethod);
    EXPECT_EQ(parseFlattenMethod("", m), ConvertError::UnknownMethod);
    EXPECT_EQ(m, FlattenMethod::Fixed);
}

TEST(ConverterTest, ValidationRejectsBadOptions) {
    ConvertOptions opt;
    opt.steps = 0;
    EXPECT_EQ(validateOptions(opt), ConvertError::InvalidStepCount);

    opt = ConvertOptions{};
    opt.method = FlattenMethod::Adaptive;
    opt.maxError = 0.0;
    EXPECT_EQ(validateOptions(opt), ConvertError::InvalidMaxError);
    opt.maxError = std::numeric_limits<double>::infinity();
    EXPECT_EQ(validateOptions(opt), ConvertError::InvalidMaxError);

    opt = ConvertOptions{};
    opt.method = FlattenMethod::Adaptive;
    opt.limits.maxDepth = 0;
    EXPECT_EQ(validateOptions(opt), ConvertError::InvalidSubdivisionLimit);

    opt = ConvertOptions{};
    opt.targetWidth = -5.0;
    EXPECT_EQ(validateOptions(opt), ConvertError::InvalidTargetWidth);
    opt.targetWidth = 0.0;
    EXPECT_EQ(validateOptions(opt), ConvertError::InvalidTargetWidth);
}

TEST(ConverterTest, OptionsForTheOtherMethodAreIgnored) {
    ConvertOptions opt;
    opt.method = FlattenMethod::Adaptive;
    opt.steps = -1;
    EXPECT_EQ(validateOptions(opt), ConvertError::Ok);

    opt = ConvertOptions{};
    opt.maxError = -1.0;
    EXPECT_EQ(validateOptions(opt), ConvertError::Ok);
}

TEST(ConverterTest, ConfigurationErrorBlocksTheRun) {
    ConvertOptions opt = plainOptions();
    opt.steps = -2;
    emit::CollectingPolygonSink sink;
    const ConvertResult r = convertPaths({linePath(0, Point2{0.0, 0.0}, Point2{1.0, 1.0})}, opt, sink);
    EXPECT_EQ(r.error, ConvertError::InvalidStepCount);
    EXPECT_FALSE(r.hasGeometry);
    EXPECT_TRUE(sink.entries().empty());
}

TEST(ConverterTest, FixedSingleStepLine) {
    ConvertOptions opt = plainOptions();
    opt.steps = 1;

    std::vector<Polygon> polys;
    ASSERT_EQ(flattenPaths({linePath(0, Point2{0.0, 0.0}, Point2{10.0, 0.0})}, opt, polys), ConvertError::Ok);
    ASSERT_EQ(polys.size(), 1u);
    ASSERT_EQ(polys[0].points.size(), 2u);
    EXPECT_EQ(polys[0].points[0], (Point2{0.0, 0.0}));
    EXPECT_EQ(polys[0].points[1], (Point2{10.0, 0.0}));

    emit::CollectingPolygonSink sink;
    const ConvertResult r = convertPaths({linePath(0, Point2{0.0, 0.0}, Point2{10.0, 0.0})}, opt, sink);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(sink.entries().size(), 1u);
    EXPECT_EQ(sink.entries()[0].points[0], (Point2{-5.0, 0.0}));
    EXPECT_EQ(sink.entries()[0].points[1], (Point2{5.0, 0.0}));
}

TEST(ConverterTest, FixedMethodDeduplicatesJoins) {
    std::vector<Path> paths = PathBuilder()
        .moveTo(Point2{0.0, 0.0})
        .lineTo(Point2{4.0, 0.0})
        .lineTo(Point2{4.0, 4.0})
        .lineTo(Point2{0.0, 4.0})
        .close()
        .build();
    ConvertOptions opt = plainOptions();
    opt.steps = 2;

    std::vector<Polygon> polys;
    ASSERT_EQ(flattenPaths(paths, opt, polys), ConvertError::Ok);
    ASSERT_EQ(polys.size(), 1u);
    // 4 segments x 3 samples, minus 3 shared joins. The closing vertex is real geometry.
    EXPECT_EQ(polys[0].points.size(), 9u);
    EXPECT_EQ(polys[0].points.front(), polys[0].points.back());
    EXPECT_TRUE(polys[0].closed);
    for (std::size_t i = 1; i < polys[0].points.size(); i++) {
        EXPECT_NE(polys[0].points[i - 1], polys[0].points[i]);
    }
}

TEST(ConverterTest, TargetWidthAppliesAcrossAllPolygons) {
    ConvertOptions opt = plainOptions();
    opt.steps = 1;
    opt.targetWidth = 100.0;

    const std::vector<Path> paths = {
        linePath(0, Point2{0.0, 0.0}, Point2{10.0, 3.0}),
        linePath(1, Point2{5.0, 1.0}, Point2{20.0, 2.0}),
    };
    emit::CollectingPolygonSink sink;
    const ConvertResult r = convertPaths(paths, opt, sink);
    ASSERT_TRUE(r.ok());
    ASSERT_TRUE(r.hasGeometry);
    EXPECT_DOUBLE_EQ(r.transform.scale, 5.0);
    EXPECT_EQ(r.bounds.minX, 0.0);
    EXPECT_EQ(r.bounds.maxX, 20.0);

    double minX = 1e300;
    double maxX = -1e300;
    for (const auto& e : sink.entries()) {
        for (const Point2& p : e.points) {
            minX = std::min(minX, p.x);
            maxX = std::max(maxX, p.x);
        }
    }
    EXPECT_DOUBLE_EQ(maxX - minX, 100.0);
    EXPECT_DOUBLE_EQ(0.5 * (minX + maxX), 0.0);
}

TEST(ConverterTest, FlipIsOnByDefault) {
    ConvertOptions opt;
    opt.steps = 1;
    emit::CollectingPolygonSink sink;
    const ConvertResult r = convertPaths({linePath(0, Point2{0.0, 1.0}, Point2{0.0, -1.0})}, opt, sink);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(sink.entries().size(), 1u);
    EXPECT_DOUBLE_EQ(sink.entries()[0].points[0].y, -1.0);
    EXPECT_DOUBLE_EQ(sink.entries()[0].points[1].y, 1.0);
    EXPECT_DOUBLE_EQ(sink.entries()[0].points[0].x, 0.0);
}

TEST(ConverterTest, EmptyInputIsNoGeometryNotError) {
    emit::CollectingPolygonSink sink;
    ConvertResult r = convertPaths({}, ConvertOptions{}, sink);
    EXPECT_TRUE(r.ok());
    EXPECT_FALSE(r.hasGeometry);
    EXPECT_EQ(r.polygonCount, 0u);

    std::vector<Path> hollow(2);
    r = convertPaths(hollow, ConvertOptions{}, sink);
    EXPECT_TRUE(r.ok());
    EXPECT_FALSE(r.hasGeometry);
    EXPECT_TRUE(sink.entries().empty());
}

TEST(ConverterTest, EmptyPathsAreSkippedInOrder) {
    std::vector<Path> paths(3);
    paths[0] = linePath(10, Point2{0.0, 0.0}, Point2{1.0, 0.0});
    paths[1].id = 11;
    paths[2] = linePath(12, Point2{0.0, 1.0}, Point2{1.0, 1.0});

    std::vector<Polygon> polys;
    ASSERT_EQ(flattenPaths(paths, plainOptions(), polys), ConvertError::Ok);
    ASSERT_EQ(polys.size(), 2u);
    EXPECT_EQ(polys[0].pathId, 10u);
    EXPECT_EQ(polys[1].pathId, 12u);
}

TEST(ConverterTest, LayerReachesSink) {
    ConvertOptions opt = plainOptions();
    opt.layer = 7;
    opt.steps = 4;

    std::vector<std::int32_t> layers;
    emit::CallbackPolygonSink sink([&](const std::vector<Point2>& pts, std::int32_t layer) {
        EXPECT_EQ(pts.size(), 5u);
        layers.push_back(layer);
        return ConvertError::Ok;
    });
    const ConvertResult r = convertPaths(
        {linePath(0, Point2{0.0, 0.0}, Point2{1.0, 0.0}), linePath(1, Point2{0.0, 2.0}, Point2{1.0, 2.0})}, opt, sink);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.polygonCount, 2u);
    EXPECT_EQ(r.pointCount, 10u);
    EXPECT_EQ(layers, (std::vector<std::int32_t>{7, 7}));
}

TEST(ConverterTest, SinkErrorStopsEmission) {
    int calls = 0;
    emit::CallbackPolygonSink sink([&](const std::vector<Point2>&, std::int32_t) {
        return ++calls == 2 ? ConvertError::PolygonTooLarge : ConvertError::Ok;
    });
    ConvertOptions opt = plainOptions();
    opt.steps = 1;
    const std::vector<Path> paths = {
        linePath(0, Point2{0.0, 0.0}, Point2{1.0, 0.0}),
        linePath(1, Point2{0.0, 1.0}, Point2{1.0, 1.0}),
        linePath(2, Point2{0.0, 2.0}, Point2{1.0, 2.0}),
    };
    const ConvertResult r = convertPaths(paths, opt, sink);
    EXPECT_EQ(r.error, ConvertError::PolygonTooLarge);
    EXPECT_EQ(r.polygonCount, 1u);
    EXPECT_EQ(calls, 2);
}

TEST(ConverterTest, AdaptiveRunRefinesCurves) {
    std::vector<Path> paths = PathBuilder()
        .moveTo(Point2{0.0, 0.0})
        .quadTo(Point2{50.0, 100.0}, Point2{100.0, 0.0})
        .lineTo(Point2{0.0, 0.0})
        .build();

    ConvertOptions coarse = plainOptions();
    coarse.method = FlattenMethod::Adaptive;
    coarse.maxError = 1.0;
    ConvertOptions fine = coarse;
    fine.maxError = 0.001;

    emit::CollectingPolygonSink coarseSink;
    emit::CollectingPolygonSink fineSink;
    ASSERT_TRUE(convertPaths(paths, coarse, coarseSink).ok());
    ASSERT_TRUE(convertPaths(paths, fine, fineSink).ok());
    ASSERT_EQ(coarseSink.entries().size(), 1u);
    ASSERT_EQ(fineSink.entries().size(), 1u);
    EXPECT_GT(fineSink.entries()[0].points.size(), coarseSink.entries()[0].points.size());
}

TEST(ConverterTest, SubdivisionLimitAbortsBeforeEmission) {
    std::vector<Path> paths = PathBuilder()
        .moveTo(Point2{0.0, 0.0})
        .cubicTo(Point2{0.0, 100.0}, Point2{100.0, 100.0}, Point2{100.0, 0.0})
        .build();
    ConvertOptions opt = plainOptions();
    opt.method = FlattenMethod::Adaptive;
    opt.maxError = 1e-6;
    opt.limits.maxDepth = 3;

    emit::CollectingPolygonSink sink;
    const ConvertResult r = convertPaths(paths, opt, sink);
    EXPECT_EQ(r.error, ConvertError::SubdivisionLimitExceeded);
    EXPECT_TRUE(sink.entries().empty());
}

TEST(ConverterTest, ErrorMessagesAreDistinct) {
    EXPECT_STREQ(errorMessage(ConvertError::Ok), "ok");
    EXPECT_STRNE(errorMessage(ConvertError::InvalidStepCount), errorMessage(ConvertError::InvalidMaxError));
}
