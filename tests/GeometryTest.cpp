#include "TestHelpers.hpp"

using namespace TestHelpers;

class GeometryTest : public ::testing::Test {};

TEST_F(GeometryTest, HaversineOneDegreeLatitude) {
    double d = Geo::haversineMeters({103.0, 30.0}, {103.0, 31.0});
    EXPECT_NEAR(d, 111195.0, 5.0);
    EXPECT_DOUBLE_EQ(Geo::haversineMeters({103.0, 30.0}, {103.0, 30.0}), 0.0);
}

TEST_F(GeometryTest, AreaOfSmallSquareAtEquator) {
    EXPECT_NEAR(Geo::areaM2(square(0.0, 0.0, 0.01)), 1.2364e6, 1e3);
    EXPECT_DOUBLE_EQ(Geo::areaM2(GeoPolygon{}), 0.0);
}

TEST_F(GeometryTest, ContainsUsesRayCasting) {
    auto poly = square(103.0, 30.0, 0.1);
    EXPECT_TRUE(Geo::contains(poly, {103.05, 30.05}));
    EXPECT_FALSE(Geo::contains(poly, {103.15, 30.05}));
    EXPECT_FALSE(Geo::contains(poly, {103.05, 29.99}));
}

TEST_F(GeometryTest, IntersectionOfHalfOverlappingSquares) {
    auto a = square(103.0, 30.0, 0.1);
    auto b = square(103.05, 30.0, 0.1);
    double ratio = Geo::intersectionAreaM2(a, b) / Geo::areaM2(a);
    EXPECT_NEAR(ratio, 0.5, 1e-3);
}

TEST_F(GeometryTest, IntersectionOfContainedAndDisjointPolygons) {
    auto outer = square(103.0, 30.0, 0.1);
    auto inner = square(103.02, 30.02, 0.02);
    EXPECT_NEAR(Geo::intersectionAreaM2(inner, outer) / Geo::areaM2(inner), 1.0, 1e-3);
    EXPECT_DOUBLE_EQ(Geo::intersectionAreaM2(outer, square(104.0, 31.0, 0.1)), 0.0);
}

TEST_F(GeometryTest, IntersectionWithConcavePolygonFallsBackToSampling) {
    // L 形，占 0.1° 方格的 3/4
    GeoPolygon lShape{{{103.0, 30.0}, {103.1, 30.0}, {103.1, 30.05},
                       {103.05, 30.05}, {103.05, 30.1}, {103.0, 30.1}}};
    double ratio = Geo::intersectionAreaM2(lShape, lShape) / Geo::areaM2(square(103.0, 30.0, 0.1));
    EXPECT_NEAR(ratio, 0.75, 0.03);
}

TEST_F(GeometryTest, PolygonFromGeoJsonDropsClosingPoint) {
    Json::Value geo = Geo::toGeoJson(square(103.0, 30.0, 0.1));
    ASSERT_EQ(geo["coordinates"][0].size(), 5u);

    auto poly = Geo::polygonFromGeoJson(geo);
    ASSERT_EQ(poly.ring.size(), 4u);
    EXPECT_DOUBLE_EQ(poly.ring[2].lon, 103.1);
    EXPECT_DOUBLE_EQ(poly.ring[2].lat, 30.1);
}

TEST_F(GeometryTest, PolygonFromGeoJsonRejectsInvalidInput) {
    Json::Value point;
    point["type"] = "Point";
    point["coordinates"].append(103.0);
    point["coordinates"].append(30.0);
    EXPECT_THROW(Geo::polygonFromGeoJson(point), ValidationException);

    Json::Value degenerate;
    degenerate["type"] = "Polygon";
    Json::Value ring(Json::arrayValue);
    for (auto [lon, lat] : {std::pair{103.0, 30.0}, std::pair{103.1, 30.0}, std::pair{103.0, 30.0}}) {
        Json::Value c(Json::arrayValue);
        c.append(lon);
        c.append(lat);
        ring.append(c);
    }
    degenerate["coordinates"].append(ring);
    EXPECT_THROW(Geo::polygonFromGeoJson(degenerate), ValidationException);

    Json::Value outOfRange = Geo::toGeoJson(square(179.95, 30.0, 0.1));
    EXPECT_THROW(Geo::polygonFromGeoJson(outOfRange, "extent"), ValidationException);
}

TEST_F(GeometryTest, WktClosesTheRing) {
    EXPECT_EQ(Geo::toWkt(GeoPoint{103.5, 30.25}), "POINT(103.5 30.25)");
    EXPECT_EQ(Geo::toWkt(square(1.0, 2.0, 1.0)), "POLYGON((1 2, 2 2, 2 3, 1 3, 1 2))");
}

class BoundingBoxTest : public ::testing::Test {};

TEST_F(BoundingBoxTest, ParsesFourCommaSeparatedValues) {
    auto box = BoundingBox::parse("103.0,30.0,103.5,30.5");
    EXPECT_DOUBLE_EQ(box.minLon, 103.0);
    EXPECT_DOUBLE_EQ(box.maxLat, 30.5);
    EXPECT_TRUE(box.contains({103.2, 30.2}));
    EXPECT_FALSE(box.contains({104.0, 30.2}));
}

TEST_F(BoundingBoxTest, RejectsMalformedText) {
    EXPECT_THROW(BoundingBox::parse("103.0,30.0,103.5"), ValidationException);
    EXPECT_THROW(BoundingBox::parse("a,b,c,d"), ValidationException);
    EXPECT_THROW(BoundingBox::parse("103.5,30.0,103.0,30.5"), ValidationException);
}

TEST_F(BoundingBoxTest, IntersectsTouchingAndOverlappingBoxes) {
    BoundingBox a{0.0, 0.0, 1.0, 1.0};
    EXPECT_TRUE(a.intersects({0.5, 0.5, 2.0, 2.0}));
    EXPECT_TRUE(a.intersects({1.0, 1.0, 2.0, 2.0}));
    EXPECT_FALSE(a.intersects({1.1, 0.0, 2.0, 1.0}));
}
