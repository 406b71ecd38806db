#include <catch2/catch_test_macros.hpp>
#include "../src/geo/Lv95.hpp"
#include "../src/geo/SwissExtent.hpp"

using namespace swissgeo::geo;

TEST_CASE("Lv95 frame shift", "[lv95]") {
    auto p1 = Lv03::create(200000.0, 600000.0, 500.0);
    REQUIRE(p1.has_value());

    SECTION("Offsets are applied exactly") {
        auto p2 = p1->toLv95();
        REQUIRE(p2.east() == p1->east() + 2000000.0);
        REQUIRE(p2.north() == p1->north() + 1000000.0);
        REQUIRE(p2.altitude() == p1->altitude());
    }

    SECTION("Shift back yields the same point") {
        REQUIRE(p1->toLv95().toLv03() == *p1);
    }

    SECTION("Round trip is lossless for arbitrary values") {
        auto lv = Lv03::create(199498.43, 600421.43, 542.8);
        REQUIRE(lv.has_value());
        REQUIRE(lv->distanceSquared(lv->toLv95().toLv03()) < 0.001);
    }
}

TEST_CASE("Lv95 construction", "[lv95]") {
    SECTION("Validated on the unshifted coordinates") {
        auto p = Lv95::create(200000.0, 600000.0, 500.0);
        REQUIRE(p.has_value());
        REQUIRE(p->north() == 1200000.0);
        REQUIRE(p->east() == 2600000.0);
        REQUIRE(p->altitude() == 500.0);
    }

    SECTION("Same result as shifting an Lv03 point") {
        auto lv03 = Lv03::create(150000.0, 700000.0, 10.0);
        auto lv95 = Lv95::create(150000.0, 700000.0, 10.0);
        REQUIRE(lv03.has_value());
        REQUIRE(lv95.has_value());
        REQUIRE(lv03->toLv95() == *lv95);
    }

    SECTION("Invalid Lv03 input is rejected") {
        REQUIRE_FALSE(Lv95::create(600000.0, 200000.0, 500.0).has_value());
        REQUIRE_FALSE(Lv95::create(69999.0, 600000.0, 500.0).has_value());
        REQUIRE_FALSE(Lv95::create(200000.0, 850001.0, 500.0).has_value());
    }

    SECTION("Results stay inside the shifted extent") {
        auto low = Lv95::create(70000.0, 480000.0, 0.0);
        auto high = Lv95::create(300000.0, 850000.0, 0.0);
        REQUIRE(low.has_value());
        REQUIRE(high.has_value());
        REQUIRE(kLv95Extent.contains(low->north(), low->east()));
        REQUIRE(kLv95Extent.contains(high->north(), high->east()));
        REQUIRE(low->north() == kLv95Extent.minNorth);
        REQUIRE(high->east() == kLv95Extent.maxEast);
    }
}

TEST_CASE("Lv95 to WGS84", "[lv95]") {
    auto lv03 = Lv03::create(199498.43, 600421.43, 542.8);
    REQUIRE(lv03.has_value());

    auto lv95 = lv03->toLv95();
    auto viaLv95 = lv95.toWgs84();
    auto direct = lv95.toLv03().toWgs84();

    REQUIRE(viaLv95 == direct);
}
