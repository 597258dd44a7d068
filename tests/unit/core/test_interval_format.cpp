#include <catch2/catch.hpp>

#include "core/IntervalFormat.hpp"

static const double MIN = 1.0 / 1440.0;

TEST_CASE("Sub-day intervals show minutes or hours", "[format]") {
    REQUIRE(formatInterval(0.0) == "< 1 min");
    REQUIRE(formatInterval(0.2 * MIN) == "< 1 min");
    REQUIRE(formatInterval(MIN) == "1 min");
    REQUIRE(formatInterval(10 * MIN) == "10 min");
    REQUIRE(formatInterval(0.25) == "6 hr");
}

TEST_CASE("Multi-day intervals show days, months, years", "[format]") {
    REQUIRE(formatInterval(1.0) == "1 day");
    REQUIRE(formatInterval(1.3) == "1 day");
    REQUIRE(formatInterval(5.8) == "6 days");
    REQUIRE(formatInterval(29.2) == "29 days");
    REQUIRE(formatInterval(45.0) == "2 mo");
    REQUIRE(formatInterval(400.0) == "1.1 yr");
}

TEST_CASE("Display rounding snaps to minutes below a day and days above", "[format]") {
    REQUIRE(displayInterval(10.4 * MIN) == Approx(10 * MIN));
    REQUIRE(displayInterval(5.8) == 6.0);
    REQUIRE(displayInterval(2.49) == 2.0);
    REQUIRE(displayInterval(-3.0) == 0.0);

    // stable for repeated display of the same value
    REQUIRE(displayInterval(displayInterval(7.6)) == displayInterval(7.6));
}
