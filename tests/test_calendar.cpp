#include <catch2/catch.hpp>
#include "allocsim/data/calendar.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

using namespace allocsim::data;

TEST_CASE("Date validation", "[Calendar]") {
    SECTION("Well-formed dates") {
        REQUIRE(is_valid_date("2020-01-31"));
        REQUIRE(is_valid_date("2020-02-29"));
        REQUIRE(is_valid_date("2000-02-29"));
    }

    SECTION("Malformed or impossible dates") {
        REQUIRE_FALSE(is_valid_date(""));
        REQUIRE_FALSE(is_valid_date("2020/01/31"));
        REQUIRE_FALSE(is_valid_date("2020-1-31"));
        REQUIRE_FALSE(is_valid_date("2020-13-01"));
        REQUIRE_FALSE(is_valid_date("2021-02-29"));
        REQUIRE_FALSE(is_valid_date("1900-02-29"));
        REQUIRE_FALSE(is_valid_date("2020-04-31"));
    }
}

TEST_CASE("Date decomposition", "[Calendar]") {
    REQUIRE(extract_year("2021-07-15") == 2021);
    REQUIRE(extract_month("2021-07-15") == 7);
    REQUIRE(extract_day("2021-07-15") == 15);
}

TEST_CASE("Day numbers", "[Calendar]") {
    SECTION("Epoch") {
        REQUIRE(day_number("1970-01-01") == 0);
        REQUIRE(date_from_day_number(0) == "1970-01-01");
    }

    SECTION("Round trip across leap years and before the epoch") {
        for (const char* d : {"1969-12-31", "2000-02-29", "2020-03-01", "2024-12-31"}) {
            REQUIRE(date_from_day_number(day_number(d)) == d);
        }
        REQUIRE(day_number("1969-12-31") == -1);
    }

    SECTION("Malformed date throws") {
        REQUIRE_THROWS_AS(day_number("not-a-date"), std::invalid_argument);
    }
}

TEST_CASE("Calendar arithmetic", "[Calendar]") {
    SECTION("Day of week, Monday = 0") {
        REQUIRE(day_of_week("2020-01-06") == 0);
        REQUIRE(day_of_week("2020-01-11") == 5);
        REQUIRE(day_of_week("2020-01-12") == 6);
        REQUIRE(day_of_week("1970-01-01") == 3);
    }

    SECTION("Days between") {
        REQUIRE(days_between("2020-02-28", "2020-03-01") == 2);
        REQUIRE(days_between("2021-02-28", "2021-03-01") == 1);
        REQUIRE(days_between("2020-03-01", "2020-02-28") == -2);
    }

    SECTION("Add days crosses month and year boundaries") {
        REQUIRE(add_days("2020-12-31", 1) == "2021-01-01");
        REQUIRE(add_days("2020-03-01", -1) == "2020-02-29");
        REQUIRE(add_days("2020-01-15", 0) == "2020-01-15");
    }
}

TEST_CASE("Weekday calendar for fixtures", "[Calendar]") {
    auto dates = allocsim_test::weekdays(45);
    REQUIRE(dates.size() == 45);
    REQUIRE(dates.front() == "2020-01-06");
    REQUIRE(dates[5] == "2020-01-13");
    // 45 weekdays from Monday 2020-01-06 end on Friday 2020-03-06
    REQUIRE(dates.back() == "2020-03-06");
    for (size_t i = 0; i < dates.size(); ++i) {
        REQUIRE(day_of_week(dates[i]) < 5);
        if (i > 0) REQUIRE(dates[i - 1] < dates[i]);
    }
    REQUIRE(allocsim_test::weekdays(0).empty());
}
