#include <catch2/catch_test_macros.hpp>
#include "TestUtils.h"
#include "DateRange.h"
#include "BoostDateHelper.h"
#include <limits>
#include <map>
#include <stdexcept>
#include <sstream>

using namespace wfvalidator;
using boost::gregorian::date;

TEST_CASE("DateRange: valid construction and getters", "[DateRange]") {
    date d1(2020, 1, 1);
    date d2(2020, 6, 30);
    DateRange range(d1, d2);
    REQUIRE(range.getFirstDate() == d1);
    REQUIRE(range.getLastDate() == d2);
    REQUIRE(range.getNumDays() == 182);
}

TEST_CASE("DateRange: single day range is allowed", "[DateRange]") {
    DateRange range(createDate("20200315"), createDate("20200315"));
    REQUIRE(range.getNumDays() == 1);
}

TEST_CASE("DateRange: invalid construction throws", "[DateRange]") {
    REQUIRE_THROWS_AS(DateRange(date(2020, 12, 31), date(2020, 1, 1)), DateRangeException);
    REQUIRE_THROWS_AS(DateRange(date(boost::gregorian::not_a_date_time), date(2020, 1, 1)),
                      DateRangeException);
}

TEST_CASE("DateRange: equality and ordering", "[DateRange]") {
    DateRange a(date(2021, 7, 1), date(2021, 7, 31));
    DateRange b(date(2021, 7, 1), date(2021, 7, 31));
    DateRange c(date(2021, 7, 1), date(2021, 8, 1));
    DateRange d(date(2021, 6, 1), date(2021, 12, 31));

    REQUIRE(a == b);
    REQUIRE(!(a != b));
    REQUIRE(a != c);
    REQUIRE(a < c);
    REQUIRE(d < a);
    REQUIRE(!(a < b));

    std::map<DateRange, int> keyed;
    keyed[a] = 1;
    keyed[b] = 2;
    keyed[c] = 3;
    REQUIRE(keyed.size() == 2);
    REQUIRE(keyed[a] == 2);
}

TEST_CASE("DateRange: string form", "[DateRange]") {
    DateRange range(createDate("20200101"), createDate("20200630"));
    REQUIRE(range.toString() == "2020-01-01..2020-06-30");

    std::ostringstream os;
    os << range;
    REQUIRE(os.str() == range.toString());
}

TEST_CASE("add_months: plain month arithmetic", "[BoostDateHelper]") {
    REQUIRE(add_months(createDate("20200115"), 1) == createDate("20200215"));
    REQUIRE(add_months(createDate("20200115"), 12) == createDate("20210115"));
    REQUIRE(add_months(createDate("20201115"), 3) == createDate("20210215"));
    REQUIRE(add_months(createDate("20200115"), 0) == createDate("20200115"));
}

TEST_CASE("add_months: clamps to end of shorter months", "[BoostDateHelper]") {
    REQUIRE(add_months(createDate("20200131"), 1) == createDate("20200229"));
    REQUIRE(add_months(createDate("20210131"), 1) == createDate("20210228"));
    REQUIRE(add_months(createDate("20200831"), 1) == createDate("20200930"));

    SECTION("end of month is not snapped forward") {
        REQUIRE(add_months(createDate("20200430"), 1) == createDate("20200530"));
    }

    SECTION("clamping does not accumulate when computed from the start") {
        date start = createDate("20200131");
        REQUIRE(add_months(start, 1) == createDate("20200229"));
        REQUIRE(add_months(start, 2) == createDate("20200331"));
        REQUIRE(add_months(add_months(start, 1), 1) == createDate("20200329"));
    }
}

TEST_CASE("add_months: results outside the calendar throw", "[BoostDateHelper]") {
    REQUIRE_THROWS_AS(add_months(createDate("20200101"), 786444), std::out_of_range);
    REQUIRE_THROWS_AS(add_months(createDate("20200101"), std::numeric_limits<int>::max()), std::out_of_range);
    REQUIRE_THROWS_AS(add_months(createDate("20200101"), -12 * 700), std::out_of_range);
    REQUIRE(add_months(createDate("99990115"), -1) == createDate("99981215"));
}

TEST_CASE("whole_months_between", "[BoostDateHelper]") {
    REQUIRE(whole_months_between(createDate("20200101"), createDate("20220101")) == 24);
    REQUIRE(whole_months_between(createDate("20200101"), createDate("20200401")) == 3);
    REQUIRE(whole_months_between(createDate("20200101"), createDate("20200331")) == 2);
    REQUIRE(whole_months_between(createDate("20200131"), createDate("20200229")) == 1);
    REQUIRE(whole_months_between(createDate("20200601"), createDate("20200101")) == 0);
}

TEST_CASE("parse_undelimited_date", "[BoostDateHelper]") {
    REQUIRE(parse_undelimited_date("20191231") == date(2019, 12, 31));
    REQUIRE_THROWS(parse_undelimited_date("20191332"));
}
