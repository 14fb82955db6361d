/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <catch2/catch.hpp>
#include <osgWeather/PeriodicTimeSequence>
#include <osgWeather/TimeSlotIndex>

using namespace osgWeather;

namespace
{
    const TimeSpan HOUR = 3600000;
}

TEST_CASE("PeriodicTimeSequence") {

    SECTION("Six days every three hours") {
        PeriodicTimeSequence seq("2016-07-12/2016-07-18/PT3H");
        REQUIRE(seq.getStatus().isOK());
        REQUIRE(seq.current() == DateTime("2016-07-12"));

        Result<unsigned> count = seq.intervalCount();
        REQUIRE(count.ok());
        REQUIRE(count.value() == 48u);

        seq.advance();
        REQUIRE(seq.current().asTimeStamp() == seq.start().asTimeStamp() + 3 * HOUR);

        for (unsigned i = 1; i < 48; ++i)
            seq.advance();
        REQUIRE(seq.current() == seq.end());

        // wraps back to the start
        seq.advance();
        REQUIRE(seq.current() == seq.start());

        REQUIRE(seq.toString() == "2016-07-12T00:00:00Z/2016-07-18T00:00:00Z/PT3H");
    }

    SECTION("Reset") {
        PeriodicTimeSequence seq("2016-07-12/2016-07-18/PT3H");
        seq.advance();
        seq.advance();
        seq.reset();
        REQUIRE(seq.current() == seq.start());
    }

    SECTION("Uneven period is rejected") {
        PeriodicTimeSequence seq("2016-07-12T00:00/2016-07-12T10:00/PT3H");
        REQUIRE(seq.getStatus().isOK());

        Result<unsigned> count = seq.intervalCount();
        REQUIRE_FALSE(count.ok());
        REQUIRE(count.status().code() == Status::ConfigurationError);
    }

    SECTION("Too many periods is rejected") {
        // 50 days of milliseconds would not fit in the slot count
        PeriodicTimeSequence fine("2016-01-01/2016-02-20/PT0.001S");
        REQUIRE(fine.getStatus().isOK());
        Result<unsigned> count = fine.intervalCount();
        REQUIRE_FALSE(count.ok());
        REQUIRE(count.status().code() == Status::ConfigurationError);

        // exactly at the limit: 1,000,000 seconds
        PeriodicTimeSequence atLimit("2016-01-01T00:00:00/2016-01-12T13:46:40/PT1S");
        REQUIRE(atLimit.intervalCount().ok());
        REQUIRE(atLimit.intervalCount().value() == PeriodicTimeSequence::MAX_INTERVALS);

        PeriodicTimeSequence overLimit("2016-01-01T00:00:00/2016-01-12T13:46:41/PT1S");
        REQUIRE(overLimit.intervalCount().status().code() == Status::ConfigurationError);

        TimeSlotIndex index("data/");
        REQUIRE(index.build(fine).code() == Status::ConfigurationError);
        REQUIRE(index.empty());
    }

    SECTION("Bad ranges") {
        REQUIRE(PeriodicTimeSequence("2016-07-18/2016-07-12/PT3H").getStatus().code() == Status::ConfigurationError);
        REQUIRE(PeriodicTimeSequence("2016-07-12/2016-07-18/PT0S").getStatus().code() == Status::ConfigurationError);
        REQUIRE(PeriodicTimeSequence("2016-07-12/2016-07-18").getStatus().code() == Status::ConfigurationError);
        REQUIRE(PeriodicTimeSequence("bogus/2016-07-18/PT3H").getStatus().code() == Status::ConfigurationError);
        REQUIRE(PeriodicTimeSequence().getStatus().isError());
        REQUIRE_FALSE(PeriodicTimeSequence().intervalCount().ok());
    }

    SECTION("Single instant") {
        PeriodicTimeSequence seq("2016-07-12/2016-07-12/PT3H");
        REQUIRE(seq.intervalCount().ok());
        REQUIRE(seq.intervalCount().value() == 0u);
        seq.advance();
        REQUIRE(seq.current() == seq.start());
    }

    SECTION("Monthly sequence") {
        PeriodicTimeSequence seq("2004-01/2004-12/P1M");
        REQUIRE(seq.getStatus().isOK());
        REQUIRE(seq.period().isCalendar());
        REQUIRE(seq.intervalCount().value() == 11u);

        seq.advance();
        REQUIRE(seq.current().asISO8601() == "2004-02-01T00:00:00Z");

        REQUIRE_FALSE(PeriodicTimeSequence("2004-01-01/2004-12-15/P1M").intervalCount().ok());
    }

    SECTION("Explicit construction") {
        PeriodicTimeSequence::Period period;
        period.span = 6 * HOUR;
        PeriodicTimeSequence seq(DateTime("2016-07-12"), DateTime("2016-07-13"), period);
        REQUIRE(seq.getStatus().isOK());
        REQUIRE(seq.intervalCount().value() == 4u);
    }
}

TEST_CASE("PeriodicTimeSequence::Period") {

    SECTION("Parse") {
        auto p = PeriodicTimeSequence::Period::parse("PT3H");
        REQUIRE(p.ok());
        REQUIRE(p->span == 3 * HOUR);
        REQUIRE_FALSE(p->isCalendar());

        REQUIRE(PeriodicTimeSequence::Period::parse("P1DT12H")->span == 36 * HOUR);
        REQUIRE(PeriodicTimeSequence::Period::parse("P1W")->span == 7 * 24 * HOUR);
        REQUIRE(PeriodicTimeSequence::Period::parse("PT0.5S")->span == 500);
        REQUIRE(PeriodicTimeSequence::Period::parse("PT30M")->span == HOUR / 2);

        auto monthly = PeriodicTimeSequence::Period::parse("P1Y2M");
        REQUIRE(monthly.ok());
        REQUIRE(monthly->years == 1);
        REQUIRE(monthly->months == 2);
        REQUIRE(monthly->isCalendar());
    }

    SECTION("Parse errors") {
        REQUIRE_FALSE(PeriodicTimeSequence::Period::parse("3H").ok());
        REQUIRE_FALSE(PeriodicTimeSequence::Period::parse("P").ok());
        REQUIRE_FALSE(PeriodicTimeSequence::Period::parse("PT").ok());
        REQUIRE_FALSE(PeriodicTimeSequence::Period::parse("P3X").ok());
        REQUIRE_FALSE(PeriodicTimeSequence::Period::parse("PT-1H").ok());
        REQUIRE_FALSE(PeriodicTimeSequence::Period::parse("P3H").ok());
        REQUIRE(PeriodicTimeSequence::Period::parse("P3H").status().code() == Status::ConfigurationError);
    }

    SECTION("To string") {
        REQUIRE(PeriodicTimeSequence::Period::parse("PT3H")->toString() == "PT3H");
        REQUIRE(PeriodicTimeSequence::Period::parse("P1DT12H")->toString() == "P1DT12H");
        REQUIRE(PeriodicTimeSequence::Period::parse("P1M")->toString() == "P1M");
    }
}
