#include "domain/value_objects/Timestamp.hpp"

#include <gtest/gtest.h>

using desk::domain::Timestamp;

TEST(Timestamp, ConstructsWithValidMilliseconds) {
    Timestamp ts(1750428146322);
    EXPECT_EQ(ts.milliseconds(), 1750428146322);
}

TEST(Timestamp, ThrowsOnNegativeValue) {
    EXPECT_THROW(Timestamp(-1), std::out_of_range);
}

TEST(Timestamp, OrdersByMilliseconds) {
    Timestamp earlier(1000);
    Timestamp later(2000);
    EXPECT_LT(earlier, later);
    EXPECT_GT(later, earlier);
    EXPECT_NE(earlier, later);
}

TEST(Timestamp, FromStringParsesMilliseconds) {
    EXPECT_EQ(Timestamp::from_string("1750428146322").milliseconds(), 1750428146322);
    EXPECT_THROW(Timestamp::from_string("abc"), std::invalid_argument);
}

TEST(Timestamp, FormatsAsUtcWithMilliseconds) {
    Timestamp ts(1752571800250);  // 2025-07-15T09:30:00.250Z
    EXPECT_EQ(ts.to_iso8601(), "2025-07-15T09:30:00.250Z");
    EXPECT_EQ(Timestamp(0).to_iso8601(), "1970-01-01T00:00:00.000Z");
}

TEST(Timestamp, ParsesIso8601WithAndWithoutFraction) {
    EXPECT_EQ(Timestamp::from_iso8601("2025-07-15T09:30:00.250Z").milliseconds(), 1752571800250);
    EXPECT_EQ(Timestamp::from_iso8601("2025-07-15T09:30:00Z").milliseconds(), 1752571800000);
    EXPECT_EQ(Timestamp::from_iso8601("2025-07-15T09:30:00.5Z").milliseconds(), 1752571800500);
}

TEST(Timestamp, Iso8601RoundTripPreservesMilliseconds) {
    Timestamp ts(1700000000123);
    EXPECT_EQ(Timestamp::from_iso8601(ts.to_iso8601()), ts);
}

TEST(Timestamp, RejectsMalformedIso8601) {
    EXPECT_THROW(Timestamp::from_iso8601("yesterday"), std::invalid_argument);
    EXPECT_THROW(Timestamp::from_iso8601("2025-07-15T09:30:00+02:00"), std::invalid_argument);
}

TEST(Timestamp, NowIsAfterFixedPoint) {
    EXPECT_GT(Timestamp::now(), Timestamp(1700000000000));
}
