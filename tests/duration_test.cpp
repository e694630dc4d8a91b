#include <cmath>
#include <limits>
#include <sstream>

#include <gtest/gtest.h>
#include <tempora.hpp>

using namespace tempora;

// Test fixture for Duration tests
class DurationTest : public ::testing::Test {
protected:
    static constexpr double MS_PER_HOUR = 3'600'000.0;
    static constexpr double MS_PER_DAY = 86'400'000.0;
    static constexpr double MS_PER_WEEK = 604'800'000.0;

    const Duration hour_and_half = Duration::from_hours(1.5);
};

// ==============================================================================
// Construction
// ==============================================================================

TEST_F(DurationTest, DefaultConstruction) {
    Duration d;
    EXPECT_EQ(d.as_milliseconds(), 0.0);
    EXPECT_TRUE(d.is_zero());
    EXPECT_EQ(d, Duration::zero());
}

TEST_F(DurationTest, FromMilliseconds) {
    Duration d(1337.0);
    EXPECT_EQ(d.as_milliseconds(), 1337.0);
    EXPECT_EQ(Duration::from_milliseconds(1337.0), d);
}

TEST_F(DurationTest, FromNegativeAndFractionalMilliseconds) {
    EXPECT_EQ(Duration(-250.5).as_milliseconds(), -250.5);
    EXPECT_TRUE(Duration(-250.5).is_negative());
}

TEST_F(DurationTest, FromBreakdownSumsAllEntries) {
    Duration d(Breakdown{{TimeUnit::hours, 1}, {TimeUnit::minutes, 30}});
    EXPECT_EQ(d.as_minutes(), 90.0);
}

TEST_F(DurationTest, FromBreakdownFractionalAmount) {
    Duration d(Breakdown{{TimeUnit::hours, 1.75}});
    EXPECT_EQ(d.as_minutes(), 105.0);
}

TEST_F(DurationTest, FromBreakdownOrderIrrelevant) {
    Duration a(Breakdown{{TimeUnit::days, 2}, {TimeUnit::seconds, 7}, {TimeUnit::weeks, 1}});
    Duration b(Breakdown{{TimeUnit::weeks, 1}, {TimeUnit::days, 2}, {TimeUnit::seconds, 7}});
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.as_milliseconds(), MS_PER_WEEK + 2 * MS_PER_DAY + 7'000.0);
}

TEST_F(DurationTest, FromEmptyBreakdownIsZero) {
    EXPECT_TRUE(Duration(Breakdown{}).is_zero());
}

TEST_F(DurationTest, FromBreakdownAcceptsNegativeAmounts) {
    Duration d(Breakdown{{TimeUnit::hours, 1}, {TimeUnit::minutes, -15}});
    EXPECT_EQ(d.as_minutes(), 45.0);
}

TEST_F(DurationTest, FromMicrofortnights) {
    Duration d(Breakdown{{TimeUnit::microfortnights, 10}});
    EXPECT_DOUBLE_EQ(d.as_milliseconds(), 12'096.0);
    EXPECT_DOUBLE_EQ(d.as(TimeUnit::microfortnights), 10.0);
}

// ==============================================================================
// Static Factories
// ==============================================================================

TEST_F(DurationTest, StaticFactories) {
    EXPECT_EQ(Duration::from_weeks(2).as_milliseconds(), 2 * MS_PER_WEEK);
    EXPECT_EQ(Duration::from_days(2).as_milliseconds(), 2 * MS_PER_DAY);
    EXPECT_EQ(Duration::from_hours(2).as_milliseconds(), 2 * MS_PER_HOUR);
    EXPECT_EQ(Duration::from_minutes(2).as_seconds(), 120.0);
    EXPECT_EQ(Duration::from_seconds(2).as_milliseconds(), 2'000.0);
    EXPECT_NEAR(Duration::from_milliseconds(1500).as_seconds(), 1.5, 1e-12);
}

// ==============================================================================
// Unit Views
// ==============================================================================

TEST_F(DurationTest, UnitViews) {
    EXPECT_DOUBLE_EQ(hour_and_half.as_days(), 1.5 / 24);
    EXPECT_EQ(hour_and_half.as_hours(), 1.5);
    EXPECT_EQ(hour_and_half.as_minutes(), 90.0);
    EXPECT_EQ(hour_and_half.as_seconds(), 90.0 * 60);
    EXPECT_EQ(hour_and_half.as_milliseconds(), 90.0 * 60'000);
    EXPECT_EQ(Duration(Breakdown{{TimeUnit::days, 14}}).as_weeks(), 2.0);
}

TEST_F(DurationTest, GenericUnitViewMatchesNamedViews) {
    const Duration d(123'456'789.0);
    EXPECT_EQ(d.as(TimeUnit::milliseconds), d.as_milliseconds());
    EXPECT_EQ(d.as(TimeUnit::seconds), d.as_seconds());
    EXPECT_EQ(d.as(TimeUnit::minutes), d.as_minutes());
    EXPECT_EQ(d.as(TimeUnit::hours), d.as_hours());
    EXPECT_EQ(d.as(TimeUnit::days), d.as_days());
    EXPECT_EQ(d.as(TimeUnit::weeks), d.as_weeks());
}

TEST_F(DurationTest, UnitViewsOfNegativeValue) {
    const Duration d(-90'000.0);
    EXPECT_EQ(d.as_minutes(), -1.5);
    EXPECT_EQ(d.as_seconds(), -90.0);
}

// ==============================================================================
// Addition and Subtraction
// ==============================================================================

TEST_F(DurationTest, AddDuration) {
    auto d = hour_and_half.add(Duration::from_seconds(125));
    EXPECT_EQ(d.as_seconds(), 90.0 * 60 + 125);
}

TEST_F(DurationTest, AddBreakdown) {
    auto d = hour_and_half.add(Breakdown{{TimeUnit::seconds, 125}});
    EXPECT_EQ(d.as_seconds(), 90.0 * 60 + 125);
}

TEST_F(DurationTest, AddMixedVariadic) {
    auto d = Duration::zero().add(Duration::from_days(3), Breakdown{{TimeUnit::days, 4}},
                                  Duration::from_hours(12));
    EXPECT_EQ(d.as_days(), 7.5);
}

TEST_F(DurationTest, AddNothingReturnsEqualValue) {
    EXPECT_EQ(hour_and_half.add(), hour_and_half);
}

TEST_F(DurationTest, AddDoesNotMutateReceiver) {
    const Duration original = hour_and_half;
    (void)hour_and_half.add(Duration::from_hours(10));
    EXPECT_EQ(hour_and_half, original);
}

TEST_F(DurationTest, SubtractDuration) {
    auto d = hour_and_half.subtract(Duration::from_seconds(125));
    EXPECT_EQ(d.as_seconds(), 90.0 * 60 - 125);
}

TEST_F(DurationTest, SubtractBreakdown) {
    auto d = hour_and_half.subtract(Breakdown{{TimeUnit::seconds, 125}});
    EXPECT_EQ(d.as_seconds(), 90.0 * 60 - 125);
}

TEST_F(DurationTest, SubtractMayGoNegative) {
    auto d = Duration::from_minutes(1).subtract(Duration::from_minutes(3));
    EXPECT_TRUE(d.is_negative());
    EXPECT_EQ(d.as_minutes(), -2.0);
}

TEST_F(DurationTest, AddThenSubtractRestoresValue) {
    const Duration values[] = {Duration(0.0), Duration(1.0), Duration(-73'000.25),
                               Duration::from_weeks(52)};
    const Duration deltas[] = {Duration(12.5), Duration::from_hours(-3),
                               Duration(Breakdown{{TimeUnit::microfortnights, 3}})};
    for (const auto& d : values) {
        for (const auto& x : deltas) {
            EXPECT_NEAR(d.add(x).subtract(x).as_milliseconds(), d.as_milliseconds(), 1e-6);
        }
    }
}

// ==============================================================================
// Scaling
// ==============================================================================

TEST_F(DurationTest, Multiply) {
    EXPECT_EQ(hour_and_half.multiply(3).as_milliseconds(), hour_and_half.as_milliseconds() * 3);
    EXPECT_EQ((hour_and_half * 3).as_milliseconds(), hour_and_half.as_milliseconds() * 3);
    EXPECT_EQ((3 * hour_and_half).as_milliseconds(), hour_and_half.as_milliseconds() * 3);
}

TEST_F(DurationTest, Divide) {
    EXPECT_EQ(hour_and_half.divide(2).as_milliseconds(), hour_and_half.as_milliseconds() / 2);
    EXPECT_EQ((hour_and_half / 3).as_milliseconds(), hour_and_half.as_milliseconds() / 3);
}

TEST_F(DurationTest, DivideByZeroPropagatesInfinity) {
    auto d = hour_and_half.divide(0);
    EXPECT_TRUE(std::isinf(d.as_milliseconds()));
    EXPECT_GT(d.as_milliseconds(), 0.0);

    auto neg = (-hour_and_half).divide(0);
    EXPECT_TRUE(std::isinf(neg.as_milliseconds()));
    EXPECT_LT(neg.as_milliseconds(), 0.0);
}

TEST_F(DurationTest, ZeroDividedByZeroIsNaN) {
    auto d = Duration::zero().divide(0);
    EXPECT_TRUE(std::isnan(d.as_milliseconds()));
    EXPECT_FALSE(d.equals(d)); // NaN never equals itself
}

TEST_F(DurationTest, RatioOfDurations) {
    EXPECT_EQ(Duration::from_hours(3) / Duration::from_minutes(30), 6.0);
}

// ==============================================================================
// Absolute Value and Negation
// ==============================================================================

TEST_F(DurationTest, AbsOfPositiveIsUnchanged) {
    EXPECT_EQ(hour_and_half.abs(), hour_and_half);
}

TEST_F(DurationTest, AbsOfNegativeIsNegated) {
    EXPECT_EQ(Duration(-42.0).abs(), Duration(42.0));
}

TEST_F(DurationTest, AbsOfZeroIsZero) {
    EXPECT_TRUE(Duration::zero().abs().is_zero());
    EXPECT_FALSE(Duration(-0.0).abs().is_negative());
}

TEST_F(DurationTest, SignPredicates) {
    EXPECT_TRUE(hour_and_half.is_positive());
    EXPECT_FALSE(hour_and_half.is_negative());
    EXPECT_FALSE(hour_and_half.is_zero());

    EXPECT_TRUE((-hour_and_half).is_negative());
    EXPECT_FALSE((-hour_and_half).is_positive());

    EXPECT_TRUE(Duration::zero().is_zero());
    EXPECT_FALSE(Duration::zero().is_positive());
    EXPECT_FALSE(Duration::zero().is_negative());
}

TEST_F(DurationTest, UnaryMinus) {
    EXPECT_EQ((-hour_and_half).as_hours(), -1.5);
    EXPECT_EQ(-(-hour_and_half), hour_and_half);
}

// ==============================================================================
// Equality and Ordering
// ==============================================================================

TEST_F(DurationTest, EqualsBreakdownBuiltValue) {
    EXPECT_TRUE(
        Duration(Breakdown{{TimeUnit::hours, 1}, {TimeUnit::minutes, 30}}).equals(hour_and_half));
    EXPECT_FALSE(Duration(Breakdown{{TimeUnit::hours, 1},
                                    {TimeUnit::minutes, 30},
                                    {TimeUnit::milliseconds, 1}})
                     .equals(hour_and_half));
}

TEST_F(DurationTest, EqualsAcrossCarriedUnits) {
    Duration d(Breakdown{{TimeUnit::weeks, 1},
                         {TimeUnit::days, 6},
                         {TimeUnit::hours, 23},
                         {TimeUnit::minutes, 59},
                         {TimeUnit::seconds, 59},
                         {TimeUnit::milliseconds, 1000}});
    EXPECT_TRUE(d.equals(Duration::from_weeks(2)));
}

TEST_F(DurationTest, EqualityHasNoTolerance) {
    EXPECT_NE(Duration(1.0), Duration(1.0 + 1e-9));
}

TEST_F(DurationTest, Ordering) {
    EXPECT_LT(Duration::from_minutes(59), Duration::from_hours(1));
    EXPECT_GT(Duration::from_days(1), Duration::from_hours(23));
    EXPECT_LE(Duration::from_hours(1), Duration::from_minutes(60));
    EXPECT_LT(Duration(-1.0), Duration::zero());
}

// ==============================================================================
// Serialization
// ==============================================================================

TEST_F(DurationTest, SerializeAsMilliseconds) {
    auto s = hour_and_half.serialize();
    ASSERT_EQ(s.size(), 1u);
    ASSERT_TRUE(s.get(TimeUnit::milliseconds).has_value());
    EXPECT_EQ(*s.get(TimeUnit::milliseconds), hour_and_half.as_milliseconds());
}

TEST_F(DurationTest, SerializeRoundTrip) {
    const Duration d(-98'765.4321);
    EXPECT_EQ(Duration(d.serialize()), d);
}

TEST_F(DurationTest, StreamOutput) {
    std::ostringstream oss;
    oss << Duration(1500.0);
    EXPECT_EQ(oss.str(), "Duration(1500 ms)");
}

// ==============================================================================
// Constexpr Usage (compile-time)
// ==============================================================================

TEST_F(DurationTest, ConstexprArithmetic) {
    constexpr Duration d = Duration::from_milliseconds(250) * 4;
    static_assert(d.as_seconds() == 1.0);
    static_assert(Duration(-5.0).abs().as_milliseconds() == 5.0);
    EXPECT_EQ(d.as_milliseconds(), 1000.0);
}
