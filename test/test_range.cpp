#include <gtest/gtest.h>

#include <string>

#include <Range.hpp>
#include <explints.hpp>

using Percent = Range<i32, 0, 100>;

struct TooLow { };
using Small = Range<u8, 1, 9, TooLow>;

TEST(Range, HoldsValue) {
	Percent p(42);
	EXPECT_EQ(p.get(), 42);
	EXPECT_EQ(static_cast<i32>(p), 42);
}

TEST(Range, ThrowsRangeErrorWithBounds) {
	try {
		Percent p(-3);
		FAIL() << "constructed " << p.get();
	} catch (const std::range_error& e) {
		EXPECT_EQ(std::string(e.what()), "Value -3 outside range (0-100)");
	}
}

TEST(Range, CustomError) {
	EXPECT_THROW(Small{0}, TooLow);
	EXPECT_THROW(Small{10}, TooLow);
	EXPECT_NO_THROW(Small{9});
}

TEST(Range, Contains) {
	static_assert(Percent::contains(0));
	static_assert(Percent::contains(100));
	static_assert(!Percent::contains(101));
	static_assert(Percent::min == 0 && Percent::max == 100);
	EXPECT_FALSE(Percent::contains(-1));
}

TEST(Range, Comparison) {
	EXPECT_EQ(Percent(5), Percent(5));
	EXPECT_LT(Percent(4), Percent(5));
	EXPECT_EQ(Percent(9) <=> Percent(3), std::strong_ordering::greater);
}
