#include "numeric_string_conversions.h"

#include <gtest/gtest.h>

TEST(NumberFromString, ParsesWholeStringsOnly) {
	EXPECT_EQ(number_from_string<std::int32_t>(u8" -12 "), -12);
	EXPECT_EQ(number_from_string<std::uint32_t>(u8"+7"), 7u);
	EXPECT_EQ(number_from_string<double>(u8"0.25"), 0.25);
	EXPECT_EQ(number_from_string<double>(u8"-1e-6"), -1e-6);
	EXPECT_FALSE(number_from_string<std::int32_t>(u8"12abc").has_value());
	EXPECT_FALSE(number_from_string<std::uint32_t>(u8"-1").has_value());
	EXPECT_FALSE(number_from_string<double>(u8"").has_value());
}

TEST(NumbersFromString, NeedsExactlyTheRightCount) {
	std::optional<std::array<double, 3>> const point
		= numbers_from_string<double, 3>(u8"1 -2.5  3");
	ASSERT_TRUE(point.has_value());
	EXPECT_EQ(point.value(), (std::array<double, 3>{ 1.0, -2.5, 3.0 }));

	EXPECT_FALSE((numbers_from_string<double, 3>(u8"1 2").has_value()));
	EXPECT_FALSE((numbers_from_string<double, 3>(u8"1 2 3 4").has_value()));
	EXPECT_FALSE((numbers_from_string<double, 3>(u8"1 x 3").has_value()));
}

TEST(NumberListFromString, ReadsAnyCount) {
	EXPECT_EQ(
		number_list_from_string<std::uint32_t>(u8" 0 1 2 3"),
		(std::vector<std::uint32_t>{ 0, 1, 2, 3 })
	);
	EXPECT_EQ(
		number_list_from_string<std::uint32_t>(u8""),
		std::vector<std::uint32_t>{}
	);
	EXPECT_FALSE(number_list_from_string<std::uint32_t>(u8"0 -1").has_value()
	);
}
