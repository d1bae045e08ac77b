#include "cronfire/cron/field_set.hpp"
#include "cronfire/cron/schedule.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace cronfire;

class FieldSetTest : public ::testing::Test {
protected:
  static auto minutes(std::string_view token) -> Result<FieldSet> {
    return FieldSet::parse(token, field_domain(FieldKind::Minute));
  }

  static auto days(std::string_view token) -> Result<FieldSet> {
    return FieldSet::parse(token, field_domain(FieldKind::DayOfMonth));
  }

  static auto weekdays(std::string_view token) -> Result<FieldSet> {
    return FieldSet::parse(token, field_domain(FieldKind::DayOfWeek));
  }

  static auto months(std::string_view token) -> Result<FieldSet> {
    return FieldSet::parse(token, field_domain(FieldKind::Month));
  }

  static auto range(int from, int to, int step = 1) -> std::vector<int> {
    std::vector<int> v;
    for (int i = from; i <= to; i += step)
      v.push_back(i);
    return v;
  }
};

TEST_F(FieldSetTest, StarIsFullDomain) {
  auto set = minutes("*");
  ASSERT_TRUE(set.has_value());
  EXPECT_EQ(set->values(), range(0, 59));
  EXPECT_EQ(set->min_set(), 0);
  EXPECT_EQ(set->max_set(), 59);
}

TEST_F(FieldSetTest, StarWithStepOneOrZeroIsFullDomain) {
  EXPECT_EQ(minutes("*/1")->values(), range(0, 59));
  EXPECT_EQ(minutes("*/0")->values(), range(0, 59));
}

TEST_F(FieldSetTest, StarWithStepStartsAtMinimum) {
  EXPECT_EQ(minutes("*/15")->values(), (std::vector<int>{0, 15, 30, 45}));
  EXPECT_EQ(days("*/10")->values(), (std::vector<int>{1, 11, 21, 31}));
}

TEST_F(FieldSetTest, SingleValue) {
  auto set = minutes("7");
  ASSERT_TRUE(set.has_value());
  EXPECT_EQ(set->values(), std::vector<int>{7});
  EXPECT_EQ(set->min_set(), 7);
  EXPECT_EQ(set->max_set(), 7);
}

TEST_F(FieldSetTest, SingleValueWithStepOne) {
  EXPECT_EQ(minutes("7/1")->values(), std::vector<int>{7});
}

TEST_F(FieldSetTest, SingleValueWithStepZeroRunsToMaximum) {
  EXPECT_EQ(minutes("55/0")->values(), range(55, 59));
  EXPECT_EQ(days("28/0")->values(), range(28, 31));
  EXPECT_EQ(minutes("59/0")->values(), std::vector<int>{59});
}

TEST_F(FieldSetTest, SingleValueWithOtherStepFails) {
  auto set = minutes("5/2");
  ASSERT_FALSE(set.has_value());
  EXPECT_EQ(set.error(), Error::MalformedToken);
}

TEST_F(FieldSetTest, Range) {
  EXPECT_EQ(minutes("10-14")->values(), range(10, 14));
}

TEST_F(FieldSetTest, RangeWithStep) {
  EXPECT_EQ(minutes("0-8/2")->values(), range(0, 8, 2));
  EXPECT_EQ(minutes("3-20/5")->values(), range(3, 20, 5));
}

TEST_F(FieldSetTest, RangeWithStepLargerThanRange) {
  EXPECT_EQ(minutes("10-12/30")->values(), std::vector<int>{10});
}

TEST_F(FieldSetTest, ReversedRangeIsSwapped) {
  EXPECT_EQ(minutes("20-3/5")->values(), range(3, 20, 5));
  EXPECT_EQ(minutes("14-10")->values(), range(10, 14));
}

TEST_F(FieldSetTest, HugeStepKeepsOnlyTheStart) {
  auto star = days("*/2147483647");
  ASSERT_TRUE(star.has_value());
  EXPECT_EQ(star->values(), std::vector<int>{1});
  EXPECT_EQ(star->max_set(), 1);

  auto ranged = minutes("1-2/2147483647");
  ASSERT_TRUE(ranged.has_value());
  EXPECT_EQ(ranged->values(), std::vector<int>{1});

  auto schedule = Schedule::parse("0 0 */2147483647 * *");
  ASSERT_TRUE(schedule.has_value());
  EXPECT_EQ(schedule->days_of_month().values(), std::vector<int>{1});
}

TEST_F(FieldSetTest, RangeWithStepZeroUsesStepOne) {
  EXPECT_EQ(minutes("10-12/0")->values(), range(10, 12));
}

TEST_F(FieldSetTest, ListAccumulates) {
  EXPECT_EQ(minutes("5,1,30-32")->values(),
            (std::vector<int>{1, 5, 30, 31, 32}));
}

TEST_F(FieldSetTest, OverlappingListEntriesMerge) {
  EXPECT_EQ(minutes("1-5,3-7")->values(), range(1, 7));
}

TEST_F(FieldSetTest, BoundsOnlyWiden) {
  auto set = minutes("10-50,20-30");
  ASSERT_TRUE(set.has_value());
  EXPECT_EQ(set->min_set(), 10);
  EXPECT_EQ(set->max_set(), 50);

  auto stepped = minutes("0-59/20,45");
  ASSERT_TRUE(stepped.has_value());
  EXPECT_EQ(stepped->min_set(), 0);
  EXPECT_EQ(stepped->max_set(), 45);
}

TEST_F(FieldSetTest, WeekdayNames) {
  EXPECT_EQ(weekdays("Mon-Fri")->values(), range(1, 5));
  EXPECT_EQ(weekdays("SUN,TUE")->values(), (std::vector<int>{0, 2}));
  EXPECT_EQ(weekdays("saturday")->values(), std::vector<int>{6});
}

TEST_F(FieldSetTest, NamePrefixFirstMatchWins) {
  EXPECT_EQ(weekdays("T")->values(), std::vector<int>{2});
  EXPECT_EQ(weekdays("th")->values(), std::vector<int>{4});
  EXPECT_EQ(months("Ma")->values(), std::vector<int>{3});
  EXPECT_EQ(months("MAY")->values(), std::vector<int>{5});
  EXPECT_EQ(months("ju")->values(), std::vector<int>{6});
}

TEST_F(FieldSetTest, MonthNameRangeWithStep) {
  EXPECT_EQ(months("jan-dec/3")->values(), (std::vector<int>{1, 4, 7, 10}));
}

TEST_F(FieldSetTest, MixedNumbersAndNames) {
  EXPECT_EQ(months("1,Mar,12")->values(), (std::vector<int>{1, 3, 12}));
}

TEST_F(FieldSetTest, UnknownNameFails) {
  auto set = weekdays("Funday");
  ASSERT_FALSE(set.has_value());
  EXPECT_EQ(set.error(), Error::UnknownName);
}

TEST_F(FieldSetTest, NameInFieldWithoutNamesFails) {
  auto set = minutes("Mon");
  ASSERT_FALSE(set.has_value());
  EXPECT_EQ(set.error(), Error::UnknownName);
}

TEST_F(FieldSetTest, OutOfRangeValuesFail) {
  EXPECT_EQ(minutes("60").error(), Error::ValueOutOfRange);
  EXPECT_EQ(days("0").error(), Error::ValueOutOfRange);
  EXPECT_EQ(weekdays("7").error(), Error::ValueOutOfRange);
  EXPECT_EQ(months("13").error(), Error::ValueOutOfRange);
  EXPECT_EQ(minutes("50-60").error(), Error::ValueOutOfRange);
  EXPECT_EQ(minutes("99999999999").error(), Error::ValueOutOfRange);
  EXPECT_EQ(minutes("60/0").error(), Error::ValueOutOfRange);
}

TEST_F(FieldSetTest, MalformedTokensFail) {
  for (auto token : {"", " ", "1,,2", ",", "5x", "/5", "*/", "*/x", "*/-1",
                     "-5", "1-", "*-5", "1-2-3", "1/2/3", "?"}) {
    auto set = minutes(token);
    ASSERT_FALSE(set.has_value()) << "token: \"" << token << "\"";
    EXPECT_EQ(set.error(), Error::MalformedToken) << "token: \"" << token
                                                  << "\"";
  }
}

TEST_F(FieldSetTest, FirstIsMinimumMember) {
  EXPECT_EQ(minutes("40,7,22")->first(), 7);
  EXPECT_EQ(days("*")->first(), 1);
  EXPECT_EQ(weekdays("Sat")->first(), 6);
}

TEST_F(FieldSetTest, NextReturnsSmallestMemberAtOrAfter) {
  auto set = minutes("10,20,30");
  ASSERT_TRUE(set.has_value());
  EXPECT_EQ(set->next(0), 10);
  EXPECT_EQ(set->next(10), 10);
  EXPECT_EQ(set->next(11), 20);
  EXPECT_EQ(set->next(30), 30);
  EXPECT_EQ(set->next(31), std::nullopt);
  EXPECT_EQ(set->next(60), std::nullopt);
  EXPECT_EQ(set->next(-5), 10);
}

TEST_F(FieldSetTest, ContainsMatchesValues) {
  auto set = weekdays("Mon-Fri");
  ASSERT_TRUE(set.has_value());
  for (int d = 0; d <= 6; ++d) {
    EXPECT_EQ(set->contains(d), d >= 1 && d <= 5) << d;
  }
}

TEST_F(FieldSetTest, EmptySetHasNoMembers) {
  FieldSet set;
  EXPECT_TRUE(set.empty());
  EXPECT_EQ(set.first(), std::nullopt);
  EXPECT_EQ(set.next(0), std::nullopt);
  EXPECT_TRUE(set.values().empty());
}

TEST_F(FieldSetTest, Singleton) {
  auto set = FieldSet::singleton(0, field_domain(FieldKind::Second));
  EXPECT_EQ(set.values(), std::vector<int>{0});
  EXPECT_EQ(set, *FieldSet::parse("0", field_domain(FieldKind::Second)));
}

TEST_F(FieldSetTest, StepProgressionMatchesArithmeticSequence) {
  for (int a = 0; a < 60; a += 7) {
    for (int b = 0; b < 60; b += 11) {
      for (int n = 1; n < 25; n += 4) {
        auto token = std::to_string(a) + "-" + std::to_string(b) + "/" +
                     std::to_string(n);
        auto set = minutes(token);
        ASSERT_TRUE(set.has_value()) << token;
        EXPECT_EQ(set->values(), range(std::min(a, b), std::max(a, b), n))
            << token;
      }
    }
  }
}
