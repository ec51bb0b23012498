#include <gtest/gtest.h>
#include <chrono>
#include <fmt/format.h>
#include "market/ExpiryCalendar.hpp"
#include "analysis/ContenderRanker.hpp"

namespace SpreadArb {
namespace {

TEST(ExpiryCalendarTest, MonthLabelsForEveryMonth) {
    const char* expected[] = {"JAN22", "FEB22", "MAR22", "APR22", "MAY22", "JUN22",
                              "JUL22", "AUG22", "SEP22", "OCT22", "NOV22", "DEC22"};
    for (int month = 1; month <= 12; ++month) {
        std::string date = fmt::format("22{:02d}15", month);
        EXPECT_EQ(ExpiryCalendar::monthLabel(date), expected[month - 1]) << date;
    }
}

TEST(ExpiryCalendarTest, MonthLabelIgnoresDayAndLeapYear) {
    EXPECT_EQ(ExpiryCalendar::monthLabel("211101"), "NOV21");
    EXPECT_EQ(ExpiryCalendar::monthLabel("221231"), "DEC22");
    EXPECT_EQ(ExpiryCalendar::monthLabel("240229"), "FEB24");
    EXPECT_EQ(ExpiryCalendar::monthLabel("220101"), "JAN22");
    EXPECT_EQ(ExpiryCalendar::monthLabel("220531"), "MAY22");
}

TEST(ExpiryCalendarTest, MonthLabelRejectsMalformedInput) {
    EXPECT_THROW(ExpiryCalendar::monthLabel("2211"), std::invalid_argument);
    EXPECT_THROW(ExpiryCalendar::monthLabel("22AB01"), std::invalid_argument);
    EXPECT_THROW(ExpiryCalendar::monthLabel("221301"), std::invalid_argument);
    EXPECT_THROW(ExpiryCalendar::monthLabel("220001"), std::invalid_argument);
    EXPECT_THROW(ExpiryCalendar::monthLabel("20221101"), std::invalid_argument);
}

TEST(ExpiryCalendarTest, DistinctMonthLabelsKeepFirstSeenOrder) {
    std::vector<std::string> dates = {"221104", "221021", "221111", "221028", "230120"};
    std::vector<std::string> expected = {"NOV22", "OCT22", "JAN23"};
    EXPECT_EQ(ExpiryCalendar::distinctMonthLabels(dates), expected);
    EXPECT_TRUE(ExpiryCalendar::distinctMonthLabels({}).empty());
}

TEST(ExpiryCalendarTest, ParsesAllAcceptedFormats) {
    CivilDate shortForm = ExpiryCalendar::parse("231020");
    CivilDate compact = ExpiryCalendar::parse("20231020");
    CivilDate iso = ExpiryCalendar::parse("2023-10-20");

    EXPECT_EQ(shortForm.year, 2023);
    EXPECT_EQ(shortForm.month, 10u);
    EXPECT_EQ(shortForm.day, 20u);
    EXPECT_EQ(ExpiryCalendar::daysFromCivil(shortForm), ExpiryCalendar::daysFromCivil(compact));
    EXPECT_EQ(ExpiryCalendar::daysFromCivil(compact), ExpiryCalendar::daysFromCivil(iso));
}

TEST(ExpiryCalendarTest, RejectsImpossibleDates) {
    EXPECT_THROW(ExpiryCalendar::parse("230229"), std::invalid_argument);
    EXPECT_THROW(ExpiryCalendar::parse("2023-13-01"), std::invalid_argument);
    EXPECT_THROW(ExpiryCalendar::parse("next friday"), std::invalid_argument);
    EXPECT_NO_THROW(ExpiryCalendar::parse("240229"));
}

TEST(ExpiryCalendarTest, DaysFromCivilMatchesEpoch) {
    EXPECT_EQ(ExpiryCalendar::daysFromCivil(CivilDate{1970, 1, 1}), 0);
    EXPECT_EQ(ExpiryCalendar::daysFromCivil(CivilDate{2000, 3, 1}), 11017);
}

TEST(ExpiryCalendarTest, CompactDateForGateway) {
    EXPECT_EQ(ExpiryCalendar::toCompactDate("211101"), "20211101");
    EXPECT_EQ(ExpiryCalendar::toCompactDate("2024-02-29"), "20240229");
}

TEST(ExpiryCalendarTest, ShortDateOfTimePoint) {
    auto tp = std::chrono::system_clock::time_point(
        std::chrono::seconds(ExpiryCalendar::daysFromCivil(CivilDate{2023, 10, 20}) * 86400L + 3600));
    EXPECT_EQ(ExpiryCalendar::toShortDate(tp), "231020");
    EXPECT_EQ(ExpiryCalendar::today().size(), 6u);
}

TEST(TimeDifferenceTest, ZeroForSameDate) {
    EXPECT_EQ(ContenderRanker::timeDifference("231020", "231020"), 0);
    EXPECT_EQ(ContenderRanker::timeDifference("2023-10-20", "20231020"), 0);
}

TEST(TimeDifferenceTest, IsAntisymmetric) {
    std::vector<std::pair<std::string, std::string>> pairs = {
        {"231020", "231027"}, {"231231", "240101"}, {"240228", "240301"}, {"230101", "251231"}
    };
    for (const auto& p : pairs) {
        EXPECT_EQ(ContenderRanker::timeDifference(p.first, p.second),
                  -ContenderRanker::timeDifference(p.second, p.first));
    }
    EXPECT_EQ(ContenderRanker::timeDifference("231020", "231027"), 7);
    EXPECT_EQ(ContenderRanker::timeDifference("240228", "240301"), 2);
}

}  // namespace
}  // namespace SpreadArb
