#include "deadline.hpp"
#include <gtest/gtest.h>

static Instant hm(int h, int m) { return at_time_of_day(h, m); }

static Task task(const std::string& desc, std::optional<std::string> deadline = std::nullopt) {
  Task t;
  t.description = desc;
  t.deadline = deadline;
  return t;
}

TEST(DeadlinePhrase, AcceptedShapes) {
  EXPECT_EQ(parse_deadline_phrase("Dinner before 9 pm").value(), hm(21, 0));
  EXPECT_EQ(parse_deadline_phrase("Dinner before 9pm").value(), hm(21, 0));
  EXPECT_EQ(parse_deadline_phrase("email boss by 8:30pm").value(), hm(20, 30));
  EXPECT_EQ(parse_deadline_phrase("email boss by 8 : 30 pm").value(), hm(20, 30));
  EXPECT_EQ(parse_deadline_phrase("Gym BEFORE 11:05 AM").value(), hm(11, 5));
  EXPECT_EQ(parse_deadline_phrase("call bank by10am").value(), hm(10, 0));
}

TEST(DeadlinePhrase, TwelveOClock) {
  EXPECT_EQ(parse_deadline_phrase("lunch by 12 pm").value(), hm(12, 0));
  EXPECT_EQ(parse_deadline_phrase("lunch by 12:30 pm").value(), hm(12, 30));
  EXPECT_EQ(parse_deadline_phrase("backup by 12 am").value(), hm(0, 0));
}

TEST(DeadlinePhrase, RejectsOtherText) {
  EXPECT_FALSE(parse_deadline_phrase("call mom"));
  EXPECT_FALSE(parse_deadline_phrase("walk by the river"));
  EXPECT_FALSE(parse_deadline_phrase("meet at 5 pm"));
  EXPECT_FALSE(parse_deadline_phrase("drop off nearby 5pm"));
  EXPECT_FALSE(parse_deadline_phrase("by 5"));
  EXPECT_FALSE(parse_deadline_phrase("by 5 pmx"));
  EXPECT_FALSE(parse_deadline_phrase(""));
}

TEST(DeadlinePhrase, OutOfRangeIsNoDeadline) {
  EXPECT_FALSE(parse_deadline_phrase("by 13 pm"));
  EXPECT_FALSE(parse_deadline_phrase("by 0 am"));
  EXPECT_FALSE(parse_deadline_phrase("by 5:75 pm"));
}

TEST(DeadlinePhrase, EarliestPhraseWins) {
  EXPECT_EQ(parse_deadline_phrase("by 5 pm, or before 3:30 pm at the latest").value(), hm(17, 0));
  EXPECT_EQ(parse_deadline_phrase("before 3:30 pm, by 5 pm at the latest").value(), hm(15, 30));
}

TEST(DeadlinePhrase, TableListsEveryShape) {
  const auto& shapes = deadline_shapes();
  ASSERT_EQ(shapes.size(), 2u);
  EXPECT_FALSE(shapes[0].has_minutes);
  EXPECT_TRUE(shapes[1].has_minutes);
}

TEST(ExtractDeadline, StructuredFieldFirst) {
  auto d = extract_deadline(task("Report by 5 pm", std::string("10:00")), hm(17, 0));
  EXPECT_EQ(d.value(), hm(10, 0));
}

TEST(ExtractDeadline, FallsBackToDescription) {
  EXPECT_EQ(extract_deadline(task("Report by 3 pm"), hm(17, 0)).value(), hm(15, 0));
  EXPECT_EQ(extract_deadline(task("Report by 3 pm", std::string("25:00")), hm(17, 0)).value(),
            hm(15, 0));
}

TEST(ExtractDeadline, ClippedToWindowEnd) {
  EXPECT_EQ(extract_deadline(task("x", std::string("18:30")), hm(17, 0)).value(), hm(17, 0));
  EXPECT_EQ(extract_deadline(task("Dinner before 9 pm"), hm(17, 0)).value(), hm(17, 0));
}

TEST(ExtractDeadline, NoneFound) {
  EXPECT_FALSE(extract_deadline(task("Finish project"), hm(17, 0)));
  EXPECT_FALSE(extract_deadline(task("Finish project", std::string("soon")), hm(17, 0)));
}
