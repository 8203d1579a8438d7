#include "placer.hpp"
#include <gtest/gtest.h>

using std::chrono::minutes;

static Instant hm(int h, int m) { return at_time_of_day(h, m); }

TEST(BackwardPlacer, EndsExactlyAtDeadline) {
  auto s = find_backward_slot(hm(10, 0), minutes(30), {}, hm(9, 0));
  ASSERT_TRUE(s);
  EXPECT_EQ(s->start, hm(9, 30));
  EXPECT_EQ(s->end, hm(10, 0));
}

TEST(BackwardPlacer, OffGridDeadlineRoundsDown) {
  auto s = find_backward_slot(hm(10, 10), minutes(30), {}, hm(9, 0));
  ASSERT_TRUE(s);
  EXPECT_EQ(s->start, hm(9, 30));
  EXPECT_EQ(s->end, hm(10, 0));
}

TEST(BackwardPlacer, OffGridDurationStartsOnGrid) {
  // 9:40 rounds up to 9:45 and would end 10:05, past the deadline.
  auto s = find_backward_slot(hm(10, 0), minutes(20), {}, hm(9, 0));
  ASSERT_TRUE(s);
  EXPECT_EQ(s->start, hm(9, 30));
  EXPECT_EQ(s->end, hm(9, 50));
}

TEST(BackwardPlacer, StepsBackAroundBusyTime) {
  Occupied occ{{hm(9, 30), hm(10, 5)}};
  auto s = find_backward_slot(hm(10, 0), minutes(30), occ, hm(8, 0));
  ASSERT_TRUE(s);
  // 9:00-9:30 would leave no room for its break before 9:30.
  EXPECT_EQ(s->start, hm(8, 45));
  EXPECT_EQ(s->end, hm(9, 15));
}

TEST(BackwardPlacer, BreakMayRunPastDeadline) {
  Occupied occ{{hm(10, 10), hm(11, 0)}};
  auto s = find_backward_slot(hm(10, 0), minutes(30), occ, hm(9, 0));
  ASSERT_TRUE(s);
  EXPECT_EQ(s->end, hm(10, 0));
}

TEST(BackwardPlacer, NoRoomBeforeDeadline) {
  EXPECT_FALSE(find_backward_slot(hm(9, 15), minutes(30), {}, hm(9, 0)));
  EXPECT_FALSE(find_backward_slot(hm(8, 0), minutes(15), {}, hm(9, 0)));

  Occupied occ{{hm(9, 0), hm(10, 0)}};
  EXPECT_FALSE(find_backward_slot(hm(10, 0), minutes(15), occ, hm(9, 0)));
}

TEST(BackwardPlacer, ScanIsBounded) {
  // 0:00-10:30 is free, but the 49th candidate ends at 11:00.
  Occupied occ{{hm(10, 45), hm(23, 0)}};
  EXPECT_FALSE(find_backward_slot(hm(23, 0), minutes(15), occ, hm(0, 0)));

  Occupied later{{hm(11, 15), hm(23, 0)}};
  auto s = find_backward_slot(hm(23, 0), minutes(15), later, hm(0, 0));
  ASSERT_TRUE(s);
  EXPECT_EQ(s->start, hm(10, 45));
  EXPECT_EQ(s->end, hm(11, 0));
}

TEST(ForwardPlacer, StartsAtRoundedCursor) {
  auto s = find_forward_slot(hm(9, 7), minutes(45), {}, hm(9, 0), hm(15, 0));
  ASSERT_TRUE(s);
  EXPECT_EQ(s->start, hm(9, 15));
  EXPECT_EQ(s->end, hm(10, 0));
}

TEST(ForwardPlacer, CursorBeforeWindowUsesWindowStart) {
  auto s = find_forward_slot(hm(8, 0), minutes(30), {}, hm(9, 0), hm(15, 0));
  ASSERT_TRUE(s);
  EXPECT_EQ(s->start, hm(9, 0));
}

TEST(ForwardPlacer, SkipsBusyTime) {
  Occupied occ{{hm(9, 0), hm(9, 50)}};
  auto s = find_forward_slot(hm(9, 0), minutes(30), occ, hm(9, 0), hm(15, 0));
  ASSERT_TRUE(s);
  EXPECT_EQ(s->start, hm(10, 0));
  EXPECT_EQ(s->end, hm(10, 30));
}

TEST(ForwardPlacer, LeavesRoomForBreakBeforeBusyTime) {
  Occupied occ{{hm(10, 0), hm(10, 30)}};
  auto s = find_forward_slot(hm(9, 0), minutes(60), occ, hm(9, 0), hm(15, 0));
  ASSERT_TRUE(s);
  EXPECT_EQ(s->start, hm(10, 30));

  s = find_forward_slot(hm(9, 0), minutes(55), occ, hm(9, 0), hm(15, 0));
  ASSERT_TRUE(s);
  EXPECT_EQ(s->start, hm(9, 0));
  EXPECT_EQ(s->end, hm(9, 55));
}

TEST(ForwardPlacer, DoesNotRunPastWindow) {
  EXPECT_FALSE(find_forward_slot(hm(9, 30), minutes(60), {}, hm(9, 0), hm(10, 0)));
  auto s = find_forward_slot(hm(9, 30), minutes(30), {}, hm(9, 0), hm(10, 0));
  ASSERT_TRUE(s);
  EXPECT_EQ(s->end, hm(10, 0));
}

TEST(ForwardPlacer, ScanIsBounded) {
  Occupied occ{{hm(9, 0), hm(21, 0)}};
  auto s = find_forward_slot(hm(9, 0), minutes(15), occ, hm(9, 0), hm(23, 0));
  ASSERT_TRUE(s);
  EXPECT_EQ(s->start, hm(21, 0));

  // 21:15 would fit but lies beyond the last of the 49 candidates.
  Occupied longer{{hm(9, 0), hm(21, 5)}};
  EXPECT_FALSE(find_forward_slot(hm(9, 0), minutes(15), longer, hm(9, 0), hm(23, 0)));
}
