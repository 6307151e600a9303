#include <gtest/gtest.h>

#include "fakes.hpp"
#include "music/track_queue.hpp"

namespace jukebox {
namespace {

using testing::make_track;

TEST(TrackQueueTest, RejectsAddWhenFull) {
    TrackQueue queue(3);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(queue.add(make_track("t" + std::to_string(i)), 1, "alice").has_value());
    }

    EXPECT_TRUE(queue.full());
    EXPECT_FALSE(queue.add(make_track("overflow"), 1, "alice").has_value());
    EXPECT_EQ(queue.size(), 3u);
}

TEST(TrackQueueTest, FifoOrderAndPositions) {
    TrackQueue queue;
    auto a = queue.add(make_track("A"), 1, "alice");
    auto b = queue.add(make_track("B"), 2, "bob");
    auto c = queue.add(make_track("C"), 1, "alice");

    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(a->position, 1);
    EXPECT_EQ(b->position, 2);
    EXPECT_EQ(c->position, 3);

    auto first = queue.get_next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->track.title, "A");

    auto items = queue.items();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].track.title, "B");
    EXPECT_EQ(items[0].position, 1);
    EXPECT_EQ(items[1].track.title, "C");
    EXPECT_EQ(items[1].position, 2);
}

TEST(TrackQueueTest, PositionsCountFromTwoWithCurrent) {
    TrackQueue queue;
    queue.add(make_track("A"), 1, "alice");
    queue.set_current(queue.get_next());

    auto b = queue.add(make_track("B"), 1, "alice");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->position, 2);
    EXPECT_EQ(queue.current()->position, 1);
}

// Capacity two: A and B fit, C is rejected, B moves up once A is taken
TEST(TrackQueueTest, SmallQueueScenario) {
    TrackQueue queue(2);

    auto a = queue.add(make_track("A"), 1, "alice");
    auto b = queue.add(make_track("B"), 1, "alice");
    auto c = queue.add(make_track("C"), 1, "alice");

    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->position, 1);
    EXPECT_EQ(b->position, 2);
    EXPECT_FALSE(c.has_value());

    auto next = queue.get_next();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->track.title, "A");
    EXPECT_EQ(queue.peek_next()->track.title, "B");
    EXPECT_EQ(queue.peek_next()->position, 1);
}

TEST(TrackQueueTest, TotalDurationIncludesCurrent) {
    TrackQueue queue;
    queue.add(make_track("A", 100), 1, "alice");
    queue.set_current(queue.get_next());
    queue.add(make_track("B", 60), 1, "alice");

    EXPECT_EQ(queue.total_duration(), 160);
    EXPECT_EQ(queue.total_duration_formatted(), "2m 40s");
}

TEST(TrackQueueTest, RemoveAtRenumbers) {
    TrackQueue queue;
    queue.add(make_track("A"), 1, "alice");
    queue.add(make_track("B"), 1, "alice");
    queue.add(make_track("C"), 1, "alice");

    auto removed = queue.remove_at(2);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->track.title, "B");

    auto items = queue.items();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[1].track.title, "C");
    EXPECT_EQ(items[1].position, 2);

    EXPECT_FALSE(queue.remove_at(0).has_value());
    EXPECT_FALSE(queue.remove_at(3).has_value());
}

TEST(TrackQueueTest, RemoveAtNeverTakesCurrent) {
    TrackQueue queue;
    queue.add(make_track("A"), 1, "alice");
    queue.set_current(queue.get_next());
    queue.add(make_track("B"), 1, "alice");

    EXPECT_FALSE(queue.remove_at(1).has_value());
    auto removed = queue.remove_at(2);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->track.title, "B");
    EXPECT_TRUE(queue.current().has_value());
}

TEST(TrackQueueTest, ClearUpcomingKeepsCurrent) {
    TrackQueue queue;
    queue.add(make_track("A"), 1, "alice");
    queue.set_current(queue.get_next());
    queue.add(make_track("B"), 1, "alice");
    queue.add(make_track("C"), 1, "alice");

    EXPECT_EQ(queue.clear_upcoming(), 2u);
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.current()->track.title, "A");

    queue.clear();
    EXPECT_FALSE(queue.current().has_value());
}

TEST(TrackQueueTest, AddMultipleStopsAtCapacity) {
    TrackQueue queue(3);
    std::vector<Track> tracks;
    for (int i = 0; i < 5; ++i) {
        tracks.push_back(make_track("t" + std::to_string(i)));
    }

    auto added = queue.add_multiple(tracks, 1, "alice");
    ASSERT_EQ(added.size(), 3u);
    EXPECT_EQ(added.back().track.title, "t2");
    EXPECT_EQ(queue.size(), 3u);
}

TEST(TrackQueueTest, ShuffleKeepsItems) {
    TrackQueue queue;
    for (int i = 0; i < 20; ++i) {
        queue.add(make_track("t" + std::to_string(i)), 1, "alice");
    }
    queue.shuffle();

    auto items = queue.items();
    ASSERT_EQ(items.size(), 20u);
    std::set<std::string> titles;
    for (size_t i = 0; i < items.size(); ++i) {
        titles.insert(items[i].track.title);
        EXPECT_EQ(items[i].position, static_cast<int>(i) + 1);
    }
    EXPECT_EQ(titles.size(), 20u);
}

TEST(TrackQueueTest, PageIsClamped) {
    TrackQueue queue;
    for (int i = 0; i < 25; ++i) {
        queue.add(make_track("t" + std::to_string(i)), 1, "alice");
    }

    auto page = queue.get_page(3, 10);
    EXPECT_EQ(page.page, 3);
    EXPECT_EQ(page.total_pages, 3);
    ASSERT_EQ(page.items.size(), 5u);
    EXPECT_EQ(page.items[0].track.title, "t20");

    EXPECT_EQ(queue.get_page(99, 10).page, 3);
    EXPECT_EQ(queue.get_page(-4, 10).page, 1);

    TrackQueue empty;
    auto none = empty.get_page(1, 10);
    EXPECT_EQ(none.total_pages, 1);
    EXPECT_TRUE(none.items.empty());
}

TEST(TrackQueueTest, HistoryIsBounded) {
    TrackQueue queue;
    for (int i = 0; i < 15; ++i) {
        queue.add(make_track("t" + std::to_string(i)), 1, "alice");
        queue.set_current(queue.get_next());
    }
    queue.set_current(std::nullopt);

    ASSERT_EQ(queue.history().size(), TrackQueue::kHistoryLimit);
    EXPECT_EQ(queue.history().front().track.title, "t5");
    EXPECT_EQ(queue.history().back().track.title, "t14");
}

TEST(TrackQueueTest, DiscardCurrentSkipsHistory) {
    TrackQueue queue;
    queue.add(make_track("A"), 1, "alice");
    queue.add(make_track("B"), 1, "alice");
    queue.set_current(queue.get_next());
    EXPECT_EQ(queue.items()[0].position, 2);

    queue.discard_current();
    EXPECT_FALSE(queue.current().has_value());
    EXPECT_TRUE(queue.history().empty());
    EXPECT_EQ(queue.items()[0].position, 1);
}

} // namespace
} // namespace jukebox
