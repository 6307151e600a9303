#pragma once

#include "music/models.hpp"
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace jukebox {

struct QueuePage {
    std::vector<QueueItem> items;
    int page = 1;
    int total_pages = 1;
};

// Bounded FIFO of upcoming tracks plus the item currently playing.
// Not thread-safe; a session only touches its queue from its own strand.
class TrackQueue {
public:
    static constexpr size_t kHistoryLimit = 10;

    explicit TrackQueue(size_t max_size = 100);

    // Returns nullopt when the queue is full
    std::optional<QueueItem> add(const Track& track, Snowflake requester_id, const std::string& requester_name);

    // Adds until the queue fills up; the result holds only the accepted items
    std::vector<QueueItem> add_multiple(const std::vector<Track>& tracks, Snowflake requester_id,
                                        const std::string& requester_name);

    // Pops the head. Does not touch current.
    std::optional<QueueItem> get_next();
    std::optional<QueueItem> peek_next() const;

    // Position as displayed to users (1 is current when set)
    std::optional<QueueItem> remove_at(int position);

    // Drops queued items and current, history is kept
    void clear();

    // Drops queued items only, returns how many were removed
    size_t clear_upcoming();

    void shuffle();

    QueuePage get_page(int page = 1, int per_page = 10) const;

    const std::optional<QueueItem>& current() const { return current_; }
    std::optional<QueueItem>& current() { return current_; }

    // Moves the previous current item into history
    void set_current(std::optional<QueueItem> item);

    // Drops current without recording it in history
    void discard_current();

    std::vector<QueueItem> items() const;
    const std::deque<QueueItem>& history() const { return history_; }

    size_t size() const { return queue_.size(); }
    size_t max_size() const { return max_size_; }
    bool empty() const { return queue_.empty(); }
    bool full() const { return queue_.size() >= max_size_; }

    // Seconds, current item included
    int total_duration() const;
    std::string total_duration_formatted() const;

private:
    std::deque<QueueItem> queue_;
    size_t max_size_;
    std::optional<QueueItem> current_;
    std::deque<QueueItem> history_;

    void update_positions();
};

} // namespace jukebox
