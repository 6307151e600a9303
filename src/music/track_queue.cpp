#include "music/track_queue.hpp"
#include <algorithm>
#include <iostream>
#include <random>
#include <sstream>

namespace jukebox {

TrackQueue::TrackQueue(size_t max_size) : max_size_(max_size) {}

std::optional<QueueItem> TrackQueue::add(const Track& track, Snowflake requester_id,
                                         const std::string& requester_name) {
    if (full()) {
        std::cerr << "[music] Queue is full (" << max_size_ << " tracks)" << std::endl;
        return std::nullopt;
    }

    QueueItem item;
    item.track = track;
    item.requester_id = requester_id;
    item.requester_name = requester_name;
    item.position = static_cast<int>(queue_.size()) + (current_ ? 2 : 1);

    queue_.push_back(item);
    return item;
}

std::vector<QueueItem> TrackQueue::add_multiple(const std::vector<Track>& tracks, Snowflake requester_id,
                                                const std::string& requester_name) {
    std::vector<QueueItem> added;
    for (const auto& track : tracks) {
        if (full()) {
            break;
        }
        auto item = add(track, requester_id, requester_name);
        if (item) {
            added.push_back(*item);
        }
    }
    return added;
}

std::optional<QueueItem> TrackQueue::get_next() {
    if (queue_.empty()) {
        return std::nullopt;
    }

    QueueItem item = std::move(queue_.front());
    queue_.pop_front();
    update_positions();

    return item;
}

std::optional<QueueItem> TrackQueue::peek_next() const {
    if (queue_.empty()) {
        return std::nullopt;
    }
    return queue_.front();
}

std::optional<QueueItem> TrackQueue::remove_at(int position) {
    // Position 1 is the current track, so queued items start at 2
    int index = current_ ? position - 2 : position - 1;

    if (index < 0 || index >= static_cast<int>(queue_.size())) {
        return std::nullopt;
    }

    auto it = queue_.begin() + index;
    QueueItem removed = std::move(*it);
    queue_.erase(it);
    update_positions();

    return removed;
}

void TrackQueue::clear() {
    queue_.clear();
    current_.reset();
}

size_t TrackQueue::clear_upcoming() {
    size_t count = queue_.size();
    queue_.clear();
    return count;
}

void TrackQueue::shuffle() {
    static thread_local std::mt19937 gen{std::random_device{}()};
    std::shuffle(queue_.begin(), queue_.end(), gen);
    update_positions();
}

QueuePage TrackQueue::get_page(int page, int per_page) const {
    if (per_page < 1) per_page = 1;

    int total_items = static_cast<int>(queue_.size());

    QueuePage result;
    result.total_pages = std::max(1, (total_items + per_page - 1) / per_page);
    result.page = std::max(1, std::min(page, result.total_pages));

    int start = (result.page - 1) * per_page;
    int end = std::min(start + per_page, total_items);
    for (int i = start; i < end; i++) {
        result.items.push_back(queue_[i]);
    }

    return result;
}

void TrackQueue::set_current(std::optional<QueueItem> item) {
    if (current_) {
        history_.push_back(std::move(*current_));
        while (history_.size() > kHistoryLimit) {
            history_.pop_front();
        }
    }
    current_ = std::move(item);
    if (current_) {
        current_->position = 1;
    }
    update_positions();
}

void TrackQueue::discard_current() {
    current_.reset();
    update_positions();
}

std::vector<QueueItem> TrackQueue::items() const {
    return std::vector<QueueItem>(queue_.begin(), queue_.end());
}

int TrackQueue::total_duration() const {
    int total = 0;
    for (const auto& item : queue_) {
        total += item.track.duration;
    }
    if (current_) {
        total += current_->track.duration;
    }
    return total;
}

std::string TrackQueue::total_duration_formatted() const {
    int total = total_duration();
    int hours = total / 3600;
    int minutes = (total % 3600) / 60;
    int seconds = total % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h " << minutes << "m " << seconds << "s";
    } else if (minutes > 0) {
        ss << minutes << "m " << seconds << "s";
    } else {
        ss << seconds << "s";
    }
    return ss.str();
}

void TrackQueue::update_positions() {
    int start = current_ ? 2 : 1;
    for (size_t i = 0; i < queue_.size(); ++i) {
        queue_[i].position = start + static_cast<int>(i);
    }
}

} // namespace jukebox
