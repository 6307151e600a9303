#include "utils/strand.hpp"
#include <iostream>

namespace jukebox {

namespace {
thread_local const Strand* t_current_strand = nullptr;
}

Strand::Strand(ThreadPool& pool) : pool_(pool) {}

bool Strand::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
        if (scheduled_) {
            return true;
        }
        scheduled_ = true;
    }

    if (!pool_.try_enqueue([self = shared_from_this()]() { self->drain(); })) {
        std::cerr << "[strand] Pool " << pool_.name() << " is stopped, dropping task" << std::endl;
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.clear();
        scheduled_ = false;
        return false;
    }
    return true;
}

bool Strand::running_in_this_thread() const {
    return t_current_strand == this;
}

void Strand::drain() {
    std::function<void()> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tasks_.empty()) {
            scheduled_ = false;
            return;
        }
        task = std::move(tasks_.front());
        tasks_.pop_front();
    }

    const Strand* previous = t_current_strand;
    t_current_strand = this;
    try {
        task();
    } catch (const std::exception& e) {
        std::cerr << "[strand] Task exception: " << e.what() << std::endl;
    }
    t_current_strand = previous;

    // One task per turn so other sessions on the pool get a fair share
    bool more = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        more = !tasks_.empty();
        if (!more) {
            scheduled_ = false;
        }
    }
    // Pool is shutting down: finish the backlog on this worker
    if (more && !pool_.try_enqueue([self = shared_from_this()]() { self->drain(); })) {
        drain();
    }
}

} // namespace jukebox
