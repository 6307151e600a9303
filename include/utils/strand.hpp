#pragma once

#include "utils/thread_pool.hpp"
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <type_traits>

namespace jukebox {

// Runs posted tasks one at a time, in post order, on a shared ThreadPool.
// Different strands on the same pool run in parallel.
class Strand : public std::enable_shared_from_this<Strand> {
public:
    explicit Strand(ThreadPool& pool);

    Strand(const Strand&) = delete;
    Strand& operator=(const Strand&) = delete;

    // Returns false once the pool has been shut down
    bool post(std::function<void()> task);

    // Runs fn inside the strand and waits for its result. Runs inline when
    // already called from this strand, so nested calls cannot deadlock.
    template<class F>
    auto dispatch(F&& fn) -> decltype(fn()) {
        using return_type = decltype(fn());

        if (running_in_this_thread()) {
            return fn();
        }

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(fn));
        std::future<return_type> result = task->get_future();
        if (!post([task]() { (*task)(); })) {
            throw std::runtime_error("Strand is no longer accepting work");
        }
        return result.get();
    }

    bool running_in_this_thread() const;

private:
    ThreadPool& pool_;
    mutable std::mutex mutex_;
    std::deque<std::function<void()>> tasks_;
    bool scheduled_ = false;

    void drain();
};

} // namespace jukebox
