#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace jukebox {

// Fixed set of named workers draining one FIFO. The player runs its strands
// and preloads here; the bot layer runs slash command work on a second pool.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads, std::string name = "pool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Throws std::runtime_error once the pool is shut down
    void enqueue(std::function<void()> task);

    // Same as enqueue, but reports a stopped pool instead of throwing
    bool try_enqueue(std::function<void()> task);

    // Runs what is already queued, then joins the workers. Idempotent.
    void shutdown();

    size_t size() const { return workers_.size(); }
    bool running() const;
    const std::string& name() const { return name_; }

private:
    const std::string name_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    bool stopping_ = false;

    void worker_loop();
};

// Pool for slash command work in the bot layer, sized by THREAD_POOL_SIZE
ThreadPool& get_thread_pool();

} // namespace jukebox
