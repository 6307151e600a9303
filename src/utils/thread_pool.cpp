#include "utils/thread_pool.hpp"
#include "config.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace jukebox {

ThreadPool::ThreadPool(size_t num_threads, std::string name) : name_(std::move(name)) {
    num_threads = std::max<size_t>(num_threads, 1);
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });

            // Drain before exiting so nothing accepted is lost
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[" << name_ << "] Task exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[" << name_ << "] Task threw an unknown exception" << std::endl;
        }
    }
}

void ThreadPool::enqueue(std::function<void()> task) {
    if (!try_enqueue(std::move(task))) {
        throw std::runtime_error("ThreadPool " + name_ + " is stopped");
    }
}

bool ThreadPool::try_enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool ThreadPool::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

// Global thread pool instance
static std::unique_ptr<ThreadPool> g_thread_pool;
static std::once_flag g_thread_pool_init;

ThreadPool& get_thread_pool() {
    std::call_once(g_thread_pool_init, []() {
        g_thread_pool = std::make_unique<ThreadPool>(get_config().get_thread_pool_size(), "commands");
    });
    return *g_thread_pool;
}

} // namespace jukebox
