#include "thread_pool.h"

namespace concurrency {

std::size_t ThreadPool::resolve_thread_count(std::size_t requested) {
    if (requested > 0) return requested;
    unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : (std::size_t)hw;
}

ThreadPool::ThreadPool(std::size_t thread_count) {
    thread_count = resolve_thread_count(thread_count);

    workers_.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    bool expected = true;
    if (!accepting_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }

    queue_.close();

    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

void ThreadPool::worker_loop() {
    // Jobs are packaged_tasks: a throwing task stores its exception in the future.
    while (auto job = queue_.pop()) {
        (*job)();
    }
}

} // namespace concurrency
