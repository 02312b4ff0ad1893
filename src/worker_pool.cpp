#include "cmdq/worker_pool.hpp"

#include <algorithm>
#include <chrono>

#include "cmdq/errors.hpp"
#include "cmdq/log.hpp"

namespace cmdq {

namespace {

thread_local const WorkerPool* currentPool = nullptr;

} // namespace

WorkerPool::WorkerPool(std::size_t threads) {
    if (threads == 0) threads = std::max<std::size_t>(2, std::thread::hardware_concurrency());
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back(&WorkerPool::workerLoop, this);
    }
    log::logger()->debug("worker pool started with {} threads", threads);
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

std::future<void> WorkerPool::submit(std::function<void()> task) {
    std::packaged_task<void()> packaged(std::move(task));
    auto handle = packaged.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Tasks already running may still schedule follow-up work while the
        // pool drains.
        if (stopping_ && !onPoolThread()) throw InvalidStateError("worker pool is shutting down");
        tasks_.push_back(std::move(packaged));
    }
    cv_.notify_one();
    return handle;
}

void WorkerPool::wait(std::future<void>& handle) {
    if (!onPoolThread()) {
        handle.wait();
        return;
    }
    while (handle.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
        if (!runOne()) handle.wait_for(std::chrono::milliseconds(1));
    }
}

std::size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::workerLoop() {
    currentPool = this;
    while (true) {
        std::packaged_task<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            // Drain before exiting: every submitted task gets to run.
            if (tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
    }
}

bool WorkerPool::runOne() {
    std::packaged_task<void()> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tasks_.empty()) return false;
        task = std::move(tasks_.front());
        tasks_.pop_front();
    }
    task();
    return true;
}

bool WorkerPool::onPoolThread() const { return currentPool == this; }

} // namespace cmdq
