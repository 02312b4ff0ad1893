#ifndef CMDQ_WORKER_POOL_HPP
#define CMDQ_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace cmdq {

// Fixed set of threads running executor and pipeline tasks.
//
// A task's completion handle is the future returned by submit(). A pool
// thread that waits on a handle through wait() keeps running queued tasks in
// the meantime, so tasks that wait on other tasks cannot starve the pool.
class WorkerPool {
public:
    // 0 threads: std::thread::hardware_concurrency(), at least 2.
    explicit WorkerPool(std::size_t threads = 0);

    // Runs every task still queued, then joins the threads.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Throws InvalidStateError once shutdown has begun, unless called from one
    // of the pool's own threads.
    std::future<void> submit(std::function<void()> task);

    void wait(std::future<void>& handle);

    [[nodiscard]] std::size_t size() const { return threads_.size(); }
    [[nodiscard]] std::size_t queued() const;

private:
    void workerLoop();
    bool runOne();
    bool onPoolThread() const;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::packaged_task<void()>> tasks_;
    bool stopping_{false};
    std::vector<std::thread> threads_;
};

} // namespace cmdq

#endif // CMDQ_WORKER_POOL_HPP
