#ifndef CMDQ_COMMAND_QUEUE_HPP
#define CMDQ_COMMAND_QUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "config.hpp"
#include "context.hpp"
#include "metadata.hpp"
#include "output.hpp"
#include "registry.hpp"
#include "worker_pool.hpp"

namespace cmdq {

// Process-wide entry point. Input lines are queued by submit() and taken off
// the queue, in order, by one background worker that routes each line to a
// single-command executor or to a pipeline. Handlers run on a worker pool, so
// commands submitted one after another may complete in any order.
//
// Lifecycle: construct, register metadata, start(), submit()..., stop().
// Stopping is final. Destruction stops the queue, abandons lines still
// waiting in the queue (their callbacks never fire) and lets every command
// already dispatched finish and report.
class CommandQueue {
public:
    explicit CommandQueue(std::shared_ptr<Registry> registry, QueueConfig config = {});
    ~CommandQueue();

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    // Safe to call while the queue is processing. Throws InvalidStateError
    // after stop().
    void registerMetadata(CommandMetadata metadata);

    // Throws InvalidStateError when already started or stopped.
    void start();

    // Never blocks on command execution. Throws InvalidStateError after
    // stop() and std::invalid_argument for an empty callback.
    void submit(std::string input, Context context, ResultCallback callback);

    // Idempotent. Does not wait for commands already dispatched.
    void stop();

    [[nodiscard]] bool started() const { return started_.load(); }
    [[nodiscard]] bool stopped() const { return stopped_.load(); }
    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] std::size_t metadataCount() const { return metadata_->size(); }
    [[nodiscard]] const QueueConfig& config() const { return config_; }

private:
    struct Submission {
        std::string input;
        Context context;
        ResultCallback callback;
    };

    // Manual-reset event: stays set until reset() is called.
    class Signal {
    public:
        void set();
        void reset();
        // True when set within the timeout.
        bool waitFor(std::chrono::milliseconds timeout);

    private:
        std::mutex mutex_;
        std::condition_variable cv_;
        bool set_{false};
    };

    void workerLoop();
    std::optional<Submission> popOrReset();
    void dispatch(Submission& item);
    void dispatchSingle(Submission& item, const std::string& input);
    void reportUnhandled(Submission& item, const std::string& input);
    // Called from a catch block; reports the exception being handled.
    void reportDispatchFailure(Submission& item);

    std::shared_ptr<const Registry> registry_;
    std::shared_ptr<MetadataTable> metadata_;
    QueueConfig config_;
    std::unique_ptr<WorkerPool> pool_;

    mutable std::mutex queueMutex_;
    std::deque<Submission> queue_;
    Signal signal_;

    std::mutex lifecycleMutex_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> cancelled_{false};
    std::thread worker_;
};

} // namespace cmdq

#endif // CMDQ_COMMAND_QUEUE_HPP
