#ifndef CMDQ_COMMAND_EXECUTOR_HPP
#define CMDQ_COMMAND_EXECUTOR_HPP

#include <future>
#include <memory>

#include "binder.hpp"
#include "output.hpp"
#include "worker_pool.hpp"

namespace cmdq {

// One binder run as a schedulable unit. The binder is shared with the pool
// task, so a dispatched executor may be dropped right after start().
class CommandExecutor {
public:
    explicit CommandExecutor(std::shared_ptr<ArgumentBinder> binder) : binder_(std::move(binder)) {}

    // Schedules the run; the returned handle becomes ready once the binder has
    // finished and delivered its result.
    std::future<void> start(WorkerPool& pool) {
        auto binder = binder_;
        return pool.submit([binder] { binder->run(); });
    }

    // Only meaningful once the handle returned by start() is ready.
    [[nodiscard]] const Output& output() const { return binder_->output(); }
    [[nodiscard]] Outcome outcome() const { return binder_->outcome(); }

private:
    std::shared_ptr<ArgumentBinder> binder_;
};

} // namespace cmdq

#endif // CMDQ_COMMAND_EXECUTOR_HPP
