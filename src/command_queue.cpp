#include "cmdq/command_queue.hpp"

#include <exception>
#include <stdexcept>

#include "cmdq/binder.hpp"
#include "cmdq/command_executor.hpp"
#include "cmdq/errors.hpp"
#include "cmdq/log.hpp"
#include "cmdq/pipeline.hpp"
#include "cmdq/tokenizer.hpp"
#include "cmdq/utils.hpp"

namespace cmdq {

void CommandQueue::Signal::set() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        set_ = true;
    }
    cv_.notify_all();
}

void CommandQueue::Signal::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    set_ = false;
}

bool CommandQueue::Signal::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return set_; });
}

CommandQueue::CommandQueue(std::shared_ptr<Registry> registry, QueueConfig config)
    : registry_(std::move(registry)),
      metadata_(std::make_shared<MetadataTable>()),
      config_(std::move(config)) {
    if (!registry_) throw std::invalid_argument("CommandQueue requires a registry");
    if (!log::setLevel(config_.logLevel)) {
        log::logger()->warn("unknown log level '{}', keeping '{}'",
                            config_.logLevel,
                            spdlog::level::to_string_view(log::logger()->level()));
    }
}

CommandQueue::~CommandQueue() {
    stop();
    if (worker_.joinable()) worker_.join();
    // Commands already dispatched finish and report before the pool goes away.
    pool_.reset();
}

void CommandQueue::registerMetadata(CommandMetadata metadata) {
    if (stopped_) throw InvalidStateError("CommandQueue has been stopped");
    metadata_->add(std::make_shared<const CommandMetadata>(std::move(metadata)));
}

void CommandQueue::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (stopped_) throw InvalidStateError("a stopped CommandQueue cannot be restarted");
    if (started_) throw InvalidStateError("the CommandQueue has already been started");

    pool_ = std::make_unique<WorkerPool>(config_.workerThreads);
    worker_ = std::thread(&CommandQueue::workerLoop, this);
    started_ = true;
    log::logger()->debug("command queue started ({} metadata entries)", metadata_->size());
}

void CommandQueue::submit(std::string input, Context context, ResultCallback callback) {
    if (stopped_) throw InvalidStateError("CommandQueue has been stopped");
    if (!callback) throw std::invalid_argument("submit requires a callback");
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        queue_.push_back(Submission{std::move(input), std::move(context), std::move(callback)});
        signal_.set();
    }
}

void CommandQueue::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (stopped_) return;
    stopped_ = true;
    cancelled_ = true;
    signal_.set();
    log::logger()->debug("command queue stopping, {} queued input(s) abandoned", pending());
}

std::size_t CommandQueue::pending() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return queue_.size();
}

std::optional<CommandQueue::Submission> CommandQueue::popOrReset() {
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (queue_.empty()) {
        // Under the queue lock, so a concurrent submit() cannot be missed.
        signal_.reset();
        return std::nullopt;
    }
    Submission item = std::move(queue_.front());
    queue_.pop_front();
    return item;
}

void CommandQueue::workerLoop() {
    while (!cancelled_) {
        if (!signal_.waitFor(config_.pollInterval)) continue;
        if (cancelled_) break;

        auto item = popOrReset();
        if (!item) continue;

        try {
            dispatch(*item);
        } catch (const std::exception& e) {
            log::logger()->error("failed to dispatch '{}': {}", item->input, e.what());
            reportDispatchFailure(*item);
        } catch (...) {
            log::logger()->error("failed to dispatch '{}': unknown error", item->input);
            reportDispatchFailure(*item);
        }
        signal_.set();
    }
    log::logger()->debug("command queue worker exiting");
}

void CommandQueue::reportDispatchFailure(Submission& item) {
    if (!item.callback) {
        log::logger()->error("no callback left to report the failure of '{}'", item.input);
        return;
    }
    deliver(item.callback, Outcome::Failure, Output::error(std::current_exception()));
}

void CommandQueue::dispatch(Submission& item) {
    auto stages = splitStages(item.input, config_.pipeDelimiter);
    if (stages.size() > 1) {
        log::logger()->debug("dispatching {}-stage pipeline '{}'", stages.size(), item.input);
        // Copies: the submission keeps its callback until the pipeline is scheduled.
        auto pipeline = std::make_shared<PipelineExecutor>(
            std::move(stages), registry_, metadata_, *pool_, item.context, item.callback);
        pool_->submit([pipeline] { pipeline->run(); });
        return;
    }
    dispatchSingle(item, stages.front());
}

void CommandQueue::dispatchSingle(Submission& item, const std::string& input) {
    const auto matches = metadata_->resolveByAlias(input);
    if (matches.empty()) {
        reportUnhandled(item, input);
        return;
    }

    // More than one match: the first registered wins.
    const auto& metadata = matches.front();
    const Alias* alias = metadata->match(utils::toLower(input));
    log::logger()->debug("dispatching '{}' via alias '{}'", input, alias->pattern());

    auto binder = std::make_shared<ArgumentBinder>(
        registry_, alias->removeMatched(input), std::vector<Value>{}, metadata, item.context, item.callback);
    CommandExecutor executor(std::move(binder));
    executor.start(*pool_);
}

void CommandQueue::reportUnhandled(Submission& item, const std::string& input) {
    const auto hints = utils::suggest(utils::toLower(input), metadata_->aliasPatterns());
    if (hints.empty()) {
        log::logger()->debug("no command matches '{}'", input);
    } else {
        std::string joined;
        for (const auto& h : hints) joined += (joined.empty() ? "" : ", ") + h;
        log::logger()->debug("no command matches '{}'; did you mean: {}", input, joined);
    }
    deliver(item.callback, Outcome::Unhandled, Output());
}

} // namespace cmdq
