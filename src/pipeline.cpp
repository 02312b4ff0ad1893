#include "cmdq/pipeline.hpp"

#include "cmdq/binder.hpp"
#include "cmdq/command_executor.hpp"
#include "cmdq/log.hpp"
#include "cmdq/utils.hpp"

namespace cmdq {

PipelineExecutor::PipelineExecutor(std::vector<std::string> stages,
                                   std::shared_ptr<const Registry> registry,
                                   std::shared_ptr<const MetadataTable> metadata,
                                   WorkerPool& pool,
                                   Context context,
                                   ResultCallback callback)
    : stages_(std::move(stages)),
      registry_(std::move(registry)),
      metadata_(std::move(metadata)),
      pool_(pool),
      context_(std::move(context)),
      callback_(std::move(callback)) {}

void PipelineExecutor::run() {
    bool delivered = false;
    try {
        runStages(delivered);
    } catch (const std::exception& e) {
        log::logger()->error("pipeline aborted: {}", e.what());
        if (!delivered) deliver(callback_, Outcome::Failure, Output::error(std::current_exception()));
    } catch (...) {
        log::logger()->error("pipeline aborted: unknown error");
        if (!delivered) deliver(callback_, Outcome::Failure, Output::error(std::current_exception()));
    }
}

void PipelineExecutor::runStages(bool& delivered) {
    Value forwarded;

    for (std::size_t i = 0; i < stages_.size(); ++i) {
        const std::string input(utils::trim(stages_[i]));
        const auto matches = metadata_->resolveByAlias(input);
        if (matches.empty()) {
            log::logger()->debug("pipeline stage {} '{}' matches no command", i + 1, input);
            delivered = true;
            deliver(callback_, Outcome::Unhandled, Output());
            return;
        }

        const auto& metadata = matches.front();
        const Alias* alias = metadata->match(utils::toLower(input));
        std::vector<Value> extra;
        if (!forwarded.isNone()) extra.push_back(forwarded);

        const bool last = (i + 1 == stages_.size());
        auto binder = std::make_shared<ArgumentBinder>(registry_,
                                                       alias->removeMatched(input),
                                                       std::move(extra),
                                                       metadata,
                                                       context_,
                                                       last ? callback_ : ResultCallback());
        CommandExecutor executor(std::move(binder));
        log::logger()->debug("pipeline stage {}/{}: '{}'", i + 1, stages_.size(), input);

        auto handle = executor.start(pool_);
        if (last) {
            // The final stage's binder now owns the delivery.
            delivered = true;
            return;
        }

        pool_.wait(handle);
        if (executor.outcome() == Outcome::Failure) {
            log::logger()->debug("pipeline stage {} failed, skipping {} remaining stage(s)", i + 1, stages_.size() - i - 1);
            delivered = true;
            deliver(callback_, Outcome::Failure, executor.output());
            return;
        }
        forwarded = executor.output().hasValue() ? executor.output().value() : Value();
    }
}

} // namespace cmdq
