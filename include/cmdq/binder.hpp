#ifndef CMDQ_BINDER_HPP
#define CMDQ_BINDER_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "context.hpp"
#include "metadata.hpp"
#include "output.hpp"
#include "registry.hpp"
#include "value.hpp"

namespace cmdq {

// Binds the text after a command's alias to the handler's parameters, invokes
// the handler and records what happened. One binder serves exactly one
// invocation and is only ever touched by the thread that runs it.
class ArgumentBinder {
public:
    // `input` is the text left after the alias was stripped; std::nullopt is
    // rejected as InvalidArguments. `extraArgs` are appended after the
    // tokenized input (a previous pipeline stage's output). `callback` may be
    // empty for intermediate pipeline stages.
    ArgumentBinder(std::shared_ptr<const Registry> registry,
                   std::optional<std::string> input,
                   std::vector<Value> extraArgs,
                   std::shared_ptr<const CommandMetadata> metadata,
                   Context context,
                   ResultCallback callback);

    // Runs every binding step and delivers exactly one result to the callback.
    // Never throws; failures end up in output().
    void run();

    [[nodiscard]] const Output& output() const { return output_; }
    [[nodiscard]] Outcome outcome() const { return outcome_; }
    [[nodiscard]] const std::vector<Value>& boundArguments() const { return bound_; }

private:
    void checkBasicArgumentRules() const;
    void attemptSwitchToSubcommand();
    void convertArgumentsToTypes();
    Value invoke();

    Value bindSlot(const ParameterSpec& spec, const std::vector<Value>& slot, std::size_t width) const;

    std::shared_ptr<const Registry> registry_;
    std::optional<std::string> input_;
    std::vector<Value> extraArgs_;
    std::shared_ptr<const CommandMetadata> metadata_;
    const ExecutorData* executor_;
    Context context_;
    ResultCallback callback_;

    std::vector<Value> bound_;
    Output output_;
    Outcome outcome_{Outcome::Failure};
};

} // namespace cmdq

#endif // CMDQ_BINDER_HPP
