#include "cmdq/binder.hpp"

#include <algorithm>
#include <exception>

#include "cmdq/errors.hpp"
#include "cmdq/log.hpp"
#include "cmdq/tokenizer.hpp"

namespace cmdq {

namespace {

std::vector<std::string> tokenStrings(const std::vector<Value>& tokens) {
    std::vector<std::string> out;
    out.reserve(tokens.size());
    for (const auto& t : tokens) out.push_back(t.toString());
    return out;
}

std::string joinTokens(const std::vector<std::string>& tokens) {
    std::string out;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i) out.push_back(' ');
        out += tokens[i];
    }
    return out;
}

} // namespace

ArgumentBinder::ArgumentBinder(std::shared_ptr<const Registry> registry,
                               std::optional<std::string> input,
                               std::vector<Value> extraArgs,
                               std::shared_ptr<const CommandMetadata> metadata,
                               Context context,
                               ResultCallback callback)
    : registry_(std::move(registry)),
      input_(std::move(input)),
      extraArgs_(std::move(extraArgs)),
      metadata_(std::move(metadata)),
      executor_(&metadata_->executor()),
      context_(std::move(context)),
      callback_(std::move(callback)) {}

void ArgumentBinder::run() {
    try {
        checkBasicArgumentRules();
        attemptSwitchToSubcommand();
        convertArgumentsToTypes();
        output_ = Output::value(invoke());
        outcome_ = Outcome::Success;
    } catch (const std::exception& e) {
        log::logger()->debug("command failed: {}", e.what());
        output_ = Output::error(std::current_exception());
        outcome_ = Outcome::Failure;
    } catch (...) {
        // Handlers may throw anything; it is still this command's failure.
        output_ = Output::error(std::current_exception());
        outcome_ = Outcome::Failure;
    }
    deliver(callback_, outcome_, output_);
}

void ArgumentBinder::checkBasicArgumentRules() const {
    if (!input_.has_value()) {
        throw CommandError(FailReason::InvalidArguments, "null was provided as arguments");
    }
}

void ArgumentBinder::attemptSwitchToSubcommand() {
    if (!executor_->hasSubcommands() || input_->empty()) return;

    for (const auto& sub : executor_->subcommands()) {
        if (sub.name() && sub.name()->matches(*input_)) {
            log::logger()->trace("switching to subcommand '{}'", sub.name()->pattern());
            input_ = sub.name()->removeMatched(*input_);
            executor_ = &sub;
            return;
        }
    }
}

void ArgumentBinder::convertArgumentsToTypes() {
    std::vector<Value> tokens = explodeValues(*input_);
    tokens.insert(tokens.end(), extraArgs_.begin(), extraArgs_.end());

    bound_.clear();
    std::size_t cursor = 0;
    for (const auto& spec : executor_->parameters()) {
        const std::size_t width = spec.repetitions <= 0 ? tokens.size() - std::min(cursor, tokens.size())
                                                         : static_cast<std::size_t>(spec.repetitions);

        if (cursor >= tokens.size()) {
            // Missing trailing arguments never fail the call.
            bound_.push_back(registry_->constructDefault(spec.type));
            continue;
        }

        const auto first = tokens.begin() + static_cast<std::ptrdiff_t>(cursor);
        const auto last = tokens.begin() + static_cast<std::ptrdiff_t>(std::min(tokens.size(), cursor + width));
        const std::vector<Value> slot(first, last);

        bound_.push_back(bindSlot(spec, slot, width));
        cursor += width;
    }
}

Value ArgumentBinder::bindSlot(const ParameterSpec& spec, const std::vector<Value>& slot, std::size_t width) const {
    if (width == 1 && slot.front().type() == spec.type) return slot.front();

    const auto strings = tokenStrings(slot);
    if (const auto converter = registry_->converter(spec.type)) {
        auto converted = width > 1 ? converter->convertFromArray(strings, context_)
                                   : converter->convertFromScalar(strings.front(), context_);
        if (!converted || converted->type() != spec.type) {
            throw ParsingError("type conversion failed: failed to convert '" + joinTokens(strings) + "' to type '" +
                                   spec.type.name() + "'",
                               strings,
                               spec.type.name(),
                               "conversion failed in " + converter->name());
        }
        return std::move(*converted);
    }

    auto constructed = registry_->constructFromTokens(spec.type, slot, context_);
    if (!constructed || constructed->type() != spec.type) {
        throw ParsingError("type conversion failed: no converter or factory could build type '" + spec.type.name() +
                               "' from '" + joinTokens(strings) + "'",
                           strings,
                           spec.type.name(),
                           "no converter registered");
    }
    return std::move(*constructed);
}

Value ArgumentBinder::invoke() {
    if (executor_->isAsync()) {
        auto pending = executor_->invokeAsync(context_, bound_);
        return pending.get();
    }
    return executor_->invoke(context_, bound_);
}

} // namespace cmdq
