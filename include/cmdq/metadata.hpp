#ifndef CMDQ_METADATA_HPP
#define CMDQ_METADATA_HPP

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "alias.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "value.hpp"

namespace cmdq {

struct ParameterSpec {
    Type type;
    // <= 0: the parameter takes every remaining token.
    int repetitions{1};
    std::string name;
};

namespace detail {

template <typename... Ts>
struct TypeList {};

template <typename T>
struct FutureTraits {
    static constexpr bool isFuture = false;
};

template <typename T>
struct FutureTraits<std::future<T>> {
    static constexpr bool isFuture = true;
    using type = T;
};

// A missing trailing argument arrives as a None value; default-construct it.
template <typename T>
T argumentAs(const Value& v) {
    if (v.isNone()) {
        if constexpr (std::is_default_constructible_v<T>) {
            return T{};
        } else {
            throw CommandError(FailReason::InvalidArguments, "no value for parameter of type " + Type::of<T>().name());
        }
    } else {
        return v.as<T>();
    }
}

template <typename Owner, typename Method, typename... Args, std::size_t... I>
decltype(auto) callMethod(Owner& owner,
                          Method method,
                          const Context& ctx,
                          const std::vector<Value>& args,
                          TypeList<Args...>,
                          std::index_sequence<I...>) {
    return (owner.*method)(ctx, argumentAs<std::decay_t<Args>>(args[I])...);
}

template <typename R, typename F>
Value valueOf(F&& call) {
    if constexpr (std::is_void_v<R>) {
        call();
        return Value();
    } else {
        return Value::of(call());
    }
}

} // namespace detail

// How a command (or one of its subcommands) is invoked: its parameters and a
// statically typed closure that builds a fresh owner object per call.
class ExecutorData {
public:
    using Invoker = std::function<Value(const Context&, const std::vector<Value>&)>;
    using AsyncInvoker = std::function<std::future<Value>(const Context&, const std::vector<Value>&)>;

    ExecutorData(std::vector<ParameterSpec> parameters, Invoker invoker)
        : parameters_(std::move(parameters)), invoker_(std::move(invoker)) {}

    ExecutorData(std::vector<ParameterSpec> parameters, AsyncInvoker invoker)
        : parameters_(std::move(parameters)), asyncInvoker_(std::move(invoker)) {}

    // Binds `Owner::method(const Context&, Args...)`. Every parameter takes one
    // token unless `repetitions` says otherwise (positionally, <= 0 = rest).
    // A method returning std::future<T> is registered as asynchronous.
    template <typename Owner, typename R, typename... Args>
    static ExecutorData bind(R (Owner::*method)(const Context&, Args...), std::vector<int> repetitions = {}) {
        return bindMethod<Owner, R, Args...>(method, std::move(repetitions));
    }

    template <typename Owner, typename R, typename... Args>
    static ExecutorData bind(R (Owner::*method)(const Context&, Args...) const, std::vector<int> repetitions = {}) {
        return bindMethod<Owner, R, Args...>(method, std::move(repetitions));
    }

    ExecutorData& subcommand(Alias name, ExecutorData sub) {
        sub.name_ = std::move(name);
        subcommands_.push_back(std::move(sub));
        return *this;
    }

    ExecutorData& parameterName(std::size_t index, std::string name) {
        if (index < parameters_.size()) parameters_[index].name = std::move(name);
        return *this;
    }

    [[nodiscard]] const std::vector<ParameterSpec>& parameters() const { return parameters_; }
    [[nodiscard]] bool isAsync() const { return static_cast<bool>(asyncInvoker_); }
    [[nodiscard]] bool hasSubcommands() const { return !subcommands_.empty(); }
    [[nodiscard]] const std::vector<ExecutorData>& subcommands() const { return subcommands_; }
    // Set only on subcommands.
    [[nodiscard]] const std::optional<Alias>& name() const { return name_; }

    Value invoke(const Context& ctx, const std::vector<Value>& args) const { return invoker_(ctx, args); }
    std::future<Value> invokeAsync(const Context& ctx, const std::vector<Value>& args) const {
        return asyncInvoker_(ctx, args);
    }

private:
    template <typename Owner, typename R, typename... Args, typename Method>
    static ExecutorData bindMethod(Method method, std::vector<int> repetitions) {
        static_assert(std::is_default_constructible_v<Owner>, "command types are constructed for every invocation");

        std::vector<ParameterSpec> parameters{ParameterSpec{Type::of<std::decay_t<Args>>(), 1, {}}...};
        for (std::size_t i = 0; i < repetitions.size() && i < parameters.size(); ++i) {
            parameters[i].repetitions = repetitions[i];
        }

        constexpr std::size_t arity = sizeof...(Args);
        auto checkArity = [](const std::vector<Value>& args) {
            if (args.size() != arity) {
                throw CommandError(FailReason::InvalidArguments,
                                   "expected " + std::to_string(arity) + " arguments, got " + std::to_string(args.size()));
            }
        };

        if constexpr (detail::FutureTraits<R>::isFuture) {
            using Inner = typename detail::FutureTraits<R>::type;
            AsyncInvoker invoker = [method, checkArity](const Context& ctx, const std::vector<Value>& args) {
                checkArity(args);
                auto owner = std::make_shared<Owner>();
                auto pending = std::make_shared<R>(detail::callMethod(
                    *owner, method, ctx, args, detail::TypeList<Args...>{}, std::index_sequence_for<Args...>{}));
                // Deferred: resolved by whoever calls get(), i.e. the executor's own thread.
                return std::async(std::launch::deferred, [owner, pending]() {
                    return detail::valueOf<Inner>([&]() { return pending->get(); });
                });
            };
            return ExecutorData(std::move(parameters), std::move(invoker));
        } else {
            Invoker invoker = [method, checkArity](const Context& ctx, const std::vector<Value>& args) {
                checkArity(args);
                Owner owner{};
                return detail::valueOf<R>([&]() -> decltype(auto) {
                    return detail::callMethod(
                        owner, method, ctx, args, detail::TypeList<Args...>{}, std::index_sequence_for<Args...>{});
                });
            };
            return ExecutorData(std::move(parameters), std::move(invoker));
        }
    }

    std::vector<ParameterSpec> parameters_;
    Invoker invoker_;
    AsyncInvoker asyncInvoker_;
    std::optional<Alias> name_;
    std::vector<ExecutorData> subcommands_;
};

class CommandMetadata {
public:
    CommandMetadata(std::vector<Alias> aliases, ExecutorData executor)
        : aliases_(std::move(aliases)), executor_(std::move(executor)) {}

    CommandMetadata(Alias alias, ExecutorData executor)
        : CommandMetadata(std::vector<Alias>{std::move(alias)}, std::move(executor)) {}

    [[nodiscard]] const std::vector<Alias>& aliases() const { return aliases_; }
    [[nodiscard]] const ExecutorData& executor() const { return executor_; }

    // First alias (in declaration order) matching the input, or nullptr.
    [[nodiscard]] const Alias* match(std::string_view input) const {
        for (const auto& a : aliases_) {
            if (a.matches(input)) return &a;
        }
        return nullptr;
    }

private:
    std::vector<Alias> aliases_;
    ExecutorData executor_;
};

// Append-only store of registered commands, safe to read while another thread
// registers. Readers always work on a copy taken under the lock.
class MetadataTable {
public:
    using Entry = std::shared_ptr<const CommandMetadata>;

    void add(Entry metadata);

    [[nodiscard]] std::vector<Entry> snapshot() const;

    // Entries with an alias matching the lowercased input, in registration order.
    [[nodiscard]] std::vector<Entry> resolveByAlias(std::string_view input) const;

    // Alias patterns of every entry; used for "did you mean" hints.
    [[nodiscard]] std::vector<std::string> aliasPatterns() const;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

} // namespace cmdq

#endif // CMDQ_METADATA_HPP
