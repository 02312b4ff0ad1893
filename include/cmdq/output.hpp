#ifndef CMDQ_OUTPUT_HPP
#define CMDQ_OUTPUT_HPP

#include <exception>
#include <functional>
#include <string>
#include <utility>
#include <variant>

#include "errors.hpp"
#include "value.hpp"

namespace cmdq {

enum class Outcome {
    Success,
    Failure,
    Unhandled,
};

inline const char* outcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::Success: return "Success";
        case Outcome::Failure: return "Failure";
        case Outcome::Unhandled: return "Unhandled";
    }
    return "Unknown";
}

// Payload of a finished command: nothing, the handler's return value, or the
// error that aborted it.
class Output {
public:
    Output() = default;

    static Output value(Value v) {
        Output out;
        out.data_ = std::move(v);
        return out;
    }

    static Output error(std::exception_ptr e) {
        Output out;
        out.data_ = std::move(e);
        return out;
    }

    [[nodiscard]] bool empty() const { return std::holds_alternative<std::monostate>(data_); }
    [[nodiscard]] bool hasValue() const { return std::holds_alternative<Value>(data_); }
    [[nodiscard]] bool hasError() const { return std::holds_alternative<std::exception_ptr>(data_); }

    // Requires hasValue().
    [[nodiscard]] const Value& value() const { return std::get<Value>(data_); }
    // Null unless hasError().
    [[nodiscard]] std::exception_ptr error() const {
        if (!hasError()) return nullptr;
        return std::get<std::exception_ptr>(data_);
    }

    [[nodiscard]] std::string errorMessage() const;
    // HandlerFailure for anything that is not a CommandError. Requires hasError().
    [[nodiscard]] FailReason failReason() const;

    void rethrow() const {
        if (hasError()) std::rethrow_exception(std::get<std::exception_ptr>(data_));
    }

private:
    std::variant<std::monostate, Value, std::exception_ptr> data_;
};

using ResultCallback = std::function<void(Outcome, const Output&)>;

// Invokes the callback (if any). An exception escaping the callback is logged;
// it never turns into a second delivery.
void deliver(const ResultCallback& callback, Outcome outcome, const Output& output);

} // namespace cmdq

#endif // CMDQ_OUTPUT_HPP
