#include "cmdq/output.hpp"

#include "cmdq/log.hpp"

namespace cmdq {

std::string Output::errorMessage() const {
    if (!hasError()) return {};
    try {
        std::rethrow_exception(std::get<std::exception_ptr>(data_));
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

FailReason Output::failReason() const {
    try {
        rethrow();
    } catch (const CommandError& e) {
        return e.reason();
    } catch (...) {
        return FailReason::HandlerFailure;
    }
    return FailReason::HandlerFailure;
}

void deliver(const ResultCallback& callback, Outcome outcome, const Output& output) {
    if (!callback) return;
    try {
        callback(outcome, output);
    } catch (const std::exception& e) {
        log::logger()->error("result callback threw while delivering {}: {}", outcomeName(outcome), e.what());
    } catch (...) {
        log::logger()->error("result callback threw while delivering {}: unknown error", outcomeName(outcome));
    }
}

} // namespace cmdq
