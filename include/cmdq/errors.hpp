#ifndef CMDQ_ERRORS_HPP
#define CMDQ_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cmdq {

enum class FailReason {
    InvalidArguments,
    ParsingFailed,
    HandlerFailure,
};

inline const char* failReasonName(FailReason reason) {
    switch (reason) {
        case FailReason::InvalidArguments: return "InvalidArguments";
        case FailReason::ParsingFailed: return "ParsingFailed";
        case FailReason::HandlerFailure: return "HandlerFailure";
    }
    return "Unknown";
}

// Raised by the binder. Exceptions thrown by handlers are passed through
// unchanged and are reported as HandlerFailure.
class CommandError : public std::runtime_error {
public:
    CommandError(FailReason reason, const std::string& message)
        : std::runtime_error(message), reason_(reason) {}

    [[nodiscard]] FailReason reason() const { return reason_; }

private:
    FailReason reason_;
};

class ParsingError : public CommandError {
public:
    ParsingError(const std::string& message,
                 std::vector<std::string> tokens,
                 std::string typeName,
                 std::string cause)
        : CommandError(FailReason::ParsingFailed, message),
          tokens_(std::move(tokens)),
          typeName_(std::move(typeName)),
          cause_(std::move(cause)) {}

    [[nodiscard]] const std::vector<std::string>& tokens() const { return tokens_; }
    [[nodiscard]] const std::string& typeName() const { return typeName_; }
    [[nodiscard]] const std::string& cause() const { return cause_; }

private:
    std::vector<std::string> tokens_;
    std::string typeName_;
    std::string cause_;
};

// Misuse of a queue or pool: starting twice, submitting after stop, ...
class InvalidStateError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace cmdq

#endif // CMDQ_ERRORS_HPP
