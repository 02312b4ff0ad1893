#ifndef CMDQ_CONTEXT_HPP
#define CMDQ_CONTEXT_HPP

#include <any>
#include <utility>

namespace cmdq {

// Opaque capability bag handed to every handler as its first argument.
// The dispatch engine never looks inside; it only copies it along.
class Context {
public:
    Context() = default;

    template <typename T>
    explicit Context(T value) : value_(std::move(value)) {}

    [[nodiscard]] bool has() const { return value_.has_value(); }

    template <typename T>
    [[nodiscard]] const T* as() const {
        return std::any_cast<T>(&value_);
    }

    template <typename T>
    [[nodiscard]] T* as() {
        return std::any_cast<T>(&value_);
    }

private:
    std::any value_;
};

} // namespace cmdq

#endif // CMDQ_CONTEXT_HPP
