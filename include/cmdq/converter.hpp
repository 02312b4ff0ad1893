#ifndef CMDQ_CONVERTER_HPP
#define CMDQ_CONVERTER_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "context.hpp"
#include "value.hpp"

namespace cmdq {

// Turns raw tokens into a typed Value.
//
// Notes:
// - The binder calls convertFromScalar() for parameters that take exactly one
//   token and convertFromArray() for wider parameters.
// - Failure is reported with std::nullopt, never by throwing. The binder turns
//   it into a ParsingError that names the tokens and the target type.
// - The returned value must be of type(); anything else is a parsing failure.
class Converter {
public:
    virtual ~Converter() = default;

    [[nodiscard]] virtual Type type() const = 0;
    // Used in error messages.
    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual std::optional<Value> convertFromScalar(std::string_view token, const Context& ctx) const = 0;
    [[nodiscard]] virtual std::optional<Value> convertFromArray(const std::vector<std::string>& tokens,
                                                                const Context& ctx) const = 0;
};

// Converters for bool, int, int64, uint64, float, double, duration, string,
// int[] and string[].
std::vector<std::shared_ptr<const Converter>> builtinConverters();

} // namespace cmdq

#endif // CMDQ_CONVERTER_HPP
