#include "cmdq/converter.hpp"

#include "cmdq/parse.hpp"
#include "cmdq/tokenizer.hpp"

namespace cmdq {

namespace {

// Single-token types. The array form only accepts a one-element array.
template <typename T>
class ScalarConverter final : public Converter {
public:
    using ParseFn = std::optional<T> (*)(std::string_view);

    explicit ScalarConverter(ParseFn parse) : parse_(parse) {}

    Type type() const override { return Type::of<T>(); }
    std::string name() const override { return type().name() + " converter"; }

    std::optional<Value> convertFromScalar(std::string_view token, const Context&) const override {
        auto parsed = parse_(token);
        if (!parsed) return std::nullopt;
        return Value::of(*parsed);
    }

    std::optional<Value> convertFromArray(const std::vector<std::string>& tokens, const Context& ctx) const override {
        if (tokens.size() != 1) return std::nullopt;
        return convertFromScalar(tokens.front(), ctx);
    }

private:
    ParseFn parse_;
};

// Several tokens collapse back into one space-separated string.
class StringConverter final : public Converter {
public:
    Type type() const override { return Type::of<std::string>(); }
    std::string name() const override { return "string converter"; }

    std::optional<Value> convertFromScalar(std::string_view token, const Context&) const override {
        return Value(std::string(token));
    }

    std::optional<Value> convertFromArray(const std::vector<std::string>& tokens, const Context&) const override {
        std::string joined;
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            if (i) joined.push_back(' ');
            joined += tokens[i];
        }
        return Value(std::move(joined));
    }
};

// Scalar form splits the token itself ("1 2 3" -> {1, 2, 3}); array form
// parses each token. Any element that is not an int fails the whole list.
class IntListConverter final : public Converter {
public:
    Type type() const override { return Type::of<std::vector<int>>(); }
    std::string name() const override { return "int[] converter"; }

    std::optional<Value> convertFromScalar(std::string_view token, const Context& ctx) const override {
        return convertFromArray(explode(token), ctx);
    }

    std::optional<Value> convertFromArray(const std::vector<std::string>& tokens, const Context&) const override {
        std::vector<int> out;
        out.reserve(tokens.size());
        for (const auto& t : tokens) {
            auto v = parse::toInt(t);
            if (!v) return std::nullopt;
            out.push_back(*v);
        }
        return Value::of(std::move(out));
    }
};

class StringListConverter final : public Converter {
public:
    Type type() const override { return Type::of<std::vector<std::string>>(); }
    std::string name() const override { return "string[] converter"; }

    std::optional<Value> convertFromScalar(std::string_view token, const Context&) const override {
        return Value::of(explode(token));
    }

    std::optional<Value> convertFromArray(const std::vector<std::string>& tokens, const Context&) const override {
        return Value::of(tokens);
    }
};

} // namespace

std::vector<std::shared_ptr<const Converter>> builtinConverters() {
    return {
        std::make_shared<ScalarConverter<bool>>(&parse::toBool),
        std::make_shared<ScalarConverter<int>>(&parse::toInt),
        std::make_shared<ScalarConverter<std::int64_t>>(&parse::toInt64),
        std::make_shared<ScalarConverter<std::uint64_t>>(&parse::toUInt64),
        std::make_shared<ScalarConverter<float>>(&parse::toFloat),
        std::make_shared<ScalarConverter<double>>(&parse::toDouble),
        std::make_shared<ScalarConverter<std::chrono::milliseconds>>(&parse::toDuration),
        std::make_shared<StringConverter>(),
        std::make_shared<IntListConverter>(),
        std::make_shared<StringListConverter>(),
    };
}

} // namespace cmdq
