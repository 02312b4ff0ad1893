#include "cmdq/registry.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace cmdq;

namespace {

struct Color {
    int r{0};
    int g{0};
    int b{0};
};

struct NoDefault {
    explicit NoDefault(int v) : value(v) {}
    int value;
};

// Accepts "loud" and "quiet" as booleans.
class LoudConverter final : public Converter {
public:
    Type type() const override { return Type::of<bool>(); }
    std::string name() const override { return "loud converter"; }

    std::optional<Value> convertFromScalar(std::string_view token, const Context&) const override {
        if (token == "loud") return Value::of(true);
        if (token == "quiet") return Value::of(false);
        return std::nullopt;
    }

    std::optional<Value> convertFromArray(const std::vector<std::string>& tokens, const Context& ctx) const override {
        if (tokens.size() != 1) return std::nullopt;
        return convertFromScalar(tokens.front(), ctx);
    }
};

Registry::Factory colorFactory() {
    return [](const std::vector<Value>& tokens, const Context&) -> std::optional<Value> {
        if (tokens.size() != 3) return std::nullopt;
        Color c;
        c.r = std::stoi(tokens[0].toString());
        c.g = std::stoi(tokens[1].toString());
        c.b = std::stoi(tokens[2].toString());
        return Value::of(c);
    };
}

} // namespace

TEST(RegistryTest, BuiltinConvertersAreRegistered) {
    Registry registry;
    EXPECT_NE(registry.converter(Type::of<int>()), nullptr);
    EXPECT_NE(registry.converter(Type::of<std::vector<int>>()), nullptr);
    EXPECT_EQ(registry.converter(Type::of<Color>()), nullptr);
}

TEST(RegistryTest, AddConverterReplacesExisting) {
    Registry registry;
    registry.addConverter(std::make_shared<LoudConverter>());
    const auto c = registry.converter(Type::of<bool>());
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->name(), "loud converter");
    EXPECT_TRUE(c->convertFromScalar("loud", Context())->as<bool>());
}

TEST(RegistryTest, DefaultsForBuiltins) {
    Registry registry;
    EXPECT_EQ(registry.constructDefault(Type::of<int>()).as<int>(), 0);
    EXPECT_EQ(registry.constructDefault(Type::of<std::string>()).as<std::string>(), "");
    EXPECT_FALSE(registry.constructDefault(Type::of<bool>()).as<bool>());
    EXPECT_TRUE(registry.constructDefault(Type::of<std::vector<std::string>>()).as<std::vector<std::string>>().empty());
    EXPECT_TRUE(registry.constructDefault(Type::of<void>()).isNone());
}

TEST(RegistryTest, DefaultsForUserTypes) {
    Registry registry;
    EXPECT_TRUE(registry.constructDefault(Type::of<Color>()).isNone());

    registry.addType<Color>(colorFactory());
    const auto v = registry.constructDefault(Type::of<Color>());
    ASSERT_TRUE(v.is<Color>());
    EXPECT_EQ(v.as<Color>().r, 0);

    registry.addType<NoDefault>([](const std::vector<Value>&, const Context&) { return Value::of(NoDefault(1)); });
    EXPECT_TRUE(registry.constructDefault(Type::of<NoDefault>()).isNone());
}

TEST(RegistryTest, ConstructFromTokensUsesFactory) {
    Registry registry;
    registry.addType<Color>(colorFactory());

    const auto v = registry.constructFromTokens(
        Type::of<Color>(), {Value("10"), Value("20"), Value("30")}, Context());
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->as<Color>().g, 20);

    EXPECT_FALSE(registry.constructFromTokens(Type::of<Color>(), {Value("1")}, Context()).has_value());
    EXPECT_FALSE(registry.constructFromTokens(Type::of<NoDefault>(), {Value("1")}, Context()).has_value());
}
