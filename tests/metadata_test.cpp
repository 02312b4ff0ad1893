#include "cmdq/metadata.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace cmdq;

namespace {

struct Greeter {
    std::string greet(const Context&, std::string name) { return "hello " + name; }
    int add(const Context&, int a, int b) const { return a + b; }
    void nothing(const Context&) {}
};

MetadataTable::Entry makeEntry(std::vector<Alias> aliases) {
    return std::make_shared<const CommandMetadata>(std::move(aliases), ExecutorData::bind(&Greeter::nothing));
}

} // namespace

TEST(ExecutorDataTest, BindRecordsParameterTypes) {
    const auto data = ExecutorData::bind(&Greeter::add);
    ASSERT_EQ(data.parameters().size(), 2u);
    EXPECT_EQ(data.parameters()[0].type, Type::of<int>());
    EXPECT_EQ(data.parameters()[1].repetitions, 1);
    EXPECT_FALSE(data.isAsync());
    EXPECT_FALSE(data.hasSubcommands());
}

TEST(ExecutorDataTest, RepetitionsApplyPositionally) {
    const auto data = ExecutorData::bind(&Greeter::add, {3});
    EXPECT_EQ(data.parameters()[0].repetitions, 3);
    EXPECT_EQ(data.parameters()[1].repetitions, 1);
}

TEST(ExecutorDataTest, InvokeCallsTheMethod) {
    const auto data = ExecutorData::bind(&Greeter::greet);
    const auto out = data.invoke(Context(), {Value("bob")});
    EXPECT_EQ(out.as<std::string>(), "hello bob");
}

TEST(ExecutorDataTest, VoidMethodsReturnNone) {
    const auto data = ExecutorData::bind(&Greeter::nothing);
    EXPECT_TRUE(data.invoke(Context(), {}).isNone());
}

TEST(ExecutorDataTest, WrongArityIsInvalidArguments) {
    const auto data = ExecutorData::bind(&Greeter::add);
    try {
        (void)data.invoke(Context(), {Value::of(1)});
        FAIL() << "expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.reason(), FailReason::InvalidArguments);
    }
}

TEST(ExecutorDataTest, NoneArgumentsBecomeDefaults) {
    const auto data = ExecutorData::bind(&Greeter::add);
    EXPECT_EQ(data.invoke(Context(), {Value::of(4), Value()}).as<int>(), 4);
}

TEST(ExecutorDataTest, SubcommandsAreNamed) {
    auto data = ExecutorData::bind(&Greeter::nothing);
    data.subcommand(Alias("add"), ExecutorData::bind(&Greeter::add)).parameterName(0, "unused");
    ASSERT_TRUE(data.hasSubcommands());
    ASSERT_TRUE(data.subcommands().front().name().has_value());
    EXPECT_EQ(data.subcommands().front().name()->pattern(), "add");
    EXPECT_FALSE(data.name().has_value());
}

TEST(CommandMetadataTest, MatchReturnsFirstMatchingAlias) {
    CommandMetadata metadata({Alias("print"), Alias("p")}, ExecutorData::bind(&Greeter::nothing));
    ASSERT_NE(metadata.match("p hi"), nullptr);
    EXPECT_EQ(metadata.match("p hi")->pattern(), "p");
    EXPECT_EQ(metadata.match("print hi")->pattern(), "print");
    EXPECT_EQ(metadata.match("printer"), nullptr);
}

TEST(MetadataTableTest, ResolveKeepsRegistrationOrder) {
    MetadataTable table;
    auto first = makeEntry({Alias("echo")});
    auto second = makeEntry({Alias("ech(o)?")});
    auto unrelated = makeEntry({Alias("count")});
    table.add(first);
    table.add(unrelated);
    table.add(second);

    const auto matches = table.resolveByAlias("ECHO hello");
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0], first);
    EXPECT_EQ(matches[1], second);
    EXPECT_TRUE(table.resolveByAlias("nothing").empty());
}

TEST(MetadataTableTest, AliasPatternsListEveryAlias) {
    MetadataTable table;
    table.add(makeEntry({Alias("print"), Alias("p")}));
    table.add(makeEntry({Alias("count")}));
    EXPECT_EQ(table.aliasPatterns(), (std::vector<std::string>{"print", "p", "count"}));
    EXPECT_EQ(table.size(), 2u);
}

TEST(MetadataTableTest, ConcurrentAddAndResolve) {
    MetadataTable table;
    std::atomic<bool> done{false};
    std::thread reader([&] {
        while (!done) (void)table.resolveByAlias("cmd5 x");
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&table, w] {
            for (int i = 0; i < 50; ++i) table.add(makeEntry({Alias("cmd" + std::to_string(w * 50 + i))}));
        });
    }
    for (auto& t : writers) t.join();
    done = true;
    reader.join();

    EXPECT_EQ(table.size(), 200u);
    EXPECT_EQ(table.resolveByAlias("cmd5 x").size(), 1u);
}
