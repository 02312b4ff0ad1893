#include "cmdq/command_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "callback_probe.hpp"

using namespace cmdq;
using cmdq::testing::CallbackProbe;

namespace {

struct Terminal {
    std::string prompt;
};

struct Builtins {
    std::string echo(const Context&, std::string text) { return text; }
    std::string prompt(const Context& ctx) {
        const auto* terminal = ctx.as<Terminal>();
        return terminal ? terminal->prompt : "";
    }
    int fail(const Context&) { throw std::runtime_error("handler failed"); }
    int length(const Context&, std::string text) { return static_cast<int>(text.size()); }
};

struct ThrowsOnCopy {
    ThrowsOnCopy() = default;
    ThrowsOnCopy(const ThrowsOnCopy&) { throw std::runtime_error("context copy failed"); }
    ThrowsOnCopy(ThrowsOnCopy&&) noexcept = default;
    ThrowsOnCopy& operator=(const ThrowsOnCopy&) = default;
    ThrowsOnCopy& operator=(ThrowsOnCopy&&) noexcept = default;
};

QueueConfig testConfig() {
    QueueConfig config;
    config.workerThreads = 2;
    config.pollInterval = std::chrono::milliseconds(10);
    config.logLevel = "off";
    return config;
}

} // namespace

class CommandQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        queue_ = std::make_unique<CommandQueue>(std::make_shared<Registry>(), testConfig());
        queue_->registerMetadata(CommandMetadata(Alias("echo"), ExecutorData::bind(&Builtins::echo, {0})));
        queue_->registerMetadata(CommandMetadata(Alias("prompt"), ExecutorData::bind(&Builtins::prompt)));
        queue_->registerMetadata(CommandMetadata(Alias("fail"), ExecutorData::bind(&Builtins::fail)));
        queue_->registerMetadata(CommandMetadata(Alias("len|length"), ExecutorData::bind(&Builtins::length, {0})));
    }

    void TearDown() override { queue_.reset(); }

    const CallbackProbe::Delivery& onlyDelivery() {
        EXPECT_TRUE(probe_.waitFor(1));
        deliveries_ = probe_.deliveries();
        EXPECT_EQ(deliveries_.size(), 1u);
        if (deliveries_.empty()) deliveries_.push_back(CallbackProbe::Delivery{Outcome::Failure, Output()});
        return deliveries_.front();
    }

    // Outlives the queue, whose destruction waits for in-flight callbacks.
    CallbackProbe probe_;
    std::vector<CallbackProbe::Delivery> deliveries_;
    std::unique_ptr<CommandQueue> queue_;
};

TEST_F(CommandQueueTest, EchoReturnsItsArguments) {
    queue_->start();
    queue_->submit("echo hello world", Context(), probe_.callback());
    const auto& d = onlyDelivery();
    EXPECT_EQ(d.outcome, Outcome::Success);
    EXPECT_EQ(d.output.value().as<std::string>(), "hello world");
}

TEST_F(CommandQueueTest, AliasMatchingIgnoresCase) {
    queue_->start();
    queue_->submit("  ECHO Mixed Case  ", Context(), probe_.callback());
    EXPECT_EQ(onlyDelivery().output.value().as<std::string>(), "Mixed Case");
}

TEST_F(CommandQueueTest, UnknownCommandIsUnhandled) {
    queue_->start();
    queue_->submit("ehco hi", Context(), probe_.callback());
    const auto& d = onlyDelivery();
    EXPECT_EQ(d.outcome, Outcome::Unhandled);
    EXPECT_TRUE(d.output.empty());
}

TEST_F(CommandQueueTest, PipelineDeliversOnceWithComposedValue) {
    queue_->start();
    queue_->submit("echo a | echo b", Context(), probe_.callback());
    const auto& d = onlyDelivery();
    EXPECT_EQ(d.outcome, Outcome::Success);
    EXPECT_EQ(d.output.value().as<std::string>(), "b a");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(probe_.count(), 1u);
}

TEST_F(CommandQueueTest, PipelineForwardsTypedValues) {
    queue_->start();
    queue_->submit("echo four | length", Context(), probe_.callback());
    EXPECT_EQ(onlyDelivery().output.value().as<int>(), 4);
}

TEST_F(CommandQueueTest, HandlerFailureIsReported) {
    queue_->start();
    queue_->submit("fail", Context(), probe_.callback());
    const auto& d = onlyDelivery();
    EXPECT_EQ(d.outcome, Outcome::Failure);
    EXPECT_EQ(d.output.failReason(), FailReason::HandlerFailure);
    EXPECT_EQ(d.output.errorMessage(), "handler failed");
}

TEST_F(CommandQueueTest, ContextIsHandedToTheHandler) {
    queue_->start();
    queue_->submit("prompt", Context(Terminal{"$ "}), probe_.callback());
    EXPECT_EQ(onlyDelivery().output.value().as<std::string>(), "$ ");
}

TEST_F(CommandQueueTest, InputSubmittedBeforeStartIsProcessedAfterStart) {
    queue_->submit("echo early", Context(), probe_.callback());
    EXPECT_EQ(queue_->pending(), 1u);
    EXPECT_FALSE(probe_.waitFor(1, std::chrono::milliseconds(50)));
    queue_->start();
    EXPECT_EQ(onlyDelivery().output.value().as<std::string>(), "early");
}

TEST_F(CommandQueueTest, EverySubmissionIsDeliveredOnce) {
    queue_->start();
    constexpr int kCount = 200;
    for (int i = 0; i < kCount; ++i) {
        queue_->submit("echo " + std::to_string(i), Context(), probe_.callback());
    }
    ASSERT_TRUE(probe_.waitFor(kCount));
    const auto deliveries = probe_.deliveries();
    std::vector<bool> seen(kCount, false);
    for (const auto& d : deliveries) {
        ASSERT_EQ(d.outcome, Outcome::Success);
        const int i = std::stoi(d.output.value().as<std::string>());
        EXPECT_FALSE(seen[i]);
        seen[i] = true;
    }
    EXPECT_EQ(deliveries.size(), static_cast<std::size_t>(kCount));
}

TEST_F(CommandQueueTest, FirstRegisteredMetadataWins) {
    struct Shadow {
        std::string echo(const Context&, std::string) { return "shadow"; }
    };
    queue_->registerMetadata(CommandMetadata(Alias("echo"), ExecutorData::bind(&Shadow::echo)));
    queue_->start();
    queue_->submit("echo original", Context(), probe_.callback());
    EXPECT_EQ(onlyDelivery().output.value().as<std::string>(), "original");
}

TEST_F(CommandQueueTest, RegistrationWhileRunning) {
    struct Late {
        std::string run(const Context&) { return "late"; }
    };
    queue_->start();
    std::thread registrar([this] {
        for (int i = 0; i < 50; ++i) {
            queue_->registerMetadata(CommandMetadata(Alias("late" + std::to_string(i)), ExecutorData::bind(&Late::run)));
        }
    });
    for (int i = 0; i < 50; ++i) queue_->submit("echo x", Context(), probe_.callback());
    registrar.join();
    queue_->submit("late49", Context(), probe_.callback());

    ASSERT_TRUE(probe_.waitFor(51));
    EXPECT_EQ(queue_->metadataCount(), 54u);
    bool sawLate = false;
    for (const auto& d : probe_.deliveries()) {
        if (d.outcome == Outcome::Success && d.output.value().as<std::string>() == "late") sawLate = true;
    }
    EXPECT_TRUE(sawLate);
}

TEST_F(CommandQueueTest, StartingTwiceThrows) {
    queue_->start();
    EXPECT_TRUE(queue_->started());
    EXPECT_THROW(queue_->start(), InvalidStateError);
}

TEST_F(CommandQueueTest, StopIsFinal) {
    queue_->start();
    queue_->stop();
    queue_->stop();
    EXPECT_TRUE(queue_->stopped());
    EXPECT_THROW(queue_->submit("echo late", Context(), probe_.callback()), InvalidStateError);
    EXPECT_THROW(queue_->registerMetadata(CommandMetadata(Alias("x"), ExecutorData::bind(&Builtins::prompt))),
                 InvalidStateError);
    EXPECT_THROW(queue_->start(), InvalidStateError);
}

TEST_F(CommandQueueTest, EmptyCallbackIsRejected) {
    EXPECT_THROW(queue_->submit("echo x", Context(), ResultCallback()), std::invalid_argument);
}

TEST_F(CommandQueueTest, CustomPipeDelimiter) {
    auto config = testConfig();
    config.pipeDelimiter = '>';
    CommandQueue queue(std::make_shared<Registry>(), config);
    queue.registerMetadata(CommandMetadata(Alias("echo"), ExecutorData::bind(&Builtins::echo, {0})));
    queue.start();
    queue.submit("echo a|b > echo c", Context(), probe_.callback());
    EXPECT_EQ(onlyDelivery().output.value().as<std::string>(), "c a|b");
}

TEST_F(CommandQueueTest, DestroyingWithoutStartIsFine) {
    queue_->submit("echo never", Context(), probe_.callback());
    queue_.reset();
    EXPECT_EQ(probe_.count(), 0u);
}

TEST_F(CommandQueueTest, WorkerSurvivesCallbackThrowingNonStandardValue) {
    queue_->start();
    queue_->submit("nope", Context(), [](Outcome, const Output&) { throw 42; });
    queue_->submit("echo after", Context(), probe_.callback());
    const auto& d = onlyDelivery();
    EXPECT_EQ(d.outcome, Outcome::Success);
    EXPECT_EQ(d.output.value().as<std::string>(), "after");
}

TEST_F(CommandQueueTest, StopAbandonsInputStillQueued) {
    std::promise<void> entered;
    auto enteredSignal = entered.get_future();
    std::promise<void> release;
    auto gate = release.get_future().share();

    queue_->start();
    // Unhandled is reported on the worker thread, so this holds the worker.
    queue_->submit("nope", Context(), [&entered, gate](Outcome, const Output&) {
        entered.set_value();
        gate.wait();
    });
    ASSERT_EQ(enteredSignal.wait_for(std::chrono::seconds(5)), std::future_status::ready);

    for (int i = 0; i < 3; ++i) queue_->submit("echo queued", Context(), probe_.callback());
    EXPECT_EQ(queue_->pending(), 3u);

    queue_->stop();
    release.set_value();
    queue_.reset();
    EXPECT_EQ(probe_.count(), 0u);
}

TEST_F(CommandQueueTest, DispatchFailureReachesTheCallback) {
    queue_->start();
    queue_->submit("echo x", Context(ThrowsOnCopy{}), probe_.callback());
    const auto& d = onlyDelivery();
    EXPECT_EQ(d.outcome, Outcome::Failure);
    EXPECT_EQ(d.output.errorMessage(), "context copy failed");
}

TEST_F(CommandQueueTest, PipelineDispatchFailureReachesTheCallback) {
    queue_->start();
    queue_->submit("echo a | echo b", Context(ThrowsOnCopy{}), probe_.callback());
    const auto& d = onlyDelivery();
    EXPECT_EQ(d.outcome, Outcome::Failure);
    EXPECT_EQ(d.output.errorMessage(), "context copy failed");
}
