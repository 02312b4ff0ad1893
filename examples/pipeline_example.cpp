#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "cmdq/cmdq.hpp"

// Each stage's return value becomes the last argument of the next stage.
struct TextTools {
    std::vector<std::string> words(const cmdq::Context&, std::vector<std::string> input) { return input; }

    int count(const cmdq::Context&, std::vector<std::string> items) { return static_cast<int>(items.size()); }

    std::string report(const cmdq::Context&, std::string label, int n) { return label + " " + std::to_string(n); }

    // Asynchronous handler: the pipeline waits for the future before moving on.
    std::future<int> slowSquare(const cmdq::Context&, int n) {
        return std::async(std::launch::async, [n] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            return n * n;
        });
    }
};

int main() {
    cmdq::CommandQueue queue(std::make_shared<cmdq::Registry>());
    queue.registerMetadata(
        cmdq::CommandMetadata(cmdq::Alias("words"), cmdq::ExecutorData::bind(&TextTools::words, {0})));
    queue.registerMetadata(
        cmdq::CommandMetadata(cmdq::Alias("count|wc"), cmdq::ExecutorData::bind(&TextTools::count, {0})));
    queue.registerMetadata(cmdq::CommandMetadata(cmdq::Alias("report"), cmdq::ExecutorData::bind(&TextTools::report)));
    queue.registerMetadata(cmdq::CommandMetadata(cmdq::Alias("square"), cmdq::ExecutorData::bind(&TextTools::slowSquare)));
    queue.start();

    const std::vector<std::string> lines = {
        "words the quick brown fox | count | report total:",
        "words a b c | wc | square | report squared:",
        "words x | frobnicate | count",
        "square nine | report never:",
    };

    std::vector<std::future<std::string>> results;
    for (const auto& line : lines) {
        auto promise = std::make_shared<std::promise<std::string>>();
        results.push_back(promise->get_future());
        queue.submit(line, cmdq::Context(), [promise](cmdq::Outcome outcome, const cmdq::Output& output) {
            std::string text = cmdq::outcomeName(outcome);
            if (output.hasValue()) text += ": " + output.value().toString();
            if (output.hasError()) text += ": " + output.errorMessage();
            promise->set_value(text);
        });
    }

    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::cout << lines[i] << "\n  -> " << results[i].get() << "\n";
    }
    queue.stop();
    return 0;
}
