#include <cctype>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cmdq/cmdq.hpp"

// Reads lines from stdin and runs them through the queue, e.g.
//   echo hello world
//   upper shout | echo said:
//   add 1 2 3
struct Shell {
    std::string echo(const cmdq::Context&, std::string text) { return text; }

    std::string upper(const cmdq::Context&, std::string text) {
        for (auto& ch : text) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        return text;
    }

    int add(const cmdq::Context&, std::vector<int> values) {
        int total = 0;
        for (int v : values) total += v;
        return total;
    }
};

int main() {
    cmdq::CommandQueue queue(std::make_shared<cmdq::Registry>());
    queue.registerMetadata(cmdq::CommandMetadata(cmdq::Alias("echo|say"), cmdq::ExecutorData::bind(&Shell::echo, {0})));
    queue.registerMetadata(cmdq::CommandMetadata(cmdq::Alias("upper"), cmdq::ExecutorData::bind(&Shell::upper, {0})));
    queue.registerMetadata(cmdq::CommandMetadata(cmdq::Alias("add|sum"), cmdq::ExecutorData::bind(&Shell::add, {0})));
    queue.start();

    std::string line;
    std::cout << "> " << std::flush;
    while (std::getline(std::cin, line)) {
        if (line == "quit" || line == "exit") break;

        auto done = std::make_shared<std::promise<void>>();
        auto finished = done->get_future();
        queue.submit(line, cmdq::Context(), [done](cmdq::Outcome outcome, const cmdq::Output& output) {
            switch (outcome) {
                case cmdq::Outcome::Success:
                    if (output.hasValue() && !output.value().isNone()) std::cout << output.value().toString() << "\n";
                    break;
                case cmdq::Outcome::Failure:
                    std::cout << "error (" << cmdq::failReasonName(output.failReason()) << "): " << output.errorMessage()
                              << "\n";
                    break;
                case cmdq::Outcome::Unhandled:
                    std::cout << "unknown command\n";
                    break;
            }
            done->set_value();
        });
        finished.wait();
        std::cout << "> " << std::flush;
    }

    queue.stop();
    return 0;
}
