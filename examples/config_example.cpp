#include <future>
#include <iostream>
#include <memory>
#include <string>

#include "cmdq/cmdq.hpp"

// Usage: config_example [path/to/cmdq.conf]
//
// Settings come from the defaults, then the optional file, then CMDQ_*
// environment variables, e.g.
//   CMDQ_PIPE_DELIMITER='>' CMDQ_LOG_LEVEL=debug ./config_example
struct Clock {
    std::string now(const cmdq::Context&) { return "12:00"; }
    std::string tag(const cmdq::Context&, std::string label, std::string value) { return label + "=" + value; }
};

int main(int argc, char** argv) {
    cmdq::QueueConfig config;
    if (argc > 1) {
        if (auto err = cmdq::loadConfigFile(argv[1], config)) {
            std::cerr << "config error: " << *err << "\n";
            return 1;
        }
    }
    if (auto err = cmdq::applyEnvironment(config)) {
        std::cerr << "environment error: " << *err << "\n";
        return 1;
    }

    std::cout << "poll_interval  = " << config.pollInterval.count() << "ms\n"
              << "worker_threads = " << config.workerThreads << "\n"
              << "pipe_delimiter = " << config.pipeDelimiter << "\n"
              << "log_level      = " << config.logLevel << "\n";

    cmdq::CommandQueue queue(std::make_shared<cmdq::Registry>(), config);
    queue.registerMetadata(cmdq::CommandMetadata(cmdq::Alias("now"), cmdq::ExecutorData::bind(&Clock::now)));
    queue.registerMetadata(cmdq::CommandMetadata(cmdq::Alias("tag"), cmdq::ExecutorData::bind(&Clock::tag)));
    queue.start();

    const std::string line = std::string("now ") + config.pipeDelimiter + " tag time";
    auto result = std::make_shared<std::promise<std::string>>();
    auto text = result->get_future();
    queue.submit(line, cmdq::Context(), [result](cmdq::Outcome outcome, const cmdq::Output& output) {
        result->set_value(outcome == cmdq::Outcome::Success ? output.value().toString() : cmdq::outcomeName(outcome));
    });
    std::cout << line << " -> " << text.get() << "\n";

    queue.stop();
    return 0;
}
