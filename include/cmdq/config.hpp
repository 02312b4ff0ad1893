#ifndef CMDQ_CONFIG_HPP
#define CMDQ_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

#include "tokenizer.hpp"

namespace cmdq {

struct QueueConfig {
    // How long the worker sleeps between cancellation checks when idle.
    std::chrono::milliseconds pollInterval{100};
    // Executor/pipeline threads; 0 picks the hardware concurrency.
    std::size_t workerThreads{0};
    char pipeDelimiter{kPipeDelimiter};
    // spdlog level name.
    std::string logLevel{"info"};
};

// Precedence: environment > config file > defaults. Every loader returns an
// error message naming the offending key, and leaves `config` partially
// updated only with the keys that parsed before the error.

// key = value lines; '#' starts a comment line; values may be quoted.
// Keys: poll_interval, worker_threads, pipe_delimiter, log_level.
std::optional<std::string> loadConfig(std::istream& in, QueueConfig& config);
std::optional<std::string> loadConfigFile(const std::string& path, QueueConfig& config);

// CMDQ_POLL_INTERVAL, CMDQ_WORKER_THREADS, CMDQ_PIPE_DELIMITER, CMDQ_LOG_LEVEL.
std::optional<std::string> applyEnvironment(QueueConfig& config);

// Applies one setting by its file key.
std::optional<std::string> applySetting(QueueConfig& config, std::string_view key, std::string_view value);

} // namespace cmdq

#endif // CMDQ_CONFIG_HPP
