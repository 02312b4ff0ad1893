#include "cmdq/config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>

#include <spdlog/common.h>

#include "cmdq/parse.hpp"
#include "cmdq/utils.hpp"

namespace cmdq {

namespace {

struct EnvBinding {
    const char* variable;
    const char* key;
};

constexpr EnvBinding kEnvBindings[] = {
    {"CMDQ_POLL_INTERVAL", "poll_interval"},
    {"CMDQ_WORKER_THREADS", "worker_threads"},
    {"CMDQ_PIPE_DELIMITER", "pipe_delimiter"},
    {"CMDQ_LOG_LEVEL", "log_level"},
};

std::string unquote(std::string_view v) {
    if (v.size() >= 2 && ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\''))) {
        return std::string(v.substr(1, v.size() - 2));
    }
    return std::string(v);
}

bool isLogLevel(const std::string& name) {
    if (name == "off") return true;
    return spdlog::level::from_str(name) != spdlog::level::off;
}

} // namespace

std::optional<std::string> applySetting(QueueConfig& config, std::string_view key, std::string_view value) {
    const auto v = utils::trim(value);
    if (key == "poll_interval") {
        const auto d = parse::toDuration(v);
        if (!d || d->count() <= 0) return "invalid poll_interval: " + std::string(v);
        config.pollInterval = *d;
        return std::nullopt;
    }
    if (key == "worker_threads") {
        const auto n = parse::toUInt64(v);
        if (!n) return "invalid worker_threads: " + std::string(v);
        config.workerThreads = static_cast<std::size_t>(*n);
        return std::nullopt;
    }
    if (key == "pipe_delimiter") {
        if (v.size() != 1 || std::isspace(static_cast<unsigned char>(v.front()))) {
            return "invalid pipe_delimiter: " + std::string(v);
        }
        config.pipeDelimiter = v.front();
        return std::nullopt;
    }
    if (key == "log_level") {
        const auto level = utils::toLower(v);
        if (!isLogLevel(level)) return "invalid log_level: " + std::string(v);
        config.logLevel = level;
        return std::nullopt;
    }
    return "unknown config key: " + std::string(key);
}

std::optional<std::string> loadConfig(std::istream& in, QueueConfig& config) {
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        const auto t = utils::trim(line);
        if (t.empty() || t.front() == '#') continue;
        const auto eq = t.find('=');
        if (eq == std::string_view::npos) return "line " + std::to_string(lineNo) + ": expected key = value";
        const auto key = utils::trim(t.substr(0, eq));
        const auto value = unquote(utils::trim(t.substr(eq + 1)));
        if (auto err = applySetting(config, key, value)) return "line " + std::to_string(lineNo) + ": " + *err;
    }
    return std::nullopt;
}

std::optional<std::string> loadConfigFile(const std::string& path, QueueConfig& config) {
    std::ifstream in(path);
    if (!in) return "cannot open config file: " + path;
    if (auto err = loadConfig(in, config)) return path + ": " + *err;
    return std::nullopt;
}

std::optional<std::string> applyEnvironment(QueueConfig& config) {
    for (const auto& b : kEnvBindings) {
        const char* raw = std::getenv(b.variable);
        if (!raw) continue;
        if (auto err = applySetting(config, b.key, raw)) return std::string(b.variable) + ": " + *err;
    }
    return std::nullopt;
}

} // namespace cmdq
