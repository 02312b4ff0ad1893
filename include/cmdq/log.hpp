#ifndef CMDQ_LOG_HPP
#define CMDQ_LOG_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace cmdq::log {

inline constexpr const char* kLoggerName = "cmdq";

// The library's logger (stderr, colored). Created on first use and registered
// with spdlog under kLoggerName, so applications can reconfigure it.
std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names: trace, debug, info, warn, err, critical, off.
// Returns false and leaves the level untouched for anything else.
bool setLevel(std::string_view level);

} // namespace cmdq::log

#endif // CMDQ_LOG_HPP
