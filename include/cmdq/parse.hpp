#ifndef CMDQ_PARSE_HPP
#define CMDQ_PARSE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace cmdq::parse {

// Token-level parsers shared by the built-in converters and config loading.
// All of them ignore surrounding whitespace and return std::nullopt on any
// malformed or out-of-range input.

std::optional<bool> toBool(std::string_view s);
std::optional<int> toInt(std::string_view s);
std::optional<std::int64_t> toInt64(std::string_view s);
std::optional<std::uint64_t> toUInt64(std::string_view s);
std::optional<float> toFloat(std::string_view s);
std::optional<double> toDouble(std::string_view s);

// Go-style durations: "250ms", "1.5s", "1m30s", "-2h". A bare "0" is accepted.
std::optional<std::chrono::milliseconds> toDuration(std::string_view s);

} // namespace cmdq::parse

#endif // CMDQ_PARSE_HPP
