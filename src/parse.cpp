#include "cmdq/parse.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>
#include <type_traits>

#include "cmdq/utils.hpp"

namespace {

template <typename T>
std::optional<T> parseSigned(std::string_view s) {
    static_assert(std::numeric_limits<T>::is_integer && std::numeric_limits<T>::is_signed, "signed integer required");
    const auto t = cmdq::utils::trim(s);
    if (t.empty()) return std::nullopt;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 0);
    if (errno != 0) return std::nullopt;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return std::nullopt;
    if (v < static_cast<long long>(std::numeric_limits<T>::min()) || v > static_cast<long long>(std::numeric_limits<T>::max())) {
        return std::nullopt;
    }
    return static_cast<T>(v);
}

template <typename T>
std::optional<T> parseFloating(std::string_view s) {
    static_assert(std::is_floating_point_v<T>, "floating point required");
    const auto t = cmdq::utils::trim(s);
    if (t.empty()) return std::nullopt;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    T v{};
    if constexpr (std::is_same_v<T, float>) {
        v = std::strtof(tmp.c_str(), &end);
    } else {
        v = static_cast<T>(std::strtod(tmp.c_str(), &end));
    }
    if (errno != 0) return std::nullopt;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return std::nullopt;
    return v;
}

struct DurationUnit {
    std::string_view suffix;
    double toMs;
};

// Longest suffixes first so "ms" is not read as "m".
constexpr DurationUnit kUnits[] = {
    {"ns", 1e-6},
    {"us", 1e-3},
    {"\xC2\xB5s", 1e-3},
    {"ms", 1.0},
    {"s", 1000.0},
    {"m", 60.0 * 1000.0},
    {"h", 60.0 * 60.0 * 1000.0},
};

} // namespace

namespace cmdq::parse {

std::optional<bool> toBool(std::string_view s) {
    const auto t = utils::trim(s);
    if (t == "1" || t == "true" || t == "True" || t == "TRUE" || t == "on" || t == "yes") return true;
    if (t == "0" || t == "false" || t == "False" || t == "FALSE" || t == "off" || t == "no") return false;
    return std::nullopt;
}

std::optional<int> toInt(std::string_view s) { return parseSigned<int>(s); }

std::optional<std::int64_t> toInt64(std::string_view s) { return parseSigned<std::int64_t>(s); }

std::optional<std::uint64_t> toUInt64(std::string_view s) {
    const auto t = utils::trim(s);
    if (t.empty() || t.front() == '-') return std::nullopt;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(tmp.c_str(), &end, 0);
    if (errno != 0) return std::nullopt;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return std::nullopt;
    if (v > static_cast<unsigned long long>(std::numeric_limits<std::uint64_t>::max())) return std::nullopt;
    return static_cast<std::uint64_t>(v);
}

std::optional<float> toFloat(std::string_view s) { return parseFloating<float>(s); }

std::optional<double> toDouble(std::string_view s) { return parseFloating<double>(s); }

std::optional<std::chrono::milliseconds> toDuration(std::string_view s) {
    const auto sv = utils::trim(s);
    if (sv.empty()) return std::nullopt;

    std::size_t pos = 0;
    double sign = 1.0;
    if (sv[pos] == '+' || sv[pos] == '-') {
        if (sv[pos] == '-') sign = -1.0;
        ++pos;
    }
    if (pos >= sv.size()) return std::nullopt;
    if (sv.substr(pos) == "0") return std::chrono::milliseconds(0);

    double totalMs = 0.0;
    while (pos < sv.size()) {
        const std::size_t numStart = pos;
        bool seenDigit = false;
        bool seenDot = false;
        for (; pos < sv.size(); ++pos) {
            const char ch = sv[pos];
            if (std::isdigit(static_cast<unsigned char>(ch))) {
                seenDigit = true;
            } else if (ch == '.' && !seenDot) {
                seenDot = true;
            } else {
                break;
            }
        }
        if (!seenDigit || pos >= sv.size()) return std::nullopt;

        const auto number = parseFloating<double>(sv.substr(numStart, pos - numStart));
        if (!number) return std::nullopt;

        const auto rest = sv.substr(pos);
        const DurationUnit* unit = nullptr;
        for (const auto& u : kUnits) {
            if (rest.rfind(u.suffix, 0) == 0) {
                unit = &u;
                break;
            }
        }
        if (!unit) return std::nullopt;

        totalMs += *number * unit->toMs;
        pos += unit->suffix.size();
    }

    totalMs *= sign;
    if (totalMs > static_cast<double>(std::numeric_limits<std::int64_t>::max())) return std::nullopt;
    if (totalMs < static_cast<double>(std::numeric_limits<std::int64_t>::min())) return std::nullopt;
    return std::chrono::milliseconds(static_cast<std::int64_t>(totalMs >= 0 ? (totalMs + 0.5) : (totalMs - 0.5)));
}

} // namespace cmdq::parse
