#ifndef CMDQ_UTILS_HPP
#define CMDQ_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cmdq::utils {

inline std::string_view trim(std::string_view s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::size_t levenshteinDistance(std::string_view a, std::string_view b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    std::vector<std::size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (std::size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (std::size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            const std::size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        prev.swap(cur);
    }
    return prev[b.size()];
}

// Known command words closest to the first word of an unmatched input line.
inline std::vector<std::string> suggest(std::string_view input,
                                        const std::vector<std::string>& candidates,
                                        std::size_t maxDistance = 2,
                                        std::size_t maxResults = 3) {
    const auto firstSpace = input.find_first_of(" \t");
    const auto word = input.substr(0, firstSpace);
    if (word.empty()) return {};

    std::vector<std::pair<std::size_t, std::string>> scored;
    for (const auto& c : candidates) {
        if (c.empty()) continue;
        const auto d = levenshteinDistance(word, c);
        if (d <= maxDistance) scored.emplace_back(d, c);
    }
    std::sort(scored.begin(), scored.end());
    scored.erase(std::unique(scored.begin(), scored.end()), scored.end());

    std::vector<std::string> out;
    for (const auto& s : scored) {
        if (out.size() >= maxResults) break;
        out.push_back(s.second);
    }
    return out;
}

} // namespace cmdq::utils

#endif // CMDQ_UTILS_HPP
