#include "cmdq/alias.hpp"

#include "cmdq/utils.hpp"

namespace cmdq {

namespace {

std::string escapeRegex(std::string_view s) {
    static const std::string_view special = "\\^$.|?*+()[]{}";
    std::string out;
    out.reserve(s.size() * 2);
    for (const char ch : s) {
        if (special.find(ch) != std::string_view::npos) out.push_back('\\');
        out.push_back(ch);
    }
    return out;
}

} // namespace

Alias::Alias(std::string pattern)
    : pattern_(std::move(pattern)),
      regex_("^(?:" + pattern_ + ")(?=\\s|$)", std::regex::ECMAScript | std::regex::icase) {}

Alias Alias::word(std::string_view word) { return Alias(escapeRegex(word)); }

bool Alias::matches(std::string_view input) const {
    return std::regex_search(input.begin(), input.end(), regex_);
}

std::string Alias::removeMatched(std::string_view input) const {
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(input.begin(), input.end(), m, regex_)) return std::string(input);
    return std::string(utils::trim(input.substr(static_cast<std::size_t>(m.length(0)))));
}

} // namespace cmdq
