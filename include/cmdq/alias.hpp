#ifndef CMDQ_ALIAS_HPP
#define CMDQ_ALIAS_HPP

#include <regex>
#include <string>
#include <string_view>

namespace cmdq {

// Selects a command (or subcommand) by the start of an input line.
//
// The pattern is an ECMAScript regular expression matched case-insensitively
// at the start of the input, and the match must end at whitespace or at the
// end of the input: "echo" matches "echo hi" and "ECHO", but not "echoes".
class Alias {
public:
    explicit Alias(std::string pattern);

    // Pattern that matches `word` literally.
    static Alias word(std::string_view word);

    [[nodiscard]] const std::string& pattern() const { return pattern_; }

    [[nodiscard]] bool matches(std::string_view input) const;

    // Input with the matched prefix and the whitespace after it removed.
    // Returns the input unchanged when the alias does not match.
    [[nodiscard]] std::string removeMatched(std::string_view input) const;

private:
    std::string pattern_;
    std::regex regex_;
};

} // namespace cmdq

#endif // CMDQ_ALIAS_HPP
