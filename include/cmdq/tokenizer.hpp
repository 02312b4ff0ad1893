#ifndef CMDQ_TOKENIZER_HPP
#define CMDQ_TOKENIZER_HPP

#include <string>
#include <string_view>
#include <vector>

#include "value.hpp"

namespace cmdq {

inline constexpr char kPipeDelimiter = '|';

// Splits on unquoted whitespace. Double quotes group and honour backslash
// escapes (\" \\ \n \t \r), single quotes group literally; the quotes
// themselves are dropped. An empty quoted pair yields an empty token.
std::vector<std::string> explode(std::string_view input);

// explode(), with every token wrapped as a String value.
std::vector<Value> explodeValues(std::string_view input);

// Splits a line into pipeline stages, each trimmed. A line without the
// delimiter yields exactly one stage.
std::vector<std::string> splitStages(std::string_view input, char delimiter = kPipeDelimiter);

} // namespace cmdq

#endif // CMDQ_TOKENIZER_HPP
