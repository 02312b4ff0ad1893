#include "cmdq/tokenizer.hpp"

#include <cctype>

#include "cmdq/utils.hpp"

namespace cmdq {

std::vector<std::string> explode(std::string_view input) {
    std::vector<std::string> out;
    std::string cur;
    bool inToken = false;
    bool inDouble = false;
    bool inSingle = false;

    for (std::size_t i = 0; i < input.size(); ++i) {
        const char ch = input[i];
        if (inSingle) {
            if (ch == '\'') {
                inSingle = false;
            } else {
                cur.push_back(ch);
            }
            continue;
        }
        if (inDouble) {
            if (ch == '"') {
                inDouble = false;
            } else if (ch == '\\' && i + 1 < input.size()) {
                const char n = input[++i];
                switch (n) {
                    case 'n': cur.push_back('\n'); break;
                    case 't': cur.push_back('\t'); break;
                    case 'r': cur.push_back('\r'); break;
                    default: cur.push_back(n); break;
                }
            } else {
                cur.push_back(ch);
            }
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(ch))) {
            if (inToken) {
                out.push_back(std::move(cur));
                cur.clear();
                inToken = false;
            }
            continue;
        }
        inToken = true;
        if (ch == '"') {
            inDouble = true;
        } else if (ch == '\'') {
            inSingle = true;
        } else {
            cur.push_back(ch);
        }
    }
    // An unterminated quote keeps what was read so far.
    if (inToken) out.push_back(std::move(cur));
    return out;
}

std::vector<Value> explodeValues(std::string_view input) {
    std::vector<Value> out;
    for (auto& token : explode(input)) out.emplace_back(std::move(token));
    return out;
}

std::vector<std::string> splitStages(std::string_view input, char delimiter) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        const auto pos = input.find(delimiter, start);
        const auto part = (pos == std::string_view::npos) ? input.substr(start) : input.substr(start, pos - start);
        out.emplace_back(utils::trim(part));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return out;
}

} // namespace cmdq
