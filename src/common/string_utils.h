#pragma once

#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace retryable {

constexpr char COMMA = ',';
constexpr char DOT = '.';

inline std::string ToString(const std::vector<std::string>& strings) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < strings.size(); ++i) {
        if (i != 0) {
            oss << ", ";
        }
        oss << strings[i];
    }
    oss << "]";
    return oss.str();
}

inline std::string TrimCopy(std::string_view str_view) {
    size_t b = 0;
    size_t e = str_view.size();
    while (b < e && (std::isspace(static_cast<unsigned char>(str_view[b])) != 0)) {
        ++b;
    }
    while (e > b && (std::isspace(static_cast<unsigned char>(str_view[e - 1])) != 0)) {
        --e;
    }
    return std::string(str_view.substr(b, e - b));
}

/**
 * Splits on commas outside quotes.
 *
 * - Double or single quotes group a token, so "a,b" stays one token.
 * - A backslash escapes a comma, a quote or a backslash: `c\,d` yields `c,d`.
 *   Before any other character it is kept, so regex escapes such as `\d` pass through.
 * - Tokens are trimmed; empty tokens are dropped unless keep_empty is set.
 */
inline std::vector<std::string> SplitByComma(std::string_view str, bool keep_empty = false) {
    std::vector<std::string> out;
    std::string cur;
    bool in_quotes = false;
    char quote = '\0';
    bool escape = false;

    auto flush = [&]() {
        std::string tok = TrimCopy(cur);
        if (!tok.empty() || keep_empty) {
            out.emplace_back(std::move(tok));
        }
        cur.clear();
    };

    for (char cha : str) {
        if (escape) {
            if (cha != COMMA && cha != '"' && cha != '\'' && cha != '\\') {
                cur.push_back('\\');
            }
            cur.push_back(cha);
            escape = false;
            continue;
        }
        if (cha == '\\') {
            escape = true;
            continue;
        }
        if (cha == '"' || cha == '\'') {
            if (!in_quotes) {
                in_quotes = true;
                quote = cha;
                continue;
            }
            if (quote == cha) {
                in_quotes = false;
                quote = '\0';
                continue;
            }
            // the other quote character is literal inside quotes
        }
        if (cha == COMMA && !in_quotes) {
            flush();
        } else {
            cur.push_back(cha);
        }
    }
    if (escape) {
        cur.push_back('\\');
    }
    flush();

    return out;
}

} // namespace retryable
