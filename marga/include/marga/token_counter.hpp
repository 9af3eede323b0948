#pragma once
// Token counting: pluggable approximation of a model tokenizer
//
// Exactness is not required, only consistency: the same text always
// costs the same number of tokens.

#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <string>

namespace marga {

using TokenCounter = std::function<size_t(const std::string&)>;

inline size_t count_words(const std::string& text) {
    size_t words = 0;
    bool in_word = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++words;
        }
    }
    return words;
}

// Whitespace words scaled by a constant (≈1.3 tokens per English word)
inline TokenCounter word_token_counter(double scale = 1.3) {
    return [scale](const std::string& text) -> size_t {
        size_t words = count_words(text);
        if (words == 0) return 0;
        // Guard against 10 * 1.3 == 13.000000000000002 rounding up to 14
        double tokens = static_cast<double>(words) * scale - 1e-9;
        return static_cast<size_t>(std::max(1.0, std::ceil(tokens)));
    };
}

} // namespace marga
