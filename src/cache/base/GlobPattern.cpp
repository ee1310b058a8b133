#include "flycache/cache/base/GlobPattern.hpp"
#include <utility>

namespace flycache {
namespace cache {

namespace {

// Сопоставление класса символов [...]; pos указывает на символ после '['
bool matchClass(const std::string& pattern, size_t& pos, char c) {
    bool negate = false;
    bool matched = false;

    if (pos < pattern.size() && pattern[pos] == '^') {
        negate = true;
        ++pos;
    }

    while (pos < pattern.size() && pattern[pos] != ']') {
        if (pattern[pos] == '\\' && pos + 1 < pattern.size()) {
            ++pos;
            if (pattern[pos] == c) matched = true;
        } else if (pos + 2 < pattern.size() && pattern[pos + 1] == '-' && pattern[pos + 2] != ']') {
            char low = pattern[pos];
            char high = pattern[pos + 2];
            if (low > high) std::swap(low, high);
            if (c >= low && c <= high) matched = true;
            pos += 2;
        } else if (pattern[pos] == c) {
            matched = true;
        }
        ++pos;
    }
    // pos стоит на ']' (или в конце незакрытого класса)
    return negate ? !matched : matched;
}

bool matchFrom(const std::string& pattern, size_t p, const std::string& text, size_t t) {
    while (p < pattern.size()) {
        switch (pattern[p]) {
            case '*': {
                while (p + 1 < pattern.size() && pattern[p + 1] == '*') ++p;
                if (p + 1 == pattern.size()) return true;
                for (size_t i = t; i <= text.size(); ++i) {
                    if (matchFrom(pattern, p + 1, text, i)) return true;
                }
                return false;
            }
            case '?':
                if (t >= text.size()) return false;
                ++t;
                break;
            case '[': {
                if (t >= text.size()) return false;
                ++p;
                if (!matchClass(pattern, p, text[t])) return false;
                ++t;
                break;
            }
            case '\\':
                if (p + 1 < pattern.size()) ++p;
                [[fallthrough]];
            default:
                if (t >= text.size() || pattern[p] != text[t]) return false;
                ++t;
                break;
        }
        ++p;
    }
    return t == text.size();
}

} // namespace

bool globMatch(const std::string& pattern, const std::string& text) {
    return matchFrom(pattern, 0, text, 0);
}

bool globHasClassOrEscape(const std::string& pattern) {
    return pattern.find_first_of("[\\") != std::string::npos;
}

} // namespace cache
} // namespace flycache
