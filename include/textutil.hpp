#pragma once
#include <cctype>
#include <string>
#include <vector>

namespace autocorrect {

inline std::string to_lower_ascii(std::string s) {
    for (char &c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

inline std::string trim_ascii(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

// The one case-folding policy shared by vocabulary keys and query words
inline std::string case_fold(const std::string& s) {
    return to_lower_ascii(trim_ascii(s));
}

// True for a non-empty run of [a-z]
inline bool is_lower_alpha(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char uc : s) {
        if (uc < 'a' || uc > 'z') return false;
    }
    return true;
}

inline bool is_word_char(unsigned char uc) {
    return std::isalnum(uc) || uc == '_';
}

// Lowercases, then keeps maximal runs of [a-z0-9_]
inline std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> out;
    std::string cur;
    cur.reserve(32);

    for (unsigned char uc : text) {
        if (is_word_char(uc)) {
            cur.push_back((char)std::tolower(uc));
        } else {
            if (!cur.empty()) { out.push_back(cur); cur.clear(); }
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

} // namespace autocorrect
