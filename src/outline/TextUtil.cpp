#include "outline/TextUtil.hpp"

namespace textutil {

static bool is_upper_ascii(char c) { return c >= 'A' && c <= 'Z'; }
static bool is_lower_ascii(char c) { return c >= 'a' && c <= 'z'; }

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && is_space(s[i])) ++i;
    size_t j = s.size();
    while (j > i && is_space(s[j - 1])) --j;
    return s.substr(i, j - i);
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == '\n') {
            if (!cur.empty() && cur.back() == '\r') cur.pop_back();
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty() && cur.back() == '\r') cur.pop_back();
    out.push_back(cur);
    return out;
}

size_t char_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

bool is_upper_text(const std::string& s) {
    bool cased = false;
    for (char c : s) {
        if (is_lower_ascii(c)) return false;
        if (is_upper_ascii(c)) cased = true;
    }
    return cased;
}

bool starts_upper(const std::string& s) {
    return !s.empty() && is_upper_ascii(s[0]);
}

size_t count_spaces(const std::string& s) {
    size_t n = 0;
    for (char c : s) if (c == ' ') ++n;
    return n;
}

bool is_title_case_phrase(const std::string& s) {
    size_t i = 0;
    const size_t n = s.size();

    while (true) {
        // [A-Z][a-z]+
        if (i >= n || !is_upper_ascii(s[i])) return false;
        ++i;
        size_t lower_start = i;
        while (i < n && is_lower_ascii(s[i])) ++i;
        if (i == lower_start) return false;

        if (i == n) return true;

        // \s+ then another word
        size_t ws_start = i;
        while (i < n && is_space(s[i])) ++i;
        if (i == ws_start) return false;
    }
}

}
