#pragma once
#include <string>
#include <vector>

namespace textutil {

// strip ASCII whitespace (space, tab, CR, LF, FF, VT) from both ends
std::string trim(const std::string& s);

// split on '\n'; a trailing '\r' on each line is dropped
std::vector<std::string> split_lines(const std::string& s);

// number of UTF-8 code points (continuation bytes are not counted)
size_t char_length(const std::string& s);

// at least one cased letter and no lowercase letter; non-ASCII bytes are uncased
bool is_upper_text(const std::string& s);

bool starts_upper(const std::string& s);

size_t count_spaces(const std::string& s);

// one or more words of [A-Z][a-z]+ separated by whitespace, nothing else
bool is_title_case_phrase(const std::string& s);

bool is_space(char c);

}
