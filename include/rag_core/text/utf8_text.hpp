#pragma once

#include <string>

namespace rag_core::text {

// Replaces malformed UTF-8 sequences with U+FFFD.
std::string sanitize_utf8(const std::string &input);

std::u32string decode_utf8(const std::string &input);
std::string encode_utf8(const std::u32string &input);
std::string encode_utf8(std::u32string::const_iterator begin, std::u32string::const_iterator end);

size_t code_point_count(const std::string &input);

bool is_whitespace(char32_t cp);
bool is_ascii_alnum(char32_t cp);
// Hiragana, Katakana (minus the middle dot), CJK ideographs and Hangul.
bool is_cjk(char32_t cp);
bool is_symbol(char32_t cp);

// Folds fullwidth ASCII variants to ASCII and ASCII letters to lower case.
char32_t fold_case_and_width(char32_t cp);

}  // namespace rag_core::text
