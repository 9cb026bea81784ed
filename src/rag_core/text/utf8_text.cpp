#include "rag_core/text/utf8_text.hpp"

#include <utf8.h>

#include <iterator>

namespace rag_core::text {

std::string sanitize_utf8(const std::string &input) {
  std::string out;
  out.reserve(input.size());
  utf8::replace_invalid(input.begin(), input.end(), std::back_inserter(out));
  return out;
}

std::u32string decode_utf8(const std::string &input) {
  const std::string valid = sanitize_utf8(input);
  std::u32string out;
  out.reserve(valid.size());
  utf8::utf8to32(valid.begin(), valid.end(), std::back_inserter(out));
  return out;
}

std::string encode_utf8(const std::u32string &input) {
  return encode_utf8(input.begin(), input.end());
}

std::string encode_utf8(std::u32string::const_iterator begin, std::u32string::const_iterator end) {
  std::string out;
  utf8::utf32to8(begin, end, std::back_inserter(out));
  return out;
}

size_t code_point_count(const std::string &input) {
  const std::string valid = sanitize_utf8(input);
  return static_cast<size_t>(utf8::distance(valid.begin(), valid.end()));
}

bool is_whitespace(char32_t cp) {
  switch (cp) {
    case U' ':
    case U'\t':
    case U'\n':
    case U'\r':
    case U'\v':
    case U'\f':
    case 0x00A0:
    case 0x3000:
      return true;
    default:
      return false;
  }
}

bool is_ascii_alnum(char32_t cp) {
  return (cp >= U'0' && cp <= U'9') || (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z');
}

bool is_cjk(char32_t cp) {
  if (cp == 0x30FB) {
    return false;  // katakana middle dot is punctuation
  }
  return (cp >= 0x3040 && cp <= 0x309F) ||  // hiragana
         (cp >= 0x30A0 && cp <= 0x30FF) ||  // katakana
         (cp >= 0x3400 && cp <= 0x4DBF) ||  // CJK extension A
         (cp >= 0x4E00 && cp <= 0x9FFF) ||  // CJK unified ideographs
         (cp >= 0xF900 && cp <= 0xFAFF) ||  // compatibility ideographs
         (cp >= 0xFF66 && cp <= 0xFF9F) ||  // halfwidth katakana
         (cp >= 0xAC00 && cp <= 0xD7AF);    // hangul syllables
}

bool is_symbol(char32_t cp) {
  if (cp < 0x80) {
    return (cp >= 0x21 && cp <= 0x2F) || (cp >= 0x3A && cp <= 0x40) ||
           (cp >= 0x5B && cp <= 0x60) || (cp >= 0x7B && cp <= 0x7E);
  }
  return (cp >= 0x2000 && cp <= 0x206F) ||  // general punctuation
         (cp >= 0x2190 && cp <= 0x21FF) ||  // arrows
         (cp >= 0x2500 && cp <= 0x27BF) ||  // box drawing, shapes, dingbats
         (cp >= 0x3001 && cp <= 0x303F) ||  // CJK punctuation
         cp == 0x30FB || cp == 0xFF65 ||
         (cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
         (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF64);
}

char32_t fold_case_and_width(char32_t cp) {
  if (cp >= 0xFF01 && cp <= 0xFF5E) {
    cp = cp - 0xFF01 + 0x21;
  }
  if (cp >= U'A' && cp <= U'Z') {
    cp = cp - U'A' + U'a';
  }
  return cp;
}

}  // namespace rag_core::text
