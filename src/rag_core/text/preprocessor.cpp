#include "rag_core/text/preprocessor.hpp"

#include "rag_core/errors.hpp"
#include "rag_core/text/utf8_text.hpp"

namespace rag_core::text {

namespace {

bool is_page_marker(char32_t cp) {
  return cp == 0x30FB || cp == 0xFF65 || cp == U'-';
}

bool is_digit(char32_t cp) {
  return cp >= U'0' && cp <= U'9';
}

std::u32string trim(const std::u32string &line) {
  size_t begin = 0;
  size_t end = line.size();
  while (begin < end && is_whitespace(line[begin])) {
    ++begin;
  }
  while (end > begin && is_whitespace(line[end - 1])) {
    --end;
  }
  return line.substr(begin, end - begin);
}

bool is_decoration_only(const std::u32string &line) {
  if (line.empty()) {
    return false;
  }
  for (char32_t cp : line) {
    if (!is_whitespace(cp) && !is_symbol(cp)) {
      return false;
    }
  }
  return true;
}

bool is_single_letter(const std::u32string &line) {
  return line.size() == 1 && (is_cjk(line[0]) || is_ascii_alnum(line[0])) && !is_digit(line[0]);
}

std::vector<std::u32string> split_lines(const std::u32string &text) {
  std::vector<std::u32string> lines;
  std::u32string current;
  for (char32_t cp : text) {
    if (cp == U'\r') {
      continue;
    }
    if (cp == U'\n') {
      lines.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(cp);
    }
  }
  lines.push_back(std::move(current));
  return lines;
}

}  // namespace

std::vector<std::string> TextPreprocessor::default_strip_patterns() {
  return {R"(PRIUS_UG_M47F64_\(J\))", R"(Sec_\d+-?\d*\.fm)", R"(Forward\.fm)"};
}

TextPreprocessor::TextPreprocessor() : TextPreprocessor(default_strip_patterns()) {}

TextPreprocessor::TextPreprocessor(const std::vector<std::string> &strip_patterns) {
  strip_patterns_.reserve(strip_patterns.size());
  for (const auto &pattern : strip_patterns) {
    try {
      strip_patterns_.emplace_back(pattern, std::regex_constants::ECMAScript);
    } catch (const std::regex_error &e) {
      throw ConfigError("TextPreprocessor", "invalid strip pattern '" + pattern + "': " + e.what());
    }
  }
}

std::u32string TextPreprocessor::remove_page_markers(const std::u32string &text) const {
  // ・123・ / -12- / ･7･
  std::u32string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (is_page_marker(text[i])) {
      size_t j = i + 1;
      while (j < text.size() && is_digit(text[j])) {
        ++j;
      }
      if (j > i + 1 && j < text.size() && is_page_marker(text[j])) {
        i = j + 1;
        continue;
      }
    }
    out.push_back(text[i]);
    ++i;
  }
  return out;
}

std::vector<std::u32string> TextPreprocessor::join_single_char_lines(
    const std::vector<std::u32string> &lines) const {
  std::vector<std::u32string> out;
  out.reserve(lines.size());
  size_t i = 0;
  while (i < lines.size()) {
    if (i + 1 < lines.size() && is_single_letter(lines[i]) && is_single_letter(lines[i + 1])) {
      std::u32string joined;
      while (i < lines.size() && is_single_letter(lines[i])) {
        joined += lines[i];
        ++i;
      }
      out.push_back(std::move(joined));
      continue;
    }
    out.push_back(lines[i]);
    ++i;
  }
  return out;
}

std::string TextPreprocessor::process(const std::string &input) const {
  std::string stripped = sanitize_utf8(input);
  for (const auto &pattern : strip_patterns_) {
    stripped = std::regex_replace(stripped, pattern, "");
  }

  std::u32string text = remove_page_markers(decode_utf8(stripped));

  std::vector<std::u32string> lines;
  for (auto &line : split_lines(text)) {
    lines.push_back(trim(line));
  }
  lines = join_single_char_lines(lines);

  std::u32string result;
  int blank_run = 0;
  for (auto &line : lines) {
    if (is_decoration_only(line)) {
      continue;
    }
    if (line.size() >= 2 && line[0] == U'|' && line[1] == U' ') {
      line.erase(0, 2);
    }

    std::u32string normalized;
    normalized.reserve(line.size());
    for (char32_t cp : line) {
      if (cp == 0x3000 || cp == U'\t') {
        cp = U' ';
      }
      if (cp == U' ' && !normalized.empty() && normalized.back() == U' ') {
        continue;
      }
      normalized.push_back(cp);
    }

    if (normalized.empty()) {
      // at most one blank line between paragraphs
      if (++blank_run > 1) {
        continue;
      }
    } else {
      blank_run = 0;
    }
    if (!result.empty() || !normalized.empty()) {
      if (!result.empty()) {
        result.push_back(U'\n');
      }
      result += normalized;
    }
  }

  return encode_utf8(trim(result));
}

}  // namespace rag_core::text
