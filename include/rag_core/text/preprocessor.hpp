#pragma once

#include <regex>
#include <string>
#include <vector>

namespace rag_core::text {

/**
 * @class TextPreprocessor
 * @brief Removes the noise that PDF-to-text conversion leaves in a manual.
 *
 * Page-number markers, running headers/footers, vertical-text artifacts and
 * decoration-only lines are dropped and whitespace is normalized. The output
 * is deterministic for a given input and pattern list.
 */
class TextPreprocessor {
 public:
  // Header/footer patterns found in the converted Prius manual.
  static std::vector<std::string> default_strip_patterns();

  TextPreprocessor();
  explicit TextPreprocessor(const std::vector<std::string> &strip_patterns);

  std::string process(const std::string &input) const;

 private:
  std::vector<std::regex> strip_patterns_;

  std::u32string remove_page_markers(const std::u32string &text) const;
  std::vector<std::u32string> join_single_char_lines(const std::vector<std::u32string> &lines) const;
};

}  // namespace rag_core::text
