#pragma once

#include <string>
#include <vector>

namespace rag_core::text {

/**
 * @class Tokenizer
 * @brief Term segmentation shared by keyword indexing and keyword queries.
 *
 * Text is folded (fullwidth to ASCII, ASCII to lower case) and split on
 * whitespace and punctuation. Runs of Latin letters and digits become one term
 * each; runs of kana/ideographs become overlapping character bigrams, since
 * Japanese has no word delimiters. A single isolated CJK character is kept as
 * a unigram.
 */
class Tokenizer {
 public:
  std::vector<std::string> tokenize(const std::string &text) const;
};

}  // namespace rag_core::text
