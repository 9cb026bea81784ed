#include <gtest/gtest.h>

#include "rag_core/text/tokenizer.hpp"

namespace rag_tests {

using rag_core::text::Tokenizer;
using Terms = std::vector<std::string>;

TEST(TokenizerTest, SplitsLatinWordsAndLowercases) {
  Tokenizer tokenizer;
  EXPECT_EQ(tokenizer.tokenize("Engine START button"), (Terms{"engine", "start", "button"}));
}

TEST(TokenizerTest, FoldsFullwidthCharacters) {
  Tokenizer tokenizer;
  EXPECT_EQ(tokenizer.tokenize("ＡＢＣ１２３"), (Terms{"abc123"}));
}

TEST(TokenizerTest, JapaneseRunsBecomeBigrams) {
  Tokenizer tokenizer;
  EXPECT_EQ(tokenizer.tokenize("エンジン"), (Terms{"エン", "ンジ", "ジン"}));
}

TEST(TokenizerTest, IsolatedCjkCharacterIsUnigram) {
  Tokenizer tokenizer;
  EXPECT_EQ(tokenizer.tokenize("油"), (Terms{"油"}));
}

TEST(TokenizerTest, PunctuationSplitsRuns) {
  Tokenizer tokenizer;
  EXPECT_EQ(tokenizer.tokenize("オイル交換、タイヤ"),
            (Terms{"オイ", "イル", "ル交", "交換", "タイ", "イヤ"}));
}

TEST(TokenizerTest, MixedScriptBoundary) {
  Tokenizer tokenizer;
  EXPECT_EQ(tokenizer.tokenize("EV走行"), (Terms{"ev", "走行"}));
}

TEST(TokenizerTest, EmptyAndPunctuationOnlyInputs) {
  Tokenizer tokenizer;
  EXPECT_TRUE(tokenizer.tokenize("").empty());
  EXPECT_TRUE(tokenizer.tokenize("  、。!? ").empty());
}

}  // namespace rag_tests
