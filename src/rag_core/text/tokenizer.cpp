#include "rag_core/text/tokenizer.hpp"

#include "rag_core/text/utf8_text.hpp"

namespace rag_core::text {

namespace {

enum class RunKind { None, Word, Cjk };

RunKind classify(char32_t cp) {
  if (is_whitespace(cp) || is_symbol(cp)) {
    return RunKind::None;
  }
  if (is_cjk(cp)) {
    return RunKind::Cjk;
  }
  return RunKind::Word;
}

void flush_run(RunKind kind, const std::u32string &run, std::vector<std::string> &terms) {
  if (run.empty()) {
    return;
  }
  if (kind == RunKind::Word) {
    terms.push_back(encode_utf8(run));
    return;
  }
  if (run.size() == 1) {
    terms.push_back(encode_utf8(run));
    return;
  }
  for (size_t i = 0; i + 1 < run.size(); ++i) {
    terms.push_back(encode_utf8(run.begin() + i, run.begin() + i + 2));
  }
}

}  // namespace

std::vector<std::string> Tokenizer::tokenize(const std::string &text) const {
  std::vector<std::string> terms;
  std::u32string run;
  RunKind run_kind = RunKind::None;

  for (char32_t cp : decode_utf8(text)) {
    cp = fold_case_and_width(cp);
    RunKind kind = classify(cp);
    if (kind != run_kind) {
      flush_run(run_kind, run, terms);
      run.clear();
      run_kind = kind;
    }
    if (kind != RunKind::None) {
      run.push_back(cp);
    }
  }
  flush_run(run_kind, run, terms);
  return terms;
}

}  // namespace rag_core::text
