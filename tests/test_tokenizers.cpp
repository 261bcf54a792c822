#include "rqcd/tokenization/whitespace_tokenizer.h"
#include "rqcd/tokenization/word_tokenizer.h"

#include <catch2/catch_test_macros.hpp>

using namespace rqcd;

TEST_CASE("WordTokenizer splits on punctuation and keeps joined words", "[tokenization]") {
  tokenization::WordTokenizer tokenizer;
  REQUIRE(tokenizer.prepare().has_value());
  CHECK(tokenizer.id() == "word-v1");

  SECTION("punctuation separates tokens") {
    CHECK(tokenizer.tokenize("The system shall be fast, and scalable.") ==
          std::vector<std::string>{"The", "system", "shall", "be", "fast", "and", "scalable"});
  }

  SECTION("internal hyphen and apostrophe join") {
    CHECK(tokenizer.tokenize("user-friendly UI, don't crash") ==
          std::vector<std::string>{"user-friendly", "UI", "don't", "crash"});
  }

  SECTION("dangling joiners do not") {
    CHECK(tokenizer.tokenize("- fast- 'slow'") == std::vector<std::string>{"fast", "slow"});
  }

  SECTION("numbers are tokens") {
    CHECK(tokenizer.tokenize("under 2 seconds").size() == 3);
  }

  SECTION("empty input") {
    CHECK(tokenizer.tokenize("").empty());
    CHECK(tokenizer.tokenize("  ...  ").empty());
  }
}

TEST_CASE("WhitespaceTokenizer splits on whitespace only", "[tokenization]") {
  tokenization::WhitespaceTokenizer tokenizer;
  REQUIRE(tokenizer.prepare().has_value());
  CHECK(tokenizer.id() == "whitespace-v1");
  CHECK(tokenizer.tokenize("  fast,\tand\nscalable. ") ==
        std::vector<std::string>{"fast,", "and", "scalable."});
  CHECK(tokenizer.tokenize("").empty());
}

TEST_CASE("tokenizers are deterministic", "[tokenization]") {
  tokenization::WordTokenizer tokenizer;
  const std::string text = "The process should handle 1000 records within 5 seconds.";
  CHECK(tokenizer.tokenize(text) == tokenizer.tokenize(text));
}
