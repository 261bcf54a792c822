#pragma once

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

namespace rqcd::scoring {

// Label values for LabeledExample::label.
constexpr int kClearLabel = 0;
constexpr int kUnclearLabel = 1;

struct LabeledExample {
  std::string text;
  int label{kClearLabel};
};

using TrainingCorpus = std::vector<LabeledExample>;

// The built-in synthetic corpus: six requirement statements, three per class.
[[nodiscard]] TrainingCorpus embedded_training_corpus();

// training_corpus_from_json reads [{"text": "...", "label": 0|1}, ...].
// Throws std::runtime_error if the node is not an array of such objects.
// Label range is not checked here; StatisticalScorer::train rejects bad labels.
[[nodiscard]] TrainingCorpus training_corpus_from_json(const nlohmann::json& j);

// load_training_corpus_file parses a JSON corpus file.
// Throws std::runtime_error if the file cannot be read or parsed.
[[nodiscard]] TrainingCorpus load_training_corpus_file(const std::string& path);

}  // namespace rqcd::scoring
