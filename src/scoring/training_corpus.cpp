#include "rqcd/scoring/training_corpus.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace rqcd::scoring {

TrainingCorpus embedded_training_corpus() {
  return {
      {"The system shall be fast and scalable.", kUnclearLabel},
      {"The UI should be user-friendly and flexible.", kUnclearLabel},
      {"The system shall respond in under 2 seconds.", kClearLabel},
      {"The process should handle 1000 records within 5 seconds.", kClearLabel},
      {"The application must be reliable and robust.", kUnclearLabel},
      {"The system must store 10GB of logs daily.", kClearLabel},
  };
}

TrainingCorpus training_corpus_from_json(const nlohmann::json& j) {
  if (!j.is_array()) {
    throw std::runtime_error("training corpus must be a JSON array");
  }

  TrainingCorpus corpus;
  corpus.reserve(j.size());
  for (const auto& item : j) {
    if (!item.is_object() || !item.contains("text") || !item.contains("label")) {
      throw std::runtime_error("training corpus entries need \"text\" and \"label\"");
    }
    LabeledExample example;
    example.text = item.at("text").get<std::string>();
    example.label = item.at("label").get<int>();
    corpus.push_back(std::move(example));
  }
  return corpus;
}

TrainingCorpus load_training_corpus_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open training corpus: " + path);
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  try {
    return training_corpus_from_json(nlohmann::json::parse(buffer.str()));
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("invalid training corpus " + path + ": " + e.what());
  }
}

}  // namespace rqcd::scoring
