#pragma once
#include "reorder.hpp"
#include <string>
#include <vector>

// Local llama.cpp completion. Models are tried in order; the first one that
// loads and decodes answers.
class LlamaReorderer : public Reorderer {
public:
  explicit LlamaReorderer(std::vector<std::string> model_paths, int max_new_tokens = 1200);
  ~LlamaReorderer() override;

  std::string complete(const std::string& prompt) override;

private:
  struct Session;
  std::vector<std::string> model_paths_;
  int max_new_;
};
