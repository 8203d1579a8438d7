#include "llama_reorderer.hpp"
#include <llama.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static const char* SYSTEM_PREAMBLE = "You are an expert day planner.\n";

struct LlamaReorderer::Session {
  llama_model* model = nullptr;
  llama_context* ctx = nullptr;
  const llama_vocab* vocab = nullptr;
  int n_ctx = 4096;

  explicit Session(const std::string& model_path) {
    llama_model_params mp = llama_model_default_params();
    mp.n_gpu_layers = 0;
    model = llama_model_load_from_file(model_path.c_str(), mp);
    if (!model) throw std::runtime_error("reorder: failed to load model " + model_path);

    llama_context_params cp = llama_context_default_params();
    cp.n_ctx = n_ctx;
    cp.n_batch = n_ctx;
    cp.embeddings = false;
    ctx = llama_init_from_model(model, cp);
    if (!ctx) {
      llama_model_free(model);
      throw std::runtime_error("reorder: failed to create context");
    }
    vocab = llama_model_get_vocab(model);
  }

  ~Session() {
    if (ctx) llama_free(ctx);
    if (model) llama_model_free(model);
  }

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  std::vector<llama_token> tokenize(const std::string& s) {
    int32_t need = -llama_tokenize(vocab, s.c_str(), (int32_t)s.size(), nullptr, 0,
                                   /*add_special=*/true, /*parse_special=*/false);
    if (need <= 0) throw std::runtime_error("reorder: tokenize failed (len)");
    std::vector<llama_token> t(need);
    int32_t n = llama_tokenize(vocab, s.c_str(), (int32_t)s.size(), t.data(), (int32_t)t.size(),
                               true, false);
    if (n != need) throw std::runtime_error("reorder: tokenize failed");
    return t;
  }

  llama_token argmax_token() {
    const float* logits = llama_get_logits_ith(ctx, -1);
    const int n_vocab = llama_vocab_n_tokens(vocab);
    int best = 0;
    float bestLogit = logits[0];
    for (int i = 1; i < n_vocab; ++i) {
      if (logits[i] > bestLogit) { bestLogit = logits[i]; best = i; }
    }
    return (llama_token)best;
  }

  std::string token_to_string(llama_token tok) {
    char buf[256];
    int32_t n = llama_token_to_piece(vocab, tok, buf, sizeof(buf), /*lstrip=*/0, /*special=*/false);
    if (n < 0) throw std::runtime_error("reorder: token_to_piece failed");
    return std::string(buf, (size_t)n);
  }

  // Greedy decode until end of generation, the token budget, or the first
  // top-level JSON array closes.
  std::string generate(const std::string& prompt, int max_new) {
    auto toks = tokenize(prompt);
    if ((int)toks.size() + max_new > n_ctx) throw std::runtime_error("reorder: prompt too long");

    if (llama_decode(ctx, llama_batch_get_one(toks.data(), (int32_t)toks.size())) != 0) {
      throw std::runtime_error("reorder: decode(prompt) failed");
    }

    std::string out;
    ArrayWatcher watcher;
    for (int t = 0; t < max_new; ++t) {
      llama_token tok = argmax_token();
      if (llama_vocab_is_eog(vocab, tok)) break;

      std::string piece = token_to_string(tok);
      out += piece;
      watcher.feed(piece);
      if (watcher.closed()) break;

      if (llama_decode(ctx, llama_batch_get_one(&tok, 1)) != 0) {
        throw std::runtime_error("reorder: decode failed");
      }
    }
    return out;
  }
};

LlamaReorderer::LlamaReorderer(std::vector<std::string> model_paths, int max_new_tokens)
  : model_paths_(std::move(model_paths)), max_new_(max_new_tokens) {
  llama_backend_init();
}

LlamaReorderer::~LlamaReorderer() { llama_backend_free(); }

std::string LlamaReorderer::complete(const std::string& prompt) {
  std::string full;
  full.reserve(prompt.size() + 64);
  full.append(SYSTEM_PREAMBLE);
  full.append("\nUser:\n");
  full.append(prompt);
  full.append("\nJSON:");

  std::string last_error = "no models configured";
  for (const auto& path : model_paths_) {
    try {
      Session s(path);
      return s.generate(full, max_new_);
    } catch (const std::exception& e) {
      last_error = e.what();
      std::cerr << "[reorder] " << path << ": " << last_error << "\n";
    }
  }
  throw std::runtime_error("reorder: all models failed (" + last_error + ")");
}
