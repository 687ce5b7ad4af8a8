#pragma once
#include "emb/Embedder.hpp"
#include "emb/WordPieceTokenizer.hpp"
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

namespace emb {

// all-MiniLM-L6-v2 style sentence encoder: WordPiece ids -> ONNX session ->
// mean pooling over the attention mask -> L2 normalization.
// Ort::Session::Run is safe to call concurrently, so embed() takes no lock.
class MiniLmEmbedder final : public Embedder {
public:
    explicit MiniLmEmbedder(size_t max_len = 256) : m_max_len(max_len) {}

    bool init(const std::string& model_path, const std::string& vocab_path);

    // L2-normalized embedding; empty if init() has not succeeded
    std::vector<float> embed(const std::string& text) const override;

    size_t vocab_size() const { return m_tok.vocab_size(); }
    size_t max_len() const { return m_max_len; }

private:
    size_t m_max_len;
    WordPieceTokenizer m_tok;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "docpersona"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::string m_in_ids = "input_ids";
    std::string m_in_mask = "attention_mask";
    std::string m_in_type = "token_type_ids";
    std::string m_out_name;
};

}  // namespace emb
