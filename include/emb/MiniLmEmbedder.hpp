#pragma once
#include "docintel/Embedder.hpp"
#include "emb/WordPieceTokenizer.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

// Sentence encoder backed by an ONNX export of a MiniLM-class transformer.
// Inputs are bound by name; token_type_ids is optional.
class MiniLmEmbedder final : public docintel::Embedder {
public:
    bool init(const std::string& model_path, const std::string& vocab_path, size_t max_len = 256);

    // mean-pooled, unit-length; empty when not initialized or the run fails
    std::vector<float> embed(const std::string& text) const override;

    std::string name() const override { return "minilm"; }

    bool ready() const { return m_session != nullptr; }

private:
    enum class Feed { Ids, Mask, TypeIds };

    struct BoundInput {
        std::string name;
        Feed feed;
    };

    WordPieceTokenizer m_vocab;
    size_t m_seq_cap = 256;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "docintel"};
    std::unique_ptr<Ort::Session> m_session;
    std::vector<BoundInput> m_inputs;
    std::string m_hidden_state;

    bool bind_io();

    static std::vector<float> mean_pool(const float* hidden, size_t tokens, size_t width);
};
