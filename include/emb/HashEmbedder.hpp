#pragma once
#include "docintel/Embedder.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Feature-hashing bag of content terms and bigrams. Deterministic, model-free;
// used when no ONNX model is configured and as the encoder in tests.
class HashEmbedder final : public docintel::Embedder {
public:
    explicit HashEmbedder(size_t dim = 256) : m_dim(dim == 0 ? 1 : dim) {}

    std::vector<float> embed(const std::string& text) const override;

    std::string name() const override { return "hash"; }

    size_t dim() const { return m_dim; }

private:
    size_t m_dim;

    static uint64_t fnv1a(const std::string& s);
};
