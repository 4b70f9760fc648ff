#include "emb/HashEmbedder.hpp"
#include "text/TextUtil.hpp"
#include <cstdint>

uint64_t HashEmbedder::fnv1a(const std::string& s) {
    uint64_t h = 14695981039346656037ull;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ull;
    }
    return h;
}

std::vector<float> HashEmbedder::embed(const std::string& text) const {
    std::vector<float> v(m_dim, 0.0f);

    const auto terms = textutil::content_terms(text);
    const auto phrases = textutil::phrase_terms(terms);

    auto add = [&](const std::string& t, float w) {
        const uint64_t h = fnv1a(t);
        const size_t bucket = (size_t)(h % m_dim);
        const float sign = ((h >> 63) & 1u) ? -1.0f : 1.0f;
        v[bucket] += sign * w;
    };

    for (const auto& t : terms) add(t, 1.0f);
    for (const auto& p : phrases) add(p, 0.5f);

    docintel::l2_normalize(v);
    return v;
}
