#pragma once

#include <string>
#include <vector>

namespace docintel {

// Frozen sentence encoder: text -> fixed-length vector.
// An empty vector means the backend could not produce one.
// Implementations must be safe to call concurrently through a const reference.
class Embedder {
public:
    virtual ~Embedder() = default;
    virtual std::vector<float> embed(const std::string& text) const = 0;
    virtual std::string name() const = 0;
};

float cosine(const std::vector<float>& a, const std::vector<float>& b);

void l2_normalize(std::vector<float>& v);

}  // namespace docintel
