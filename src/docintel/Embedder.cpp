#include "docintel/Embedder.hpp"

#include <cmath>
#include <numeric>

namespace docintel {

static double sum_of_squares(const std::vector<float>& v) {
    return std::inner_product(v.begin(), v.end(), v.begin(), 0.0);
}

float cosine(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || a.size() != b.size()) return 0.0f;

    const double norms = std::sqrt(sum_of_squares(a) * sum_of_squares(b));
    if (norms <= 0.0) return 0.0f;
    const double dot = std::inner_product(a.begin(), a.end(), b.begin(), 0.0);
    return static_cast<float>(dot / norms);
}

void l2_normalize(std::vector<float>& v) {
    const double length = std::sqrt(sum_of_squares(v));
    if (length <= 0.0) return;
    for (float& x : v) x = static_cast<float>(x / length);
}

}  // namespace docintel
