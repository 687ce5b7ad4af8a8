#pragma once
#include <string>
#include <vector>

namespace emb {

// Sentence embedding service. Loaded once, then shared read-only; embed()
// must give identical vectors for identical text.
class Embedder {
public:
    virtual ~Embedder() = default;
    virtual std::vector<float> embed(const std::string& text) const = 0;
};

}  // namespace emb
