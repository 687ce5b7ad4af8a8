#pragma once
#include <string>
#include <vector>

#include "emb/Embedder.hpp"

namespace persona {

struct PersonaVector {
    std::vector<float> values;
};

// "<description> <job>" through the embedder. Throws std::runtime_error if the
// embedder returns nothing (model not loaded).
PersonaVector embed_persona(const emb::Embedder& embedder,
                            const std::string& description,
                            const std::string& job);

}  // namespace persona
