#include "persona/PersonaEmbedder.hpp"

#include <stdexcept>

namespace persona {

PersonaVector embed_persona(const emb::Embedder& embedder,
                            const std::string& description,
                            const std::string& job) {
    PersonaVector pv;
    pv.values = embedder.embed(description + " " + job);
    if (pv.values.empty()) {
        throw std::runtime_error("persona embedding is empty (embedding model not initialized?)");
    }
    return pv;
}

}  // namespace persona
