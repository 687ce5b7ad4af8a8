#include "emb/MiniLmEmbedder.hpp"
#include <cmath>
#include <iostream>

namespace emb {

bool MiniLmEmbedder::init(const std::string& model_path, const std::string& vocab_path) {
    if (!m_tok.load_vocab(vocab_path)) {
        std::cerr << "MiniLmEmbedder: failed to load vocab: " << vocab_path << "\n";
        return false;
    }

    try {
        m_opts.SetIntraOpNumThreads(1);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

#ifdef _WIN32
        std::wstring wmodel(model_path.begin(), model_path.end());
        m_session = std::make_unique<Ort::Session>(m_env, wmodel.c_str(), m_opts);
#else
        m_session = std::make_unique<Ort::Session>(m_env, model_path.c_str(), m_opts);
#endif

        Ort::AllocatorWithDefaultOptions allocator;
        m_out_name = m_session->GetOutputNameAllocated(0, allocator).get();

        // sentence-transformers exports: input_ids, attention_mask, token_type_ids
        if (m_session->GetInputCount() < 3) {
            std::cerr << "MiniLmEmbedder: model has " << m_session->GetInputCount()
                      << " inputs, expected 3\n";
            m_session.reset();
            return false;
        }
        m_in_ids = m_session->GetInputNameAllocated(0, allocator).get();
        m_in_mask = m_session->GetInputNameAllocated(1, allocator).get();
        m_in_type = m_session->GetInputNameAllocated(2, allocator).get();

        return true;
    } catch (const Ort::Exception& e) {
        std::cerr << "MiniLmEmbedder ORT exception: " << e.what() << "\n";
        std::cerr << "model_path=" << model_path << "\n";
        m_session.reset();
        return false;
    }
}

static void l2_normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return;
    const double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
}

std::vector<float> MiniLmEmbedder::embed(const std::string& text) const {
    if (!m_session) return {};

    std::vector<int64_t> ids = m_tok.encode(text, m_max_len);
    const size_t seq_len = ids.size();

    std::vector<int64_t> mask(seq_len, 1);
    std::vector<int64_t> type_ids(seq_len, 0);
    std::vector<int64_t> shape{1, (int64_t)seq_len};

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    Ort::Value in_vals[3] = {
        Ort::Value::CreateTensor<int64_t>(mem, ids.data(), ids.size(), shape.data(), shape.size()),
        Ort::Value::CreateTensor<int64_t>(mem, mask.data(), mask.size(), shape.data(), shape.size()),
        Ort::Value::CreateTensor<int64_t>(mem, type_ids.data(), type_ids.size(), shape.data(), shape.size())
    };
    const char* in_names[3] = { m_in_ids.c_str(), m_in_mask.c_str(), m_in_type.c_str() };
    const char* out_names[1] = { m_out_name.c_str() };

    auto outs = m_session->Run(Ort::RunOptions{nullptr}, in_names, in_vals, 3, out_names, 1);

    const Ort::Value& out = outs[0];
    const auto shp = out.GetTensorTypeAndShapeInfo().GetShape(); // [1, seq_len, hidden]
    if (shp.size() != 3 || shp[1] != (int64_t)seq_len) return {};

    const size_t hidden = (size_t)shp[2];
    const float* data = out.GetTensorData<float>();

    // mean over token rows; every token is unmasked for a single sequence
    std::vector<float> pooled(hidden, 0.0f);
    for (size_t t = 0; t < seq_len; ++t) {
        const float* row = data + t * hidden;
        for (size_t j = 0; j < hidden; ++j) pooled[j] += row[j];
    }
    const float inv = 1.0f / (float)seq_len;
    for (float& x : pooled) x *= inv;

    l2_normalize(pooled);
    return pooled;
}

}  // namespace emb
