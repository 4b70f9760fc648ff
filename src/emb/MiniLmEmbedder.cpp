#include "emb/MiniLmEmbedder.hpp"
#include <algorithm>
#include <iostream>

bool MiniLmEmbedder::init(const std::string& model_path, const std::string& vocab_path, size_t max_len) {
    m_session.reset();
    if (!m_vocab.load_vocab(vocab_path)) {
        std::cerr << "MiniLmEmbedder: cannot read vocab " << vocab_path << "\n";
        return false;
    }
    m_seq_cap = std::max<size_t>(max_len, 8);

    try {
        Ort::SessionOptions options;
        options.SetIntraOpNumThreads(1);
        options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

#ifdef _WIN32
        const std::wstring path(model_path.begin(), model_path.end());
#else
        const std::string& path = model_path;
#endif
        m_session = std::make_unique<Ort::Session>(m_env, path.c_str(), options);
    } catch (const Ort::Exception& e) {
        std::cerr << "MiniLmEmbedder: cannot load model " << model_path << ": " << e.what() << "\n";
        m_session.reset();
        return false;
    }

    if (!bind_io()) {
        m_session.reset();
        return false;
    }
    return true;
}

bool MiniLmEmbedder::bind_io() {
    Ort::AllocatorWithDefaultOptions alloc;
    m_inputs.clear();

    bool has_ids = false;
    bool has_mask = false;
    for (size_t i = 0; i < m_session->GetInputCount(); ++i) {
        const std::string input = m_session->GetInputNameAllocated(i, alloc).get();
        if (input.find("input_ids") != std::string::npos) {
            m_inputs.push_back({input, Feed::Ids});
            has_ids = true;
        } else if (input.find("attention_mask") != std::string::npos) {
            m_inputs.push_back({input, Feed::Mask});
            has_mask = true;
        } else if (input.find("token_type_ids") != std::string::npos) {
            m_inputs.push_back({input, Feed::TypeIds});
        } else {
            std::cerr << "MiniLmEmbedder: unsupported model input '" << input << "'\n";
            return false;
        }
    }
    if (!has_ids || !has_mask) {
        std::cerr << "MiniLmEmbedder: model needs input_ids and attention_mask\n";
        return false;
    }
    if (m_session->GetOutputCount() == 0) {
        std::cerr << "MiniLmEmbedder: model has no outputs\n";
        return false;
    }
    m_hidden_state = m_session->GetOutputNameAllocated(0, alloc).get();
    return true;
}

std::vector<float> MiniLmEmbedder::mean_pool(const float* hidden, size_t tokens, size_t width) {
    std::vector<float> sum(width, 0.0f);
    if (tokens == 0) return sum;
    for (size_t row = 0; row < tokens; ++row) {
        const float* vec = hidden + row * width;
        for (size_t col = 0; col < width; ++col) sum[col] += vec[col];
    }
    const float scale = 1.0f / static_cast<float>(tokens);
    for (float& x : sum) x *= scale;
    return sum;
}

std::vector<float> MiniLmEmbedder::embed(const std::string& text) const {
    if (!ready()) return {};

    std::vector<int64_t> ids = m_vocab.encode(text, m_seq_cap);
    std::vector<int64_t> mask(ids.size(), 1);
    std::vector<int64_t> segments(ids.size(), 0);
    const std::vector<int64_t> dims{1, static_cast<int64_t>(ids.size())};

    try {
        const auto cpu = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        std::vector<Ort::Value> feeds;
        std::vector<const char*> feed_names;
        for (const BoundInput& in : m_inputs) {
            std::vector<int64_t>& buf = in.feed == Feed::Ids ? ids : (in.feed == Feed::Mask ? mask : segments);
            feeds.push_back(Ort::Value::CreateTensor<int64_t>(cpu, buf.data(), buf.size(), dims.data(), dims.size()));
            feed_names.push_back(in.name.c_str());
        }
        const char* fetch = m_hidden_state.c_str();

        std::vector<Ort::Value> result = m_session->Run(
            Ort::RunOptions{nullptr}, feed_names.data(), feeds.data(), feeds.size(), &fetch, 1);

        const std::vector<int64_t> shape = result.front().GetTensorTypeAndShapeInfo().GetShape();
        // expect [batch, tokens, width]
        if (shape.size() != 3 || shape[1] != dims[1]) {
            std::cerr << "MiniLmEmbedder: unexpected output rank\n";
            return {};
        }

        std::vector<float> vec = mean_pool(result.front().GetTensorData<float>(), ids.size(), static_cast<size_t>(shape[2]));
        docintel::l2_normalize(vec);
        return vec;
    } catch (const Ort::Exception& e) {
        std::cerr << "MiniLmEmbedder: run failed: " << e.what() << "\n";
        return {};
    }
}
