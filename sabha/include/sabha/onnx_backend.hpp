#pragma once
// ONNX backend: sentence encoder on ONNX Runtime
//
// - WordPiece tokenization from a vocab.txt
// - Mean pooling with attention mask weighting
// - Pre-pooled [batch, hidden] outputs used as-is
//
// Built only with SABHA_WITH_ONNX.

#include "embedder.hpp"
#include <onnxruntime_cxx_api.h>
#include <array>
#include <fstream>
#include <unordered_map>

namespace sabha {

class WordPieceTokenizer {
public:
    bool load(const std::string& vocab_path) {
        std::ifstream file(vocab_path);
        if (!file) return false;

        vocab_.clear();
        std::string line;
        int64_t id = 0;
        while (std::getline(file, line)) {
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
                line.pop_back();
            }
            if (!line.empty()) vocab_[line] = id;
            id++;
        }

        cls_id_ = get_id("[CLS]");
        sep_id_ = get_id("[SEP]");
        pad_id_ = std::max<int64_t>(get_id("[PAD]"), 0);
        unk_id_ = get_id("[UNK]");
        return unk_id_ >= 0;
    }

    struct Encoded {
        std::vector<int64_t> input_ids;
        std::vector<int64_t> attention_mask;
        std::vector<int64_t> token_type_ids;
    };

    Encoded encode(const std::string& text, size_t max_length) const {
        std::vector<int64_t> tokens;
        if (cls_id_ >= 0) tokens.push_back(cls_id_);

        for (const auto& word : split(text)) {
            for (int64_t tok : tokenize_word(word)) {
                if (tokens.size() >= max_length - 1) break;
                tokens.push_back(tok);
            }
            if (tokens.size() >= max_length - 1) break;
        }
        if (sep_id_ >= 0) tokens.push_back(sep_id_);

        Encoded out;
        out.input_ids = tokens;
        out.attention_mask.assign(tokens.size(), 1);
        out.token_type_ids.assign(tokens.size(), 0);
        while (out.input_ids.size() < max_length) {
            out.input_ids.push_back(pad_id_);
            out.attention_mask.push_back(0);
            out.token_type_ids.push_back(0);
        }
        return out;
    }

    int64_t get_id(const std::string& token) const {
        auto it = vocab_.find(token);
        return it != vocab_.end() ? it->second : -1;
    }

private:
    static std::vector<std::string> split(const std::string& text) {
        std::vector<std::string> words;
        std::string current;
        for (unsigned char c : text) {
            if (c < 0x80 && std::isspace(c)) {
                if (!current.empty()) { words.push_back(current); current.clear(); }
            } else if (c < 0x80 && std::ispunct(c)) {
                if (!current.empty()) { words.push_back(current); current.clear(); }
                words.emplace_back(1, static_cast<char>(c));
            } else {
                current += static_cast<char>(c < 0x80 ? std::tolower(c) : c);
            }
        }
        if (!current.empty()) words.push_back(current);
        return words;
    }

    // Greedy longest-match-first
    std::vector<int64_t> tokenize_word(const std::string& word) const {
        std::vector<int64_t> ids;
        size_t start = 0;
        while (start < word.size()) {
            size_t end = word.size();
            int64_t found = -1;
            while (start < end) {
                std::string piece = word.substr(start, end - start);
                if (start > 0) piece = "##" + piece;
                auto it = vocab_.find(piece);
                if (it != vocab_.end()) {
                    found = it->second;
                    break;
                }
                end--;
            }
            if (found < 0) return {unk_id_};
            ids.push_back(found);
            start = end;
        }
        return ids;
    }

    std::unordered_map<std::string, int64_t> vocab_;
    int64_t cls_id_ = -1;
    int64_t sep_id_ = -1;
    int64_t pad_id_ = 0;
    int64_t unk_id_ = -1;
};

class OnnxBackend : public EmbeddingBackend {
public:
    explicit OnnxBackend(const EmbedderConfig& config)
        : env_(ORT_LOGGING_LEVEL_WARNING, "sabha"), config_(config) {}

    // Load model and vocabulary; false with error() on failure
    bool load() {
        try {
            if (!tokenizer_.load(config_.vocab_path)) {
                error_ = "failed to load vocabulary from " + config_.vocab_path;
                return false;
            }

            Ort::SessionOptions opts;
            if (config_.num_threads > 0) opts.SetIntraOpNumThreads(config_.num_threads);
            opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
            session_ = std::make_unique<Ort::Session>(env_, config_.model_path.c_str(), opts);

            Ort::AllocatorWithDefaultOptions allocator;
            for (size_t i = 0; i < session_->GetInputCount(); ++i) {
                input_names_.push_back(session_->GetInputNameAllocated(i, allocator).get());
            }
            for (size_t i = 0; i < session_->GetOutputCount(); ++i) {
                output_names_.push_back(session_->GetOutputNameAllocated(i, allocator).get());
            }
            if (output_names_.empty()) {
                error_ = "model has no outputs";
                return false;
            }
            auto shape = session_->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
            hidden_dim_ = shape.empty() ? 0 : static_cast<size_t>(shape.back());

            for (const auto& n : input_names_) input_cstr_.push_back(n.c_str());
            for (const auto& n : output_names_) output_cstr_.push_back(n.c_str());

            ready_ = hidden_dim_ == config_.dimension;
            if (!ready_) {
                error_ = "model hidden size " + std::to_string(hidden_dim_) +
                         " does not match dimension " + std::to_string(config_.dimension);
            }
            return ready_;
        } catch (const Ort::Exception& e) {
            error_ = std::string("ONNX error: ") + e.what();
            return false;
        }
    }

    std::vector<float> embed(const std::string& text) override {
        if (!ready_) throw DegradedDependencyError("onnx backend not loaded: " + error_);
        try {
            return run(text);
        } catch (const Ort::Exception& e) {
            throw DegradedDependencyError(std::string("onnx inference: ") + e.what());
        }
    }

    size_t dimension() const override { return hidden_dim_; }
    bool ready() const override { return ready_; }
    std::string name() const override { return "onnx"; }
    const std::string& error() const { return error_; }

private:
    std::vector<float> run(const std::string& text) {
        const size_t seq_len = config_.max_seq_length;
        auto enc = tokenizer_.encode(text, seq_len);

        auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        std::array<int64_t, 2> shape = {1, static_cast<int64_t>(seq_len)};

        std::vector<Ort::Value> inputs;
        for (const auto& name : input_names_) {
            std::vector<int64_t>* src = nullptr;
            if (name == "input_ids") src = &enc.input_ids;
            else if (name == "attention_mask") src = &enc.attention_mask;
            else if (name == "token_type_ids") src = &enc.token_type_ids;
            else throw DegradedDependencyError("unsupported model input " + name);
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(
                memory_info, src->data(), src->size(), shape.data(), shape.size()));
        }

        auto outputs = session_->Run(
            Ort::RunOptions{nullptr},
            input_cstr_.data(), inputs.data(), inputs.size(),
            output_cstr_.data(), 1);

        auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* data = outputs[0].GetTensorMutableData<float>();

        std::vector<float> pooled(hidden_dim_, 0.0f);
        if (out_shape.size() == 2) {
            std::copy(data, data + hidden_dim_, pooled.begin());
        } else {
            size_t tokens = static_cast<size_t>(out_shape[1]);
            float mask_sum = 0.0f;
            for (size_t t = 0; t < tokens && t < enc.attention_mask.size(); ++t) {
                if (enc.attention_mask[t] == 0) continue;
                mask_sum += 1.0f;
                for (size_t d = 0; d < hidden_dim_; ++d) {
                    pooled[d] += data[t * hidden_dim_ + d];
                }
            }
            if (mask_sum > 0.0f) {
                for (float& x : pooled) x /= mask_sum;
            }
        }
        normalize(pooled);
        return pooled;
    }

    Ort::Env env_;
    EmbedderConfig config_;
    WordPieceTokenizer tokenizer_;
    std::unique_ptr<Ort::Session> session_;
    std::vector<std::string> input_names_;
    std::vector<std::string> output_names_;
    std::vector<const char*> input_cstr_;
    std::vector<const char*> output_cstr_;
    size_t hidden_dim_ = 0;
    bool ready_ = false;
    std::string error_;
};

} // namespace sabha
