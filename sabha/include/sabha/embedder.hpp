#pragma once
// Embedder: events becoming geometry
//
// Event → summary text → fixed-length unit vector.
// The primary backend (a sentence encoder) may be missing or fail at
// any time; the hashing backend always answers, at lower quality, so
// something searchable can still be persisted.

#include "errors.hpp"
#include "log.hpp"
#include "lru_cache.hpp"
#include "similarity.hpp"
#include "types.hpp"
#include <atomic>
#include <cctype>
#include <memory>
#include <string>
#include <vector>

namespace sabha {

// ═══════════════════════════════════════════════════════════════════════════
// Text
// ═══════════════════════════════════════════════════════════════════════════

class TextPreprocessor {
public:
    // Control characters become spaces, runs of spaces collapse, ends trimmed
    std::string normalize(const std::string& text) const {
        std::string collapsed;
        collapsed.reserve(text.size());
        bool last_space = true;
        for (unsigned char c : text) {
            bool space = c == ' ' || c == '\t' || c == '\n' || c == '\r' || c < 0x20;
            if (space) {
                if (!last_space) {
                    collapsed += ' ';
                    last_space = true;
                }
            } else {
                collapsed += static_cast<char>(c);
                last_space = false;
            }
        }
        if (!collapsed.empty() && collapsed.back() == ' ') collapsed.pop_back();
        return collapsed;
    }

    // Lowercase (ASCII only, preserve unicode)
    std::string lowercase(const std::string& text) const {
        std::string result = text;
        for (char& c : result) {
            if (c >= 'A' && c <= 'Z') c = c - 'A' + 'a';
        }
        return result;
    }

    std::string clean(const std::string& text) const {
        return lowercase(normalize(text));
    }
};

inline std::string fixed2(double v) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

// Text form of an event, used when the event carries no summary
inline std::string summarize(const Event& e) {
    std::string s;
    switch (e.kind) {
        case EventKind::Signal:
            s = "signal from " + e.agent_id + " (" + category_name(e.category) + "): " +
                action_name(e.action) + " " + e.symbol +
                " confidence " + fixed2(e.confidence) + " risk " + fixed2(e.risk);
            break;
        case EventKind::Decision:
            s = "decision " + std::string(action_name(e.action)) + " " + e.symbol +
                " consensus " + fixed2(e.confidence) + " risk " + fixed2(e.risk);
            if (e.verdict) s += std::string(" verdict ") + verdict_name(*e.verdict);
            break;
        case EventKind::Outcome:
            s = "outcome " + std::string(e.outcome ? outcome_name(*e.outcome) : "pending") +
                " for " + action_name(e.action) + " " + e.symbol + " pnl " + fixed2(e.pnl);
            break;
    }
    if (!e.payload.tags.empty()) {
        s += " tags";
        for (const auto& t : e.payload.tags) s += " " + t;
    }
    return TextPreprocessor().clean(s);
}

// ═══════════════════════════════════════════════════════════════════════════
// Backends
// ═══════════════════════════════════════════════════════════════════════════

class EmbeddingBackend {
public:
    virtual ~EmbeddingBackend() = default;

    // Throws DegradedDependencyError when the backend cannot answer
    virtual std::vector<float> embed(const std::string& text) = 0;

    virtual size_t dimension() const = 0;
    virtual bool ready() const = 0;
    virtual std::string name() const = 0;
};

// Feature hashing over unigrams and bigrams. Deterministic across runs
// and platforms; texts sharing words land near each other.
class HashBackend : public EmbeddingBackend {
public:
    explicit HashBackend(size_t dimension = DEFAULT_EMBED_DIM) : dimension_(dimension) {}

    std::vector<float> embed(const std::string& text) override {
        std::vector<float> v(dimension_, 0.0f);
        auto words = split(text);

        auto add = [&](const std::string& feature, float weight) {
            uint64_t h = fnv1a(feature);
            size_t bucket = static_cast<size_t>(h % dimension_);
            float sign = ((h >> 63) & 1) ? -1.0f : 1.0f;
            v[bucket] += sign * weight;
        };

        for (size_t i = 0; i < words.size(); ++i) {
            add(words[i], 1.0f);
            if (i + 1 < words.size()) add(words[i] + " " + words[i + 1], 0.5f);
        }
        if (words.empty()) add(text, 1.0f);

        normalize(v);
        return v;
    }

    size_t dimension() const override { return dimension_; }
    bool ready() const override { return true; }
    std::string name() const override { return "hash"; }

private:
    static std::vector<std::string> split(const std::string& text) {
        std::vector<std::string> words;
        std::string current;
        for (unsigned char c : text) {
            if (std::isalnum(c) || c == '_' || c == '.' || c >= 0x80) {
                current += static_cast<char>(std::tolower(c));
            } else if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        }
        if (!current.empty()) words.push_back(current);
        return words;
    }

    size_t dimension_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Embedder
// ═══════════════════════════════════════════════════════════════════════════

struct EmbedderConfig {
    size_t dimension = DEFAULT_EMBED_DIM;
    std::string backend = "hash";     // "onnx" or "hash"
    std::string model_path;
    std::string vocab_path;
    size_t max_seq_length = 128;
    int num_threads = 0;
    size_t cache_size = 10000;
};

struct Embedding {
    std::vector<float> vector;
    std::string summary;
    std::string backend;
    bool degraded = false;    // Produced by the hashing fallback
};

struct EmbedderStatus {
    std::string primary;      // Empty when none configured
    bool primary_ready = false;
    bool degraded = false;
    uint64_t embeddings = 0;
    uint64_t fallbacks = 0;
    uint64_t cache_hits = 0;
    size_t dimension = 0;
};

class Embedder {
public:
    explicit Embedder(EmbedderConfig config, std::unique_ptr<EmbeddingBackend> primary = nullptr)
        : config_(std::move(config)),
          primary_(std::move(primary)),
          fallback_(config_.dimension),
          cache_(config_.cache_size)
    {
        if (primary_ && primary_->dimension() != config_.dimension) {
            log_warn("Embedder", "backend_rejected",
                     primary_->name() + " produces dimension " +
                     std::to_string(primary_->dimension()));
            primary_.reset();
        }
        degraded_ = !primary_ || !primary_->ready();
    }

    // Embed an event. Never throws on backend failure; throws
    // ValidationError when the event has no text form.
    Embedding embed(const Event& event) {
        std::string summary = event.summary.empty()
            ? summarize(event)
            : TextPreprocessor().clean(event.summary);
        return embed_text(summary);
    }

    Embedding embed_text(const std::string& text) {
        std::string summary = TextPreprocessor().clean(text);
        if (summary.empty()) {
            throw ValidationError("cannot embed an empty summary");
        }
        ++embeddings_;

        if (auto cached = cache_.get(summary)) {
            ++cache_hits_;
            return *cached;
        }

        Embedding out;
        out.summary = summary;

        if (primary_ && primary_->ready()) {
            try {
                std::vector<float> v = primary_->embed(summary);
                if (v.size() != config_.dimension || !all_finite(v)) {
                    throw DegradedDependencyError("backend returned a malformed vector");
                }
                normalize(v);
                out.vector = std::move(v);
                out.backend = primary_->name();
                mark_healthy();
                cache_.put(summary, out);
                return out;
            } catch (const std::exception& e) {
                mark_degraded(e.what());
            }
        } else {
            mark_degraded(primary_ ? "primary backend not ready" : "no primary backend");
        }

        // Fallback results are not cached so a recovered backend takes over
        out.vector = fallback_.embed(summary);
        out.backend = fallback_.name();
        out.degraded = true;
        ++fallbacks_;
        return out;
    }

    // Nearest neighbours from the attached similarity source
    std::vector<Neighbor> search(const std::vector<float>& vector, size_t k,
                                 const RecordFilter& filter = {}) const {
        if (!source_ || k == 0) return {};
        return source_->search(vector, k, filter);
    }

    void attach(const SimilaritySource* source) { source_ = source; }

    size_t dimension() const { return config_.dimension; }
    bool degraded() const { return degraded_; }

    EmbedderStatus status() const {
        EmbedderStatus s;
        s.primary = primary_ ? primary_->name() : "";
        s.primary_ready = primary_ && primary_->ready();
        s.degraded = degraded_;
        s.embeddings = embeddings_;
        s.fallbacks = fallbacks_;
        s.cache_hits = cache_hits_;
        s.dimension = config_.dimension;
        return s;
    }

private:
    // Logged on each transition into fallback, and once at startup
    void mark_degraded(const std::string& why) {
        bool was = degraded_.exchange(true);
        bool announced = announced_.exchange(true);
        if (!was || !announced) {
            log_warn("Embedder", "degraded", why + ", using hash fallback");
        }
    }

    void mark_healthy() {
        if (degraded_.exchange(false)) {
            log_info("Embedder", "recovered", primary_->name());
        }
    }

    EmbedderConfig config_;
    std::unique_ptr<EmbeddingBackend> primary_;
    HashBackend fallback_;
    LruCache<std::string, Embedding> cache_;
    const SimilaritySource* source_ = nullptr;

    std::atomic<bool> degraded_{false};
    std::atomic<bool> announced_{false};
    std::atomic<uint64_t> embeddings_{0};
    std::atomic<uint64_t> fallbacks_{0};
    std::atomic<uint64_t> cache_hits_{0};
};

} // namespace sabha
