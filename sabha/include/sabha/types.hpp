#pragma once
// Core types: the vocabulary of the council
//
// Agents speak in Signals. The coordinator answers with Decisions.
// Whatever is worth remembering becomes a MemoryRecord.

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace sabha {

// Default embedding dimension (all-MiniLM-L6-v2 compatible)
constexpr size_t DEFAULT_EMBED_DIM = 384;

// Timestamp as Unix millis
using Timestamp = int64_t;

constexpr Timestamp MILLIS_PER_DAY = 86400000;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Record id - 128-bit identifier rendered as a UUID
struct RecordId {
    uint64_t high = 0;
    uint64_t low = 0;

    static RecordId generate() {
        static std::random_device rd;
        static std::mt19937_64 gen(rd());
        static std::uniform_int_distribution<uint64_t> dis;
        return {dis(gen), dis(gen)};
    }

    bool nil() const { return high == 0 && low == 0; }

    bool operator==(const RecordId& other) const {
        return high == other.high && low == other.low;
    }

    bool operator!=(const RecordId& other) const {
        return !(*this == other);
    }

    bool operator<(const RecordId& other) const {
        return high < other.high || (high == other.high && low < other.low);
    }

    std::string to_string() const {
        char buf[37];
        snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                 (uint32_t)(high >> 32),
                 (uint16_t)(high >> 16),
                 (uint16_t)high,
                 (uint16_t)(low >> 48),
                 (unsigned long long)(low & 0xFFFFFFFFFFFFULL));
        return buf;
    }

    static std::optional<RecordId> parse(const std::string& s) {
        if (s.length() != 36) return std::nullopt;

        uint32_t a;
        unsigned int b, c, d;
        unsigned long long e;
        if (sscanf(s.c_str(), "%8x-%4x-%4x-%4x-%12llx", &a, &b, &c, &d, &e) != 5) {
            return std::nullopt;
        }
        RecordId id;
        id.high = ((uint64_t)a << 32) | ((uint64_t)(b & 0xFFFF) << 16) | (c & 0xFFFF);
        id.low = ((uint64_t)(d & 0xFFFF) << 48) | (e & 0xFFFFFFFFFFFFULL);
        return id;
    }
};

struct RecordIdHash {
    size_t operator()(const RecordId& id) const {
        return std::hash<uint64_t>{}(id.high) ^ (std::hash<uint64_t>{}(id.low) << 1);
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Enumerations
// ═══════════════════════════════════════════════════════════════════════════

enum class AgentCategory : uint8_t {
    SignalGeneration = 0,
    Timing = 1,
    RuleValidation = 2,
    Risk = 3,
    Execution = 4,
    Memory = 5,
    Service = 6,
    Coordination = 7,
};

enum class Liveness : uint8_t {
    Starting = 0,
    Active = 1,
    Degraded = 2,
    Stopped = 3,
    Errored = 4,
};

enum class EventKind : uint8_t {
    Signal = 0,
    Decision = 1,
    Outcome = 2,
};

enum class OutcomeLabel : uint8_t {
    Success = 0,
    Failure = 1,
    Neutral = 2,
    Pending = 3,
};

enum class SourceKind : uint8_t {
    Live = 0,
    Derived = 1,
    Simulated = 2,
};

enum class Action : uint8_t {
    Hold = 0,
    Buy = 1,
    Sell = 2,
};

enum class Verdict : uint8_t {
    Approved = 0,
    Rejected = 1,
    Deferred = 2,
};

inline const char* category_name(AgentCategory c) {
    switch (c) {
        case AgentCategory::SignalGeneration: return "signal_generation";
        case AgentCategory::Timing: return "timing";
        case AgentCategory::RuleValidation: return "rule_validation";
        case AgentCategory::Risk: return "risk";
        case AgentCategory::Execution: return "execution";
        case AgentCategory::Memory: return "memory";
        case AgentCategory::Service: return "service";
        case AgentCategory::Coordination: return "coordination";
    }
    return "unknown";
}

inline std::optional<AgentCategory> parse_category(const std::string& s) {
    for (uint8_t i = 0; i <= static_cast<uint8_t>(AgentCategory::Coordination); ++i) {
        auto c = static_cast<AgentCategory>(i);
        if (s == category_name(c)) return c;
    }
    return std::nullopt;
}

inline const char* liveness_name(Liveness l) {
    switch (l) {
        case Liveness::Starting: return "starting";
        case Liveness::Active: return "active";
        case Liveness::Degraded: return "degraded";
        case Liveness::Stopped: return "stopped";
        case Liveness::Errored: return "errored";
    }
    return "unknown";
}

inline const char* kind_name(EventKind k) {
    switch (k) {
        case EventKind::Signal: return "signal";
        case EventKind::Decision: return "decision";
        case EventKind::Outcome: return "outcome";
    }
    return "unknown";
}

inline std::optional<EventKind> parse_kind(const std::string& s) {
    if (s == "signal") return EventKind::Signal;
    if (s == "decision") return EventKind::Decision;
    if (s == "outcome") return EventKind::Outcome;
    return std::nullopt;
}

inline const char* outcome_name(OutcomeLabel o) {
    switch (o) {
        case OutcomeLabel::Success: return "success";
        case OutcomeLabel::Failure: return "failure";
        case OutcomeLabel::Neutral: return "neutral";
        case OutcomeLabel::Pending: return "pending";
    }
    return "unknown";
}

inline std::optional<OutcomeLabel> parse_outcome(const std::string& s) {
    if (s == "success") return OutcomeLabel::Success;
    if (s == "failure") return OutcomeLabel::Failure;
    if (s == "neutral") return OutcomeLabel::Neutral;
    if (s == "pending") return OutcomeLabel::Pending;
    return std::nullopt;
}

inline const char* source_name(SourceKind s) {
    switch (s) {
        case SourceKind::Live: return "live";
        case SourceKind::Derived: return "derived";
        case SourceKind::Simulated: return "simulated";
    }
    return "unknown";
}

inline std::optional<SourceKind> parse_source(const std::string& s) {
    if (s == "live") return SourceKind::Live;
    if (s == "derived") return SourceKind::Derived;
    if (s == "simulated") return SourceKind::Simulated;
    return std::nullopt;
}

inline const char* action_name(Action a) {
    switch (a) {
        case Action::Hold: return "hold";
        case Action::Buy: return "buy";
        case Action::Sell: return "sell";
    }
    return "unknown";
}

inline std::optional<Action> parse_action(const std::string& s) {
    if (s == "hold") return Action::Hold;
    if (s == "buy") return Action::Buy;
    if (s == "sell") return Action::Sell;
    return std::nullopt;
}

inline const char* verdict_name(Verdict v) {
    switch (v) {
        case Verdict::Approved: return "approved";
        case Verdict::Rejected: return "rejected";
        case Verdict::Deferred: return "deferred";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// Records
// ═══════════════════════════════════════════════════════════════════════════

// Free-form payload: strategy tags and numeric indicators
struct Payload {
    std::vector<std::string> tags;
    std::map<std::string, double> numbers;

    std::optional<double> number(const std::string& key) const {
        auto it = numbers.find(key);
        if (it == numbers.end()) return std::nullopt;
        return it->second;
    }

    bool operator==(const Payload& other) const {
        return tags == other.tags && numbers == other.numbers;
    }
};

// An agent's output for one tick. Immutable once emitted.
struct Signal {
    std::string id;
    std::string agent_id;
    Timestamp timestamp = 0;
    std::string symbol;
    Action action = Action::Hold;
    float confidence = 0.0f;
    float risk = 0.0f;
    Payload payload;
    SourceKind source = SourceKind::Live;
};

// Anything that flows through the output router
struct Event {
    EventKind kind = EventKind::Signal;
    std::string agent_id;
    AgentCategory category = AgentCategory::SignalGeneration;
    std::string ref_id;             // Signal id or decision id
    std::string symbol;
    Action action = Action::Hold;
    std::string summary;            // Empty: generated by the embedder
    float confidence = 0.0f;
    float risk = 0.0f;
    std::optional<OutcomeLabel> outcome;
    std::optional<Verdict> verdict;
    double pnl = 0.0;
    Payload payload;
    Timestamp timestamp = 0;
};

// A persisted unit of experience
struct MemoryRecord {
    RecordId id;
    std::vector<float> vector;
    std::string summary;
    std::string agent_id;
    EventKind kind = EventKind::Signal;
    float importance = 0.0f;
    Timestamp created = 0;
    std::optional<OutcomeLabel> outcome;
    std::string symbol;
    Payload payload;

    // Equality ignoring the generated id
    bool same_content(const MemoryRecord& other) const {
        return vector == other.vector && summary == other.summary &&
               agent_id == other.agent_id && kind == other.kind &&
               importance == other.importance && created == other.created &&
               outcome == other.outcome && symbol == other.symbol &&
               payload == other.payload;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Vector helpers
// ═══════════════════════════════════════════════════════════════════════════

inline float cosine(const std::vector<float>& a, const std::vector<float>& b) {
    size_t n = std::min(a.size(), b.size());
    float dot = 0.0f, norm_a = 0.0f, norm_b = 0.0f;
    for (size_t i = 0; i < n; ++i) {
        dot += a[i] * b[i];
        norm_a += a[i] * a[i];
        norm_b += b[i] * b[i];
    }
    float denom = std::sqrt(norm_a) * std::sqrt(norm_b);
    return denom > 0.0f ? dot / denom : 0.0f;
}

inline void normalize(std::vector<float>& v) {
    float norm = 0.0f;
    for (float x : v) norm += x * x;
    norm = std::sqrt(norm);
    if (norm > 0.0f) {
        for (float& x : v) x /= norm;
    }
}

inline bool all_finite(const std::vector<float>& v) {
    for (float x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

// CRC32 implementation (simple, no external deps)
inline uint32_t crc32(const uint8_t* data, size_t length, uint32_t seed = 0) {
    uint32_t crc = ~seed;
    for (size_t i = 0; i < length; ++i) {
        crc ^= data[i];
        for (int j = 0; j < 8; ++j) {
            crc = (crc >> 1) ^ (0xEDB88320 & -(crc & 1));
        }
    }
    return ~crc;
}

// 64-bit FNV-1a, stable across runs and platforms
inline uint64_t fnv1a(const std::string& s, uint64_t seed = 0xcbf29ce484222325ULL) {
    uint64_t h = seed;
    for (unsigned char c : s) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    return h;
}

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence: write temp → fsync → rename → fsync dir
// ═══════════════════════════════════════════════════════════════════════════

inline bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

template<typename Writer>
bool safe_save(const std::string& path, Writer&& write_fn) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) return false;

    bool ok = write_fn(f);
    if (ok && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0) {
        ok = true;
    } else {
        ok = false;
    }

    ::fclose(f);
    if (!ok) { ::remove(tmp.c_str()); return false; }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    fsync_dir(path);
    return true;
}

} // namespace sabha
