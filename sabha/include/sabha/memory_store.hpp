#pragma once
// Memory Store: the only durable state
//
// Two correlated artifacts keyed by the same record id:
//   <dir>/metadata.db   sqlite table, one row per record
//   <dir>/vectors.idx   append-only vector log, rebuilt into HNSW at open
//
// Insert protocol (single writer):
//   BEGIN → INSERT row → append + fsync vector → COMMIT → publish
// Any failure before COMMIT rolls the row back and truncates the log.
// Readers only see records after publish, so a half-written record is
// never observable.

#include "errors.hpp"
#include "filter_index.hpp"
#include "hnsw.hpp"
#include "log.hpp"
#include "metadata_table.hpp"
#include "similarity.hpp"
#include "vector_log.hpp"
#include <cmath>
#include <filesystem>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <atomic>

namespace sabha {

enum class StoreMode {
    ReadWrite,
    ReadOnly,
};

// Points in the insert protocol where a test can inject a fault
enum class WriteStage {
    Metadata,   // Before the row is written
    Vector,     // Row written, vector not yet appended
    Commit,     // Vector durable, transaction not yet committed
};

inline const char* stage_name(WriteStage s) {
    switch (s) {
        case WriteStage::Metadata: return "metadata";
        case WriteStage::Vector: return "vector";
        case WriteStage::Commit: return "commit";
    }
    return "unknown";
}

struct MemoryStoreConfig {
    std::string dir = "sabha_memory";
    size_t dimension = DEFAULT_EMBED_DIM;
    HNSWConfig hnsw;
    size_t exact_scan_threshold = 2048;  // Filtered sets this small are scanned exactly
    size_t overfetch = 4;                // HNSW over-fetch factor under filters
    int64_t retention_days = 90;

    // Returns false to simulate a fault at the given stage
    std::function<bool(WriteStage)> write_probe;
};

struct ScoredRecord {
    MemoryRecord record;
    float distance = 0.0f;
    float similarity = 0.0f;
};

struct StoreStats {
    StoreMode mode = StoreMode::ReadOnly;
    std::string degraded_reason;
    size_t dimension = 0;
    size_t records = 0;
    size_t signals = 0;
    size_t decisions = 0;
    size_t outcomes = 0;
    size_t failures = 0;
    uint64_t inserts = 0;
    uint64_t failed_inserts = 0;
    uint64_t outcome_updates = 0;
    uint64_t swept = 0;
    size_t orphans_dropped = 0;
    size_t torn_bytes = 0;
};

class MemoryStore : public SimilaritySource {
public:
    explicit MemoryStore(MemoryStoreConfig config)
        : config_(std::move(config)), index_(config_.hnsw) {}

    ~MemoryStore() override { close(); }

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    // Open both artifacts and reconcile them. Never throws: any failure
    // leaves the store in read-only mode with a reason.
    bool open() {
        std::lock_guard write(write_mutex_);
        std::unique_lock state(state_mutex_);
        reset_state();
        mode_ = StoreMode::ReadOnly;
        degraded_reason_.clear();

        std::error_code ec;
        std::filesystem::create_directories(config_.dir, ec);
        if (ec) {
            return degrade("cannot create " + config_.dir + ": " + ec.message());
        }

        std::string error;
        if (!table_.open(config_.dir + "/metadata.db", error)) {
            return degrade(error);
        }
        if (!log_.open(config_.dir + "/vectors.idx", config_.dimension, error)) {
            table_.close();
            return degrade(error);
        }

        if (!reconcile(error)) {
            log_.close();
            table_.close();
            reset_state();
            return degrade(error);
        }

        mode_ = StoreMode::ReadWrite;
        log_info("MemoryStore", "opened", config_.dir,
                 {{"records", std::to_string(records_by_id_.size())},
                  {"dimension", std::to_string(config_.dimension)}});
        return true;
    }

    void close() {
        std::lock_guard write(write_mutex_);
        std::unique_lock state(state_mutex_);
        log_.close();
        table_.close();
        mode_ = StoreMode::ReadOnly;
        if (degraded_reason_.empty()) degraded_reason_ = "closed";
    }

    StoreMode mode() const {
        std::shared_lock lock(state_mutex_);
        return mode_;
    }

    bool writable() const { return mode() == StoreMode::ReadWrite; }

    std::string degraded_reason() const {
        std::shared_lock lock(state_mutex_);
        return degraded_reason_;
    }

    size_t dimension() const { return config_.dimension; }
    const MemoryStoreConfig& config() const { return config_; }

    // Fault hook; tests only
    void set_write_probe(std::function<bool(WriteStage)> probe) {
        std::lock_guard write(write_mutex_);
        config_.write_probe = std::move(probe);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Mutations (serialized on write_mutex_)
    // ═══════════════════════════════════════════════════════════════════════

    RecordId insert(MemoryRecord record) {
        validate(record);

        std::lock_guard write(write_mutex_);
        require_writable("insert");

        {
            std::shared_lock state(state_mutex_);
            do {
                record.id = RecordId::generate();
            } while (record.id.nil() || records_by_id_.count(record.id));
        }
        if (record.created == 0) record.created = now();
        const std::string id_text = record.id.to_string();

        auto fail = [&](const std::string& what) {
            ++failed_inserts_;
            log_error("MemoryStore", "insert_failed", what,
                      {{"record", id_text}, {"agent", record.agent_id}});
            throw DegradedDependencyError("memory insert " + id_text + " failed: " + what);
        };

        if (!probe(WriteStage::Metadata)) fail("fault before metadata write");
        if (!table_.begin()) fail("begin: " + table_.last_error());

        if (!table_.insert(record)) {
            std::string err = table_.last_error();
            table_.rollback();
            fail("metadata insert: " + err);
        }
        if (!probe(WriteStage::Vector)) {
            table_.rollback();
            fail("fault before vector append");
        }

        auto offset = log_.append(record.id, record.vector);
        if (!offset) {
            table_.rollback();
            fail("vector append");
        }
        if (!probe(WriteStage::Commit)) {
            undo_append(*offset, id_text);
            table_.rollback();
            fail("fault before commit");
        }
        if (!table_.commit()) {
            std::string err = table_.last_error();
            undo_append(*offset, id_text);
            table_.rollback();
            fail("commit: " + err);
        }

        RecordId id = record.id;
        {
            std::unique_lock state(state_mutex_);
            publish(std::move(record));
        }
        ++inserts_;
        return id;
    }

    // Set the outcome label. Returns false when the label was already set
    // to the same value (no write happens).
    bool update_outcome(const RecordId& id, OutcomeLabel label) {
        std::lock_guard write(write_mutex_);
        require_writable("update_outcome");

        uint32_t slot;
        {
            std::shared_lock state(state_mutex_);
            auto it = records_by_id_.find(id);
            if (it == records_by_id_.end()) {
                throw ValidationError("unknown record " + id.to_string());
            }
            slot = it->second;
            if (slots_[slot]->outcome == label) return false;
        }

        if (!table_.set_outcome(id, label)) {
            log_error("MemoryStore", "outcome_failed", table_.last_error(),
                      {{"record", id.to_string()}});
            throw DegradedDependencyError("outcome update for " + id.to_string() +
                                          " failed: " + table_.last_error());
        }

        std::unique_lock state(state_mutex_);
        auto& rec = *slots_[slot];
        if (rec.outcome) filters_.remove(slot, outcome_facet(*rec.outcome));
        rec.outcome = label;
        filters_.add(slot, outcome_facet(label));
        ++outcome_updates_;
        return true;
    }

    // Remove every record created before cutoff from both artifacts
    size_t sweep_expired(Timestamp cutoff) {
        std::lock_guard write(write_mutex_);
        require_writable("sweep_expired");

        std::vector<RecordId> expired;
        {
            std::shared_lock state(state_mutex_);
            for (const auto& slot : slots_) {
                if (slot && slot->created < cutoff) expired.push_back(slot->id);
            }
        }
        if (expired.empty()) return 0;

        if (!table_.begin()) {
            throw DegradedDependencyError("sweep begin: " + table_.last_error());
        }
        for (const auto& id : expired) {
            if (!table_.remove(id)) {
                std::string err = table_.last_error();
                table_.rollback();
                throw DegradedDependencyError("sweep delete " + id.to_string() + ": " + err);
            }
        }
        if (!table_.commit()) {
            std::string err = table_.last_error();
            table_.rollback();
            throw DegradedDependencyError("sweep commit: " + err);
        }

        // Survivors are renumbered from slot 0 and the index rebuilt
        std::vector<VectorEntry> live;
        {
            std::unique_lock state(state_mutex_);
            std::vector<MemoryRecord> kept;
            kept.reserve(records_by_id_.size() - expired.size());
            for (auto& slot : slots_) {
                if (slot && slot->created >= cutoff) kept.push_back(std::move(*slot));
            }
            reset_state();
            for (auto& r : kept) {
                live.push_back({r.id, r.vector});
                publish(std::move(r));
            }
        }

        // Rows are gone; leftover vectors are dropped as orphans at next open
        if (!log_.rewrite(live)) {
            log_warn("MemoryStore", "compaction_failed", config_.dir);
            if (!log_.is_open()) {
                std::unique_lock state(state_mutex_);
                degrade("vector log lost after compaction");
            }
        }
        swept_ += expired.size();
        log_info("MemoryStore", "swept", "",
                 {{"removed", std::to_string(expired.size())},
                  {"cutoff", std::to_string(cutoff)}});
        return expired.size();
    }

    // Sweep with the configured retention window
    size_t sweep_retention(Timestamp current = now()) {
        return sweep_expired(current - config_.retention_days * MILLIS_PER_DAY);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Reads (concurrent)
    // ═══════════════════════════════════════════════════════════════════════

    std::optional<MemoryRecord> get(const RecordId& id) const {
        std::shared_lock lock(state_mutex_);
        auto it = records_by_id_.find(id);
        if (it == records_by_id_.end()) return std::nullopt;
        return *slots_[it->second];
    }

    std::vector<ScoredRecord> query_similar(const std::vector<float>& vector, size_t k,
                                            const RecordFilter& filter = {}) const {
        if (vector.size() != config_.dimension) {
            throw ValidationError("query dimension " + std::to_string(vector.size()) +
                                  " does not match " + std::to_string(config_.dimension));
        }

        std::shared_lock lock(state_mutex_);
        std::vector<ScoredRecord> out;
        for (const auto& [slot, dist] : nearest(vector, k, filter)) {
            ScoredRecord sr;
            sr.record = *slots_[slot];
            sr.distance = dist;
            sr.similarity = 1.0f - dist;
            out.push_back(std::move(sr));
        }
        return out;
    }

    std::vector<Neighbor> search(const std::vector<float>& vector, size_t k,
                                 const RecordFilter& filter) const override {
        if (vector.size() != config_.dimension) return {};
        std::shared_lock lock(state_mutex_);
        std::vector<Neighbor> out;
        for (const auto& [slot, dist] : nearest(vector, k, filter)) {
            out.push_back({slots_[slot]->id, dist});
        }
        return out;
    }

    size_t size() const {
        std::shared_lock lock(state_mutex_);
        return records_by_id_.size();
    }

    bool empty() const { return size() == 0; }

    StoreStats stats() const {
        std::shared_lock lock(state_mutex_);
        StoreStats s;
        s.mode = mode_;
        s.degraded_reason = degraded_reason_;
        s.dimension = config_.dimension;
        s.records = records_by_id_.size();
        s.signals = filters_.count(kind_facet(EventKind::Signal));
        s.decisions = filters_.count(kind_facet(EventKind::Decision));
        s.outcomes = filters_.count(kind_facet(EventKind::Outcome));
        s.failures = filters_.count(outcome_facet(OutcomeLabel::Failure));
        s.inserts = inserts_;
        s.failed_inserts = failed_inserts_;
        s.outcome_updates = outcome_updates_;
        s.swept = swept_;
        s.orphans_dropped = orphans_dropped_;
        s.torn_bytes = torn_bytes_;
        return s;
    }

private:
    void validate(const MemoryRecord& r) const {
        if (r.vector.empty()) {
            throw ValidationError("record has an empty vector");
        }
        if (r.vector.size() != config_.dimension) {
            throw ValidationError("embedding dimension " + std::to_string(r.vector.size()) +
                                  " does not match configured " +
                                  std::to_string(config_.dimension));
        }
        if (!all_finite(r.vector)) {
            throw ValidationError("record vector has non-finite components");
        }
        for (const auto& [key, value] : r.payload.numbers) {
            if (!std::isfinite(value)) {
                throw ValidationError("payload number '" + key + "' is not finite");
            }
        }
        if (r.summary.empty()) {
            throw ValidationError("record has an empty summary");
        }
        if (r.agent_id.empty()) {
            throw ValidationError("record has no originating agent");
        }
        if (!(r.importance >= 0.0f && r.importance <= 1.0f)) {
            throw ValidationError("importance must lie in [0,1]");
        }
    }

    void require_writable(const char* op) const {
        std::shared_lock lock(state_mutex_);
        if (mode_ != StoreMode::ReadWrite) {
            throw DegradedDependencyError(std::string("memory store is read-only, ") + op +
                                          " refused: " + degraded_reason_);
        }
    }

    bool probe(WriteStage stage) const {
        if (!config_.write_probe) return true;
        bool ok = config_.write_probe(stage);
        if (!ok) {
            log_warn("MemoryStore", "fault_injected", stage_name(stage));
        }
        return ok;
    }

    void undo_append(uint64_t offset, const std::string& id_text) {
        if (!log_.truncate_to(offset)) {
            log_error("MemoryStore", "rollback_failed",
                      "vector entry left behind, dropped at next open",
                      {{"record", id_text}});
        }
    }

    bool degrade(const std::string& reason) {
        mode_ = StoreMode::ReadOnly;
        degraded_reason_ = reason;
        log_error("MemoryStore", "degraded", reason, {{"dir", config_.dir}});
        return false;
    }

    void reset_state() {
        slots_.clear();
        records_by_id_.clear();
        index_.clear();
        filters_.clear();
    }

    // Align the two artifacts. Caller holds both locks.
    bool reconcile(std::string& error) {
        ReplayResult replay = log_.replay();
        torn_bytes_ = replay.torn_bytes;
        if (replay.torn_bytes > 0) {
            log_warn("MemoryStore", "torn_tail", "truncated incomplete vector entry",
                     {{"bytes", std::to_string(replay.torn_bytes)}});
        }

        std::unordered_map<RecordId, std::vector<float>, RecordIdHash> vectors;
        bool rewrite_log = false;
        for (auto& e : replay.entries) {
            // Later entries for the same id win; the earlier copy is dead weight
            if (vectors.count(e.id)) rewrite_log = true;
            vectors[e.id] = std::move(e.vector);
        }

        std::vector<std::string> rejected;
        auto rows = table_.load_all(&rejected);

        std::vector<RecordId> rows_without_vector;
        for (auto& r : rows) {
            auto it = vectors.find(r.id);
            if (it == vectors.end()) {
                rows_without_vector.push_back(r.id);
                continue;
            }
            r.vector = std::move(it->second);
            vectors.erase(it);
            publish(std::move(r));
        }

        size_t orphans = rows_without_vector.size() + vectors.size() + rejected.size();
        if (!vectors.empty()) rewrite_log = true;

        if (!rows_without_vector.empty() || !rejected.empty()) {
            if (!table_.begin()) {
                error = "reconcile begin: " + table_.last_error();
                return false;
            }
            for (const auto& id : rows_without_vector) {
                if (!table_.remove(id)) {
                    error = "reconcile delete: " + table_.last_error();
                    table_.rollback();
                    return false;
                }
            }
            for (const auto& text : rejected) {
                auto id = RecordId::parse(text);
                if (id && !table_.remove(*id)) {
                    error = "reconcile delete: " + table_.last_error();
                    table_.rollback();
                    return false;
                }
            }
            if (!table_.commit()) {
                error = "reconcile commit: " + table_.last_error();
                table_.rollback();
                return false;
            }
        }

        if (rewrite_log) {
            std::vector<VectorEntry> live;
            for (const auto& slot : slots_) {
                if (slot) live.push_back({slot->id, slot->vector});
            }
            if (!log_.rewrite(live)) {
                error = "vector log compaction failed";
                return false;
            }
        }

        orphans_dropped_ = orphans;
        if (orphans > 0) {
            log_warn("MemoryStore", "orphans_dropped", "",
                     {{"count", std::to_string(orphans)}});
        }
        return true;
    }

    // Caller holds state_mutex_ exclusively
    void publish(MemoryRecord record) {
        uint32_t slot = static_cast<uint32_t>(slots_.size());
        records_by_id_[record.id] = slot;
        filters_.add(slot, facets_of(record));
        index_.insert(slot, record.vector);
        slots_.push_back(std::move(record));
    }

    // Caller holds state_mutex_ (shared is enough)
    std::vector<std::pair<uint32_t, float>> nearest(const std::vector<float>& vector, size_t k,
                                                    const RecordFilter& filter) const {
        std::vector<std::pair<uint32_t, float>> out;
        if (k == 0 || records_by_id_.empty()) return out;

        auto passes_time = [&](uint32_t slot) {
            return filter.created_after == 0 || slots_[slot]->created >= filter.created_after;
        };

        if (filter.uses_bitmaps()) {
            Bitmap candidates = filters_.candidates(filter);
            uint64_t n = roaring_bitmap_get_cardinality(candidates.get());
            if (n == 0) return out;

            if (n <= config_.exact_scan_threshold) {
                for (uint32_t slot : bitmap_to_vector(candidates.get())) {
                    if (!passes_time(slot)) continue;
                    if (auto d = index_.distance_to(vector, slot)) out.emplace_back(slot, *d);
                }
                std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
                    return a.second < b.second || (a.second == b.second && a.first < b.first);
                });
                if (out.size() > k) out.resize(k);
                return out;
            }

            size_t fetch = k * std::max<size_t>(config_.overfetch, 1);
            while (true) {
                out.clear();
                for (const auto& [slot, d] : index_.search(vector, fetch)) {
                    if (!roaring_bitmap_contains(candidates.get(), slot)) continue;
                    if (!passes_time(slot)) continue;
                    out.emplace_back(slot, d);
                    if (out.size() == k) break;
                }
                if (out.size() >= k || fetch >= index_.size()) break;
                fetch *= 2;
            }
            return out;
        }

        size_t fetch = filter.created_after == 0 ? k : k * std::max<size_t>(config_.overfetch, 1);
        while (true) {
            out.clear();
            for (const auto& [slot, d] : index_.search(vector, fetch)) {
                if (!passes_time(slot)) continue;
                out.emplace_back(slot, d);
                if (out.size() == k) break;
            }
            if (out.size() >= k || fetch >= index_.size()) break;
            fetch *= 2;
        }
        return out;
    }

    MemoryStoreConfig config_;

    mutable std::mutex write_mutex_;          // Single writer
    mutable std::shared_mutex state_mutex_;   // Published state

    MetadataTable table_;
    VectorLog log_;

    std::vector<std::optional<MemoryRecord>> slots_;
    std::unordered_map<RecordId, uint32_t, RecordIdHash> records_by_id_;
    HNSWIndex index_;
    FilterIndex filters_;

    StoreMode mode_ = StoreMode::ReadOnly;
    std::string degraded_reason_ = "not opened";

    std::atomic<uint64_t> inserts_{0};
    std::atomic<uint64_t> failed_inserts_{0};
    std::atomic<uint64_t> outcome_updates_{0};
    std::atomic<uint64_t> swept_{0};
    size_t orphans_dropped_ = 0;
    size_t torn_bytes_ = 0;
};

} // namespace sabha
