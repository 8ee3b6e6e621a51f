#pragma once
// Output Router: everything agents say passes through here
//
// For each event:
//   1. fan out to subscribers whose interests include the event's category
//   2. score importance (kind, agent significance, novelty vs memory)
//   3. at or above threshold: embed and insert as a MemoryRecord
// Memory failures are logged and never hold back delivery. This is the
// only code path that writes to the memory store.

#include "embedder.hpp"
#include "memory_store.hpp"
#include "scoring.hpp"
#include "supervisor.hpp"
#include <chrono>
#include <cmath>
#include <map>
#include <set>

namespace sabha {

struct Subscription {
    std::string agent_id;
    std::set<AgentCategory> interests;
};

struct OutputRouterConfig {
    ImportanceConfig importance;
    std::chrono::milliseconds delivery_timeout{250};
    float default_significance = 0.5f;
};

struct IngestReport {
    float importance = 0.0f;
    float novelty = 1.0f;
    bool admitted = false;       // importance >= threshold
    bool persisted = false;
    std::optional<RecordId> record_id;
    std::string persist_error;

    size_t subscribers = 0;
    size_t delivered = 0;
    size_t failed = 0;
    size_t timed_out = 0;        // Still in flight when the wait ended
    size_t skipped = 0;          // Queued behind earlier work, not waited on

    // Memory learning should wait: the event deserved storage but did not get it
    bool persist_pending() const { return admitted && !persisted; }
};

struct OutputRouterStats {
    uint64_t events = 0;
    uint64_t admitted = 0;
    uint64_t persisted = 0;
    uint64_t persist_failures = 0;
    uint64_t deliveries = 0;
    uint64_t delivery_failures = 0;
    uint64_t delivery_timeouts = 0;
    uint64_t deliveries_behind = 0;
    uint64_t outcome_annotations = 0;
};

class OutputRouter {
public:
    OutputRouter(OutputRouterConfig config, Embedder& embedder, MemoryStore& store,
                 EventDelivery* delivery = nullptr)
        : config_(std::move(config)), embedder_(embedder), store_(store), delivery_(delivery) {}

    void subscribe(Subscription sub) {
        std::lock_guard lock(mutex_);
        subscriptions_.push_back(std::move(sub));
    }

    void set_significance(const std::string& agent_id, float significance) {
        std::lock_guard lock(mutex_);
        significance_[agent_id] = std::clamp(significance, 0.0f, 1.0f);
    }

    // Matching subscribers, never the source itself
    std::vector<std::string> subscribers_for(AgentCategory category,
                                             const std::string& source) const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> out;
        for (const auto& sub : subscriptions_) {
            if (sub.agent_id == source) continue;
            if (sub.interests.count(category)) out.push_back(sub.agent_id);
        }
        return out;
    }

    // Delivery waits end after delivery_timeout or at wait_until, whichever
    // comes first. A subscriber with work already queued is not waited on.
    IngestReport ingest(const std::string& agent_id, Event event,
                        std::optional<Clock::time_point> wait_until = std::nullopt) {
        if (event.agent_id.empty()) event.agent_id = agent_id;
        if (event.timestamp == 0) event.timestamp = now();

        IngestReport report;
        auto deadline = Clock::now() + config_.delivery_timeout;
        if (wait_until) deadline = std::min(deadline, *wait_until);

        // Deliveries start first and run while memory work happens
        struct InFlight {
            std::string agent_id;
            std::future<bool> done;
            bool behind;
        };
        std::vector<InFlight> pending;
        if (delivery_) {
            for (const auto& sub : subscribers_for(event.category, agent_id)) {
                ++report.subscribers;
                try {
                    bool behind = delivery_->queued(sub) > 0;
                    pending.push_back({sub, delivery_->deliver(sub, event), behind});
                } catch (const Error& e) {
                    ++report.failed;
                    log_warn("OutputRouter", "delivery_failed", e.what(),
                             {{"agent", sub}, {"ref", event.ref_id}});
                }
            }
        }

        remember(event, report);

        for (auto& f : pending) {
            if (f.behind && f.done.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                ++report.skipped;
                log_debug("OutputRouter", "delivery_queued", "subscriber has earlier work",
                          {{"agent", f.agent_id}, {"ref", event.ref_id}});
                continue;
            }
            if (f.done.wait_until(deadline) != std::future_status::ready) {
                ++report.timed_out;
                log_warn("OutputRouter", "delivery_slow", "subscriber still consuming",
                         {{"agent", f.agent_id}, {"ref", event.ref_id}});
                continue;
            }
            try {
                if (f.done.get()) ++report.delivered;
                else ++report.failed;
            } catch (const std::future_error& e) {
                ++report.failed;
                log_warn("OutputRouter", "delivery_failed", e.what(), {{"agent", f.agent_id}});
            }
        }

        {
            std::lock_guard lock(mutex_);
            ++stats_.events;
            if (report.admitted) ++stats_.admitted;
            if (report.persisted) ++stats_.persisted;
            if (report.persist_pending()) ++stats_.persist_failures;
            stats_.deliveries += report.delivered;
            stats_.delivery_failures += report.failed;
            stats_.delivery_timeouts += report.timed_out;
            stats_.deliveries_behind += report.skipped;
        }
        return report;
    }

    // The only way an outcome label reaches stored memory. Idempotent.
    bool annotate_outcome(const RecordId& id, OutcomeLabel label) {
        try {
            bool changed = store_.update_outcome(id, label);
            if (changed) {
                std::lock_guard lock(mutex_);
                ++stats_.outcome_annotations;
            }
            return true;
        } catch (const Error& e) {
            log_warn("OutputRouter", "annotate_failed", e.what(),
                     {{"record", id.to_string()}, {"label", outcome_name(label)}});
            return false;
        }
    }

    OutputRouterStats stats() const {
        std::lock_guard lock(mutex_);
        return stats_;
    }

    const OutputRouterConfig& config() const { return config_; }

    // False while the store refuses writes: no new long-term memory
    bool memory_writable() const { return store_.writable(); }

private:
    float significance_of(const std::string& agent_id) const {
        std::lock_guard lock(mutex_);
        auto it = significance_.find(agent_id);
        return it != significance_.end() ? it->second : config_.default_significance;
    }

    void remember(const Event& event, IngestReport& report) {
        Embedding emb;
        try {
            emb = embedder_.embed(event);
        } catch (const ValidationError& e) {
            report.persist_error = e.what();
            log_warn("OutputRouter", "event_rejected", e.what(),
                     {{"agent", event.agent_id}, {"ref", event.ref_id}});
            return;
        }

        std::optional<float> nearest;
        auto hits = store_.search(emb.vector, 1, RecordFilter{});
        if (!hits.empty()) nearest = hits.front().distance;

        report.novelty = novelty_from_distance(nearest);
        report.importance = importance(event.kind, significance_of(event.agent_id),
                                       report.novelty, config_.importance);
        report.admitted = report.importance >= config_.importance.threshold;
        if (!report.admitted) return;

        MemoryRecord record;
        record.vector = std::move(emb.vector);
        record.summary = emb.summary;
        record.agent_id = event.agent_id;
        record.kind = event.kind;
        record.importance = report.importance;
        record.created = event.timestamp;
        record.symbol = event.symbol;
        record.payload = event.payload;
        if (event.kind == EventKind::Decision) {
            record.outcome = OutcomeLabel::Pending;
        } else if (event.kind == EventKind::Outcome) {
            record.outcome = event.outcome.value_or(OutcomeLabel::Neutral);
        }
        for (auto it = record.payload.numbers.begin(); it != record.payload.numbers.end();) {
            if (std::isfinite(it->second)) {
                ++it;
                continue;
            }
            log_warn("OutputRouter", "payload_number_dropped", "not finite",
                     {{"agent", event.agent_id}, {"key", it->first}, {"ref", event.ref_id}});
            it = record.payload.numbers.erase(it);
        }
        if (!event.ref_id.empty()) record.payload.tags.push_back("ref:" + event.ref_id);
        if (emb.degraded) record.payload.tags.push_back("embedding:fallback");

        try {
            report.record_id = store_.insert(std::move(record));
            report.persisted = true;
        } catch (const Error& e) {
            report.persist_error = e.what();
            log_warn("OutputRouter", "persist_failed", e.what(),
                     {{"agent", event.agent_id}, {"kind", kind_name(event.kind)},
                      {"ref", event.ref_id}});
        }
    }

    OutputRouterConfig config_;
    Embedder& embedder_;
    MemoryStore& store_;
    EventDelivery* delivery_;

    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
    std::map<std::string, float> significance_;
    OutputRouterStats stats_;
};

} // namespace sabha
