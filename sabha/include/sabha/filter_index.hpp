#pragma once
// Filter Index: roaring bitmaps over store slots
//
//   - String interning: each facet ("kind:signal", "agent:rsi") stored once
//   - Inverted index: facet_id -> RoaringBitmap of slots
//   - Forward index: slot -> [facet_ids] (for removal)
//
// Not internally synchronized; the memory store holds its state lock
// around every call.

#include "types.hpp"
#include <roaring/roaring.h>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace sabha {

struct BitmapDeleter {
    void operator()(roaring_bitmap_t* bm) const { roaring_bitmap_free(bm); }
};
using Bitmap = std::unique_ptr<roaring_bitmap_t, BitmapDeleter>;

inline Bitmap make_bitmap() { return Bitmap(roaring_bitmap_create()); }

inline std::vector<uint32_t> bitmap_to_vector(const roaring_bitmap_t* bm) {
    std::vector<uint32_t> out(roaring_bitmap_get_cardinality(bm));
    if (!out.empty()) roaring_bitmap_to_uint32_array(bm, out.data());
    return out;
}

// Query-side filter over records
struct RecordFilter {
    std::set<EventKind> kinds;               // Empty: any kind
    std::string agent_id;                    // Empty: any agent
    std::string symbol;                      // Empty: any symbol
    std::set<OutcomeLabel> exclude_outcomes;
    Timestamp created_after = 0;             // 0: no lower bound

    bool empty() const {
        return kinds.empty() && agent_id.empty() && symbol.empty() &&
               exclude_outcomes.empty() && created_after == 0;
    }

    bool uses_bitmaps() const {
        return !kinds.empty() || !agent_id.empty() || !symbol.empty() ||
               !exclude_outcomes.empty();
    }
};

inline std::string kind_facet(EventKind k) { return std::string("kind:") + kind_name(k); }
inline std::string agent_facet(const std::string& a) { return "agent:" + a; }
inline std::string symbol_facet(const std::string& s) { return "symbol:" + s; }
inline std::string outcome_facet(OutcomeLabel o) { return std::string("outcome:") + outcome_name(o); }

// Facets a record is indexed under
inline std::vector<std::string> facets_of(const MemoryRecord& r) {
    std::vector<std::string> f;
    f.push_back(kind_facet(r.kind));
    f.push_back(agent_facet(r.agent_id));
    if (!r.symbol.empty()) f.push_back(symbol_facet(r.symbol));
    if (r.outcome) f.push_back(outcome_facet(*r.outcome));
    return f;
}

class FilterIndex {
public:
    FilterIndex() : live_(make_bitmap()) {}

    FilterIndex(const FilterIndex&) = delete;
    FilterIndex& operator=(const FilterIndex&) = delete;

    // Intern a facet string, returns facet_id
    uint32_t intern(const std::string& facet) {
        auto it = string_to_id_.find(facet);
        if (it != string_to_id_.end()) return it->second;

        uint32_t id = static_cast<uint32_t>(id_to_string_.size());
        string_to_id_[facet] = id;
        id_to_string_.push_back(facet);
        postings_.push_back(make_bitmap());
        return id;
    }

    void add(uint32_t slot, const std::string& facet) {
        uint32_t facet_id = intern(facet);
        roaring_bitmap_add(postings_[facet_id].get(), slot);
        roaring_bitmap_add(live_.get(), slot);

        if (slot >= forward_.size()) forward_.resize(slot + 1);
        auto& fwd = forward_[slot];
        if (std::find(fwd.begin(), fwd.end(), facet_id) == fwd.end()) {
            fwd.push_back(facet_id);
        }
    }

    void add(uint32_t slot, const std::vector<std::string>& facets) {
        for (const auto& f : facets) add(slot, f);
    }

    void remove(uint32_t slot, const std::string& facet) {
        auto it = string_to_id_.find(facet);
        if (it == string_to_id_.end()) return;

        uint32_t facet_id = it->second;
        roaring_bitmap_remove(postings_[facet_id].get(), slot);
        if (slot < forward_.size()) {
            auto& fwd = forward_[slot];
            fwd.erase(std::remove(fwd.begin(), fwd.end(), facet_id), fwd.end());
        }
    }

    // Drop a slot entirely
    void remove_all(uint32_t slot) {
        roaring_bitmap_remove(live_.get(), slot);
        if (slot >= forward_.size()) return;
        for (uint32_t facet_id : forward_[slot]) {
            roaring_bitmap_remove(postings_[facet_id].get(), slot);
        }
        forward_[slot].clear();
    }

    bool has(uint32_t slot, const std::string& facet) const {
        auto it = string_to_id_.find(facet);
        if (it == string_to_id_.end()) return false;
        return roaring_bitmap_contains(postings_[it->second].get(), slot);
    }

    uint64_t count(const std::string& facet) const {
        auto it = string_to_id_.find(facet);
        if (it == string_to_id_.end()) return 0;
        return roaring_bitmap_get_cardinality(postings_[it->second].get());
    }

    uint64_t live_count() const { return roaring_bitmap_get_cardinality(live_.get()); }

    // Slots passing the bitmap part of a filter
    Bitmap candidates(const RecordFilter& filter) const {
        Bitmap result(roaring_bitmap_copy(live_.get()));

        if (!filter.kinds.empty()) {
            Bitmap any = make_bitmap();
            for (EventKind k : filter.kinds) {
                if (const roaring_bitmap_t* bm = posting(kind_facet(k))) {
                    roaring_bitmap_or_inplace(any.get(), bm);
                }
            }
            roaring_bitmap_and_inplace(result.get(), any.get());
        }

        if (!filter.agent_id.empty()) {
            intersect(result, agent_facet(filter.agent_id));
        }
        if (!filter.symbol.empty()) {
            intersect(result, symbol_facet(filter.symbol));
        }

        for (OutcomeLabel o : filter.exclude_outcomes) {
            if (const roaring_bitmap_t* bm = posting(outcome_facet(o))) {
                roaring_bitmap_andnot_inplace(result.get(), bm);
            }
        }
        return result;
    }

    void clear() {
        string_to_id_.clear();
        id_to_string_.clear();
        postings_.clear();
        forward_.clear();
        live_ = make_bitmap();
    }

private:
    const roaring_bitmap_t* posting(const std::string& facet) const {
        auto it = string_to_id_.find(facet);
        if (it == string_to_id_.end()) return nullptr;
        return postings_[it->second].get();
    }

    void intersect(Bitmap& result, const std::string& facet) const {
        if (const roaring_bitmap_t* bm = posting(facet)) {
            roaring_bitmap_and_inplace(result.get(), bm);
        } else {
            roaring_bitmap_clear(result.get());
        }
    }

    std::unordered_map<std::string, uint32_t> string_to_id_;
    std::vector<std::string> id_to_string_;
    std::vector<Bitmap> postings_;
    std::vector<std::vector<uint32_t>> forward_;
    Bitmap live_;
};

} // namespace sabha
