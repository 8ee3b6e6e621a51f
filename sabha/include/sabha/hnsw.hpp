#pragma once
// HNSW (Hierarchical Navigable Small World) index for fast semantic search
//
// Keys are dense store slots. Vectors are kept as unit-length floats so
// distance is 1 - dot product. The index is rebuilt from the vector log
// at open; it is never persisted on its own.

#include "types.hpp"
#include <algorithm>
#include <memory>
#include <queue>
#include <random>
#include <unordered_map>
#include <unordered_set>

namespace sabha {

// HNSW configuration
struct HNSWConfig {
    size_t M = 16;                 // Max connections per node per layer
    size_t ef_construction = 200;  // Search width during construction
    size_t ef_search = 64;         // Search width during query
    size_t max_layers = 6;         // Maximum number of layers
    uint32_t seed = 42;            // Level generator seed
};

// HNSW node with connections
struct HNSWNode {
    uint32_t slot;
    std::vector<float> vector;
    std::vector<std::vector<uint32_t>> connections;  // connections[layer] = neighbors

    HNSWNode(uint32_t s, std::vector<float> v, size_t layers)
        : slot(s), vector(std::move(v)), connections(layers) {}
};

// Distance pair for priority queues
struct DistPair {
    float distance;
    uint32_t slot;

    DistPair() : distance(0.0f), slot(0) {}
    DistPair(float d, uint32_t s) : distance(d), slot(s) {}

    bool operator<(const DistPair& o) const { return distance < o.distance; }
    bool operator>(const DistPair& o) const { return distance > o.distance; }
};

class HNSWIndex {
public:
    explicit HNSWIndex(HNSWConfig config = {})
        : config_(config), rng_(config.seed) {}

    void insert(uint32_t slot, std::vector<float> vector) {
        normalize(vector);
        size_t level = random_level();

        auto node = std::make_shared<HNSWNode>(slot, std::move(vector), level + 1);
        nodes_[slot] = node;
        const auto& v = node->vector;

        if (nodes_.size() == 1) {
            entry_point_ = slot;
            max_level_ = level;
            return;
        }

        // Find entry point and descend
        uint32_t curr = entry_point_;
        for (int l = static_cast<int>(max_level_); l > static_cast<int>(level); --l) {
            curr = search_layer_greedy(v, curr, l);
        }

        for (int l = static_cast<int>(std::min(level, max_level_)); l >= 0; --l) {
            auto neighbors = search_layer(v, curr, config_.ef_construction, l);
            select_neighbors(node, neighbors, l);
            curr = neighbors.empty() ? curr : neighbors[0].slot;
        }

        if (level > max_level_) {
            entry_point_ = slot;
            max_level_ = level;
        }
    }

    // k nearest neighbours as (slot, distance), nearest first
    std::vector<std::pair<uint32_t, float>> search(
        const std::vector<float>& query, size_t k) const
    {
        if (nodes_.empty() || k == 0) return {};

        std::vector<float> q = query;
        normalize(q);

        uint32_t curr = entry_point_;
        for (int l = static_cast<int>(max_level_); l > 0; --l) {
            curr = search_layer_greedy(q, curr, l);
        }

        auto candidates = search_layer(q, curr, std::max(config_.ef_search, k), 0);

        std::vector<std::pair<uint32_t, float>> results;
        for (size_t i = 0; i < std::min(k, candidates.size()); ++i) {
            results.emplace_back(candidates[i].slot, candidates[i].distance);
        }
        return results;
    }

    void remove(uint32_t slot) {
        auto it = nodes_.find(slot);
        if (it == nodes_.end()) return;

        auto& node = it->second;
        for (size_t l = 0; l < node->connections.size(); ++l) {
            for (uint32_t neighbor : node->connections[l]) {
                auto nit = nodes_.find(neighbor);
                if (nit == nodes_.end()) continue;
                if (l >= nit->second->connections.size()) continue;
                auto& conns = nit->second->connections[l];
                conns.erase(std::remove(conns.begin(), conns.end(), slot), conns.end());
            }
        }

        nodes_.erase(it);

        // New entry point: the tallest survivor
        if (slot == entry_point_ && !nodes_.empty()) {
            max_level_ = 0;
            entry_point_ = nodes_.begin()->first;
            for (const auto& [s, n] : nodes_) {
                if (n->connections.size() - 1 > max_level_) {
                    max_level_ = n->connections.size() - 1;
                    entry_point_ = s;
                }
            }
        }
        if (nodes_.empty()) max_level_ = 0;
    }

    // Exact distance to a stored slot, used by filtered exact scans
    std::optional<float> distance_to(const std::vector<float>& query, uint32_t slot) const {
        auto it = nodes_.find(slot);
        if (it == nodes_.end()) return std::nullopt;
        std::vector<float> q = query;
        normalize(q);
        return distance(q, it->second->vector);
    }

    void clear() {
        nodes_.clear();
        max_level_ = 0;
        entry_point_ = 0;
    }

    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }
    bool contains(uint32_t slot) const { return nodes_.count(slot) > 0; }

private:
    size_t random_level() {
        std::uniform_real_distribution<float> dist(0.0f, 1.0f);
        float r = dist(rng_);
        size_t level = 0;
        float p = 1.0f / config_.M;
        while (r < p && level < config_.max_layers - 1) {
            level++;
            r = dist(rng_);
        }
        return level;
    }

    static float distance(const std::vector<float>& a, const std::vector<float>& b) {
        float dot = 0.0f;
        size_t n = std::min(a.size(), b.size());
        for (size_t i = 0; i < n; ++i) dot += a[i] * b[i];
        return 1.0f - dot;
    }

    uint32_t search_layer_greedy(const std::vector<float>& query, uint32_t start, size_t layer) const {
        uint32_t curr = start;
        auto curr_it = nodes_.find(curr);
        if (curr_it == nodes_.end()) return curr;
        float curr_dist = distance(query, curr_it->second->vector);

        bool changed = true;
        while (changed) {
            changed = false;
            auto node_it = nodes_.find(curr);
            if (node_it == nodes_.end()) break;
            const auto& node = node_it->second;
            if (layer >= node->connections.size()) break;
            for (uint32_t neighbor : node->connections[layer]) {
                auto neighbor_it = nodes_.find(neighbor);
                if (neighbor_it == nodes_.end()) continue;
                float d = distance(query, neighbor_it->second->vector);
                if (d < curr_dist) {
                    curr = neighbor;
                    curr_dist = d;
                    changed = true;
                }
            }
        }
        return curr;
    }

    std::vector<DistPair> search_layer(
        const std::vector<float>& query, uint32_t start, size_t ef, size_t layer) const
    {
        std::unordered_set<uint32_t> visited;
        std::priority_queue<DistPair, std::vector<DistPair>, std::greater<DistPair>> candidates;
        std::priority_queue<DistPair> results;

        auto start_it = nodes_.find(start);
        if (start_it == nodes_.end()) return {};
        float start_dist = distance(query, start_it->second->vector);
        candidates.push(DistPair(start_dist, start));
        results.push(DistPair(start_dist, start));
        visited.insert(start);

        while (!candidates.empty()) {
            DistPair curr_pair = candidates.top();
            candidates.pop();

            if (curr_pair.distance > results.top().distance && results.size() >= ef) break;

            auto node_it = nodes_.find(curr_pair.slot);
            if (node_it == nodes_.end()) continue;
            const auto& node = node_it->second;
            if (layer >= node->connections.size()) continue;

            for (uint32_t neighbor : node->connections[layer]) {
                if (!visited.insert(neighbor).second) continue;

                auto neighbor_it = nodes_.find(neighbor);
                if (neighbor_it == nodes_.end()) continue;
                float n_dist = distance(query, neighbor_it->second->vector);
                if (results.size() < ef || n_dist < results.top().distance) {
                    candidates.push(DistPair(n_dist, neighbor));
                    results.push(DistPair(n_dist, neighbor));
                    if (results.size() > ef) results.pop();
                }
            }
        }

        std::vector<DistPair> result_vec;
        while (!results.empty()) {
            result_vec.push_back(results.top());
            results.pop();
        }
        std::reverse(result_vec.begin(), result_vec.end());
        return result_vec;
    }

    void select_neighbors(std::shared_ptr<HNSWNode>& node,
                          const std::vector<DistPair>& candidates, size_t layer)
    {
        size_t M = (layer == 0) ? config_.M * 2 : config_.M;

        for (size_t i = 0; i < std::min(M, candidates.size()); ++i) {
            uint32_t neighbor_slot = candidates[i].slot;
            if (neighbor_slot == node->slot) continue;
            node->connections[layer].push_back(neighbor_slot);

            auto& neighbor = nodes_[neighbor_slot];
            if (layer < neighbor->connections.size() &&
                neighbor->connections[layer].size() < M) {
                neighbor->connections[layer].push_back(node->slot);
            }
        }
    }

    HNSWConfig config_;
    std::unordered_map<uint32_t, std::shared_ptr<HNSWNode>> nodes_;
    uint32_t entry_point_ = 0;
    size_t max_level_ = 0;
    std::mt19937 rng_;
};

} // namespace sabha
