#pragma once
// Similarity source: anything that answers nearest-neighbour queries

#include "filter_index.hpp"
#include "types.hpp"
#include <vector>

namespace sabha {

struct Neighbor {
    RecordId id;
    float distance = 0.0f;   // 1 - cosine similarity
};

class SimilaritySource {
public:
    virtual ~SimilaritySource() = default;

    // Nearest first. An empty source yields an empty list.
    virtual std::vector<Neighbor> search(const std::vector<float>& vector, size_t k,
                                         const RecordFilter& filter) const = 0;
};

} // namespace sabha
